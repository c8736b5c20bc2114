/**
 * @file WhisperCppTranscriber.hpp
 * @brief IncrementalTranscriber backed by whisper.cpp.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "domain/ContentFetcher.hpp"
#include "domain/IncrementalTranscriber.hpp"
#include "infrastructure/ConfigLoader.hpp"

// Forward declaration to keep whisper.h out of the header.
struct whisper_context;

namespace podscribe::infrastructure {

/**
 * @brief Loaded whisper model. Inference on one context must be serialized through mutex.
 */
struct WhisperModel {
    whisper_context* ctx = nullptr;
    std::mutex mutex;

    WhisperModel() = default;
    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;
    ~WhisperModel();
};

class WhisperCppTranscriber : public domain::IncrementalTranscriber {
public:
    /**
     * @param config Model location, download URL, window length and thread count.
     * @param fetcher Used to download the model when it is missing.
     */
    WhisperCppTranscriber(WhisperConfig config, std::shared_ptr<domain::ContentFetcher> fetcher);

    bool isAvailable() const override;
    std::optional<std::string> supportedLocale(const std::string& requested) const override;
    std::vector<std::string> installedLocales() const override;
    bool needsAssetInstall(const std::string& locale) const override;
    void installAssets(const std::string& locale, InstallProgressCallback onProgress) override;
    std::unique_ptr<domain::RecognitionSession> openSession(const std::string& audioPath,
                                                            const std::string& locale,
                                                            ProgressCallback onProgress) override;

    /** @brief "pt_BR.UTF-8" -> "pt-BR". */
    static std::string NormalizeLocale(const std::string& locale);

    /** @brief "pt-BR" -> "pt". */
    static std::string LanguageCode(const std::string& locale);

private:
    WhisperConfig m_config;
    std::shared_ptr<domain::ContentFetcher> m_fetcher;

    std::mutex m_loadMutex;
    std::atomic<unsigned> m_installCounter{0};
    std::shared_ptr<WhisperModel> m_model;

    bool isEnglishOnlyModel() const;
    std::shared_ptr<WhisperModel> loadModel();
};

} // namespace podscribe::infrastructure
