/**
 * @file WhisperCppTranscriber.cpp
 * @brief Implementation of WhisperCppTranscriber and its windowed recognition session.
 */

#include "infrastructure/WhisperCppTranscriber.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "domain/Errors.hpp"
#include "whisper.h"

#include <algorithm>
#include <cctype>
#include <deque>
#include <filesystem>
#include <iostream>
#include <thread>

namespace podscribe::infrastructure {

namespace fs = std::filesystem;
using domain::CoreError;
using domain::ErrorKind;
using domain::RecognitionResult;

WhisperModel::~WhisperModel() {
    if (ctx) {
        whisper_free(ctx);
    }
}

namespace {

std::string Trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

/**
 * Runs whisper over consecutive fixed windows of the decoded audio. Each window's
 * segments are queued with absolute start times; the processed range is reported
 * once the window is done.
 */
class WhisperSession : public domain::RecognitionSession {
public:
    WhisperSession(std::shared_ptr<WhisperModel> model,
                   std::vector<float> pcm,
                   std::string language,
                   double chunkSeconds,
                   int threads,
                   domain::IncrementalTranscriber::ProgressCallback onProgress)
        : m_model(std::move(model))
        , m_pcm(std::move(pcm))
        , m_language(std::move(language))
        , m_windowSamples(static_cast<size_t>(std::max(1.0, chunkSeconds) * AudioUtils::kTargetSampleRate))
        , m_threads(threads > 0 ? threads : static_cast<int>(std::max(1u, std::thread::hardware_concurrency())))
        , m_onProgress(std::move(onProgress)) {}

    double totalDuration() const override {
        return static_cast<double>(m_pcm.size()) / AudioUtils::kTargetSampleRate;
    }

    std::optional<RecognitionResult> next() override {
        while (m_pending.empty() && m_cursor < m_pcm.size()) {
            recognizeWindow();
        }
        if (m_pending.empty()) {
            return std::nullopt;
        }
        RecognitionResult result = std::move(m_pending.front());
        m_pending.pop_front();
        return result;
    }

private:
    void recognizeWindow() {
        const size_t count = std::min(m_windowSamples, m_pcm.size() - m_cursor);
        const double windowStart = static_cast<double>(m_cursor) / AudioUtils::kTargetSampleRate;

        whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        wparams.print_progress = false;
        wparams.print_special = false;
        wparams.print_realtime = false;
        wparams.print_timestamps = false;
        wparams.language = m_language.c_str();
        wparams.n_threads = m_threads;

        {
            std::lock_guard<std::mutex> lock(m_model->mutex);
            if (whisper_full(m_model->ctx, wparams, m_pcm.data() + m_cursor, static_cast<int>(count)) != 0) {
                throw CoreError(ErrorKind::RecognitionFailed,
                                "Whisper inference failed at " + std::to_string(windowStart) + "s");
            }

            const int nSegments = whisper_full_n_segments(m_model->ctx);
            for (int i = 0; i < nSegments; ++i) {
                std::string text = Trim(whisper_full_get_segment_text(m_model->ctx, i));
                if (text.empty()) continue;
                // t0 is in 10 ms units, relative to the window
                const double start = windowStart + whisper_full_get_segment_t0(m_model->ctx, i) * 0.01;
                m_pending.push_back({text, start});
            }
        }

        m_cursor += count;
        if (m_onProgress) {
            m_onProgress(static_cast<double>(m_cursor) / AudioUtils::kTargetSampleRate);
        }
    }

    std::shared_ptr<WhisperModel> m_model;
    std::vector<float> m_pcm;
    std::string m_language;
    size_t m_windowSamples;
    int m_threads;
    domain::IncrementalTranscriber::ProgressCallback m_onProgress;

    size_t m_cursor = 0;
    std::deque<RecognitionResult> m_pending;
};

} // namespace

WhisperCppTranscriber::WhisperCppTranscriber(WhisperConfig config, std::shared_ptr<domain::ContentFetcher> fetcher)
    : m_config(std::move(config))
    , m_fetcher(std::move(fetcher))
{
    // Model is loaded on first session.
}

std::string WhisperCppTranscriber::NormalizeLocale(const std::string& locale) {
    std::string result = locale.substr(0, locale.find_first_of(".@"));
    std::replace(result.begin(), result.end(), '_', '-');
    return Trim(result);
}

std::string WhisperCppTranscriber::LanguageCode(const std::string& locale) {
    std::string code = NormalizeLocale(locale);
    code = code.substr(0, code.find('-'));
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return code;
}

bool WhisperCppTranscriber::isEnglishOnlyModel() const {
    const std::string name = fs::path(m_config.modelPath).filename().string();
    const std::string suffix = ".en.bin";
    return name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool WhisperCppTranscriber::isAvailable() const {
    return !m_config.modelPath.empty();
}

std::optional<std::string> WhisperCppTranscriber::supportedLocale(const std::string& requested) const {
    const std::string code = LanguageCode(requested);
    if (code.empty()) {
        return std::nullopt;
    }
    if (isEnglishOnlyModel()) {
        if (code != "en") return std::nullopt;
    } else if (whisper_lang_id(code.c_str()) < 0) {
        return std::nullopt;
    }
    return NormalizeLocale(requested);
}

std::vector<std::string> WhisperCppTranscriber::installedLocales() const {
    if (!fs::exists(m_config.modelPath)) {
        return {};
    }
    if (isEnglishOnlyModel()) {
        return {"en"};
    }
    std::vector<std::string> locales;
    for (int id = 0; id <= whisper_lang_max_id(); ++id) {
        locales.emplace_back(whisper_lang_str(id));
    }
    return locales;
}

bool WhisperCppTranscriber::needsAssetInstall(const std::string& /*locale*/) const {
    // One model file serves every language it knows.
    return !fs::exists(m_config.modelPath);
}

void WhisperCppTranscriber::installAssets(const std::string& locale, InstallProgressCallback onProgress) {
    if (!m_fetcher) {
        throw CoreError(ErrorKind::AssetInstallFailed, "No downloader configured for model assets");
    }
    if (m_config.modelUrl.empty()) {
        throw CoreError(ErrorKind::AssetInstallFailed, "No model URL configured for " + locale);
    }

    const fs::path target(m_config.modelPath);
    // Each install writes its own partial file; only a complete download is renamed into place.
    fs::path partial = target;
    partial += "." + std::to_string(++m_installCounter) + ".part";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    std::cout << "[WhisperCppTranscriber] Downloading model " << m_config.modelUrl << " -> " << target << std::endl;
    try {
        m_fetcher->fetchToFile(m_config.modelUrl, partial.string(),
            [&onProgress](std::uint64_t received, std::uint64_t total) {
                if (!onProgress) return true;
                const double fraction = total > 0
                    ? std::min(1.0, static_cast<double>(received) / static_cast<double>(total))
                    : 0.0;
                return onProgress(fraction);
            });
        fs::rename(partial, target);
    } catch (const std::exception& e) {
        fs::remove(partial, ec);
        throw CoreError(ErrorKind::AssetInstallFailed, std::string("Model download failed: ") + e.what());
    }
}

std::shared_ptr<WhisperModel> WhisperCppTranscriber::loadModel() {
    std::lock_guard<std::mutex> lock(m_loadMutex);
    if (m_model) return m_model;

    if (!fs::exists(m_config.modelPath)) {
        throw CoreError(ErrorKind::RecognitionFailed,
                        "Model file not found at " + m_config.modelPath + ". Download a ggml model (e.g. ggml-base.bin).");
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    auto model = std::make_shared<WhisperModel>();
    model->ctx = whisper_init_from_file_with_params(m_config.modelPath.c_str(), cparams);
    if (!model->ctx) {
        throw CoreError(ErrorKind::RecognitionFailed, "Failed to initialize whisper context from " + m_config.modelPath);
    }

    std::cout << "[WhisperCppTranscriber] Loaded model " << m_config.modelPath << std::endl;
    m_model = model;
    return m_model;
}

std::unique_ptr<domain::RecognitionSession> WhisperCppTranscriber::openSession(const std::string& audioPath,
                                                                               const std::string& locale,
                                                                               ProgressCallback onProgress) {
    auto model = loadModel();

    std::vector<float> pcm;
    std::string error;
    if (!AudioUtils::LoadPcm(audioPath, pcm, error)) {
        throw CoreError(ErrorKind::RecognitionFailed, "Audio load failed: " + error);
    }

    std::string language = LanguageCode(locale);
    if (language.empty()) language = "auto";

    return std::make_unique<WhisperSession>(std::move(model), std::move(pcm), language,
                                            m_config.chunkSeconds, m_config.threads, std::move(onProgress));
}

} // namespace podscribe::infrastructure
