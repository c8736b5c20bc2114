/**
 * @file IncrementalTranscriber.hpp
 * @brief Interface for speech recognition that yields results progressively.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace podscribe::domain {

/**
 * @struct RecognitionResult
 * @brief One speech-delimited result. Backends that only report timing through the
 * processed-range channel leave startOffset empty.
 */
struct RecognitionResult {
    std::string text;
    std::optional<double> startOffset;
};

/**
 * @class RecognitionSession
 * @brief Pull-based sequence of recognition results over one audio file.
 */
class RecognitionSession {
public:
    virtual ~RecognitionSession() = default;

    /** @brief Total audio duration in seconds, known once the session is open. */
    virtual double totalDuration() const = 0;

    /**
     * @brief Blocks until the next result is available.
     * @return The result, or nullopt once the input is exhausted. Throws on recognition failure.
     */
    virtual std::optional<RecognitionResult> next() = 0;
};

/**
 * @class IncrementalTranscriber
 * @brief Abstract speech recognition capability consumed by the transcription pipeline.
 */
class IncrementalTranscriber {
public:
    virtual ~IncrementalTranscriber() = default;

    /** @brief Processed-range channel: seconds of audio consumed so far. */
    using ProgressCallback = std::function<void(double processedSeconds)>;

    /** @brief Fraction of an asset download, 0..1. Returning false aborts the install. */
    using InstallProgressCallback = std::function<bool(double fraction)>;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Maps a requested locale to one the backend supports.
     * @return The supported equivalent, or nullopt.
     */
    virtual std::optional<std::string> supportedLocale(const std::string& requested) const = 0;

    virtual std::vector<std::string> installedLocales() const = 0;

    virtual bool needsAssetInstall(const std::string& locale) const = 0;

    /** @brief Downloads and installs model assets. Throws on failure or abort. */
    virtual void installAssets(const std::string& locale, InstallProgressCallback onProgress) = 0;

    /**
     * @brief Opens an incremental session over a local audio file. Throws on failure.
     * @param audioPath Local file holding the full audio payload.
     * @param locale Locale returned by supportedLocale() or installedLocales().
     * @param onProgress Receives the processed range as recognition advances.
     */
    virtual std::unique_ptr<RecognitionSession> openSession(const std::string& audioPath,
                                                            const std::string& locale,
                                                            ProgressCallback onProgress) = 0;
};

} // namespace podscribe::domain
