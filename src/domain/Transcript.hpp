/**
 * @file Transcript.hpp
 * @brief Transcript segments, transcription runs and persisted transcript records.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "domain/Errors.hpp"

namespace podscribe::domain {

/**
 * @struct TranscriptSegment
 * @brief One speech-delimited piece of recognized text. Immutable once emitted.
 */
struct TranscriptSegment {
    std::string text;
    double startOffset = 0.0; ///< Seconds from the start of the audio.
    int ordinal = 0;

    /** @brief Start offset rendered as M:SS (or H:MM:SS). */
    std::string formattedTime() const;

    bool operator==(const TranscriptSegment& other) const {
        return text == other.text && startOffset == other.startOffset && ordinal == other.ordinal;
    }
};

enum class RunStatus {
    Preparing,
    Downloading,
    InstallingModel,
    Transcribing,
    Done,
    Failed
};

inline const char* RunStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::Preparing: return "Preparing";
        case RunStatus::Downloading: return "Downloading";
        case RunStatus::InstallingModel: return "InstallingModel";
        case RunStatus::Transcribing: return "Transcribing";
        case RunStatus::Done: return "Done";
        case RunStatus::Failed: return "Failed";
    }
    return "Unknown";
}

struct RunError {
    ErrorKind kind;
    std::string reason;
};

/**
 * @struct TranscriptionRun
 * @brief Observable state of one pipeline invocation.
 *
 * fractionComplete never decreases within a run and is exactly 1.0 once status is Done.
 * On failure the accumulated text and segments are kept.
 */
struct TranscriptionRun {
    int runId = 0;
    std::string mediaLocator;
    RunStatus status = RunStatus::Preparing;
    double fractionComplete = 0.0;
    std::string statusText;
    std::string text;
    std::vector<TranscriptSegment> segments;
    std::string locale;
    std::optional<RunError> error;

    bool isTerminal() const { return status == RunStatus::Done || status == RunStatus::Failed; }
};

/**
 * @struct TranscriptRecord
 * @brief Persisted transcript state, one per media locator.
 */
struct TranscriptRecord {
    std::string mediaLocator;
    std::string transcript;
    std::optional<std::string> summary;
    std::optional<std::vector<TranscriptSegment>> segments;
    std::chrono::system_clock::time_point savedAt;
};

} // namespace podscribe::domain
