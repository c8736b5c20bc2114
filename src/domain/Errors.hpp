/**
 * @file Errors.hpp
 * @brief Error taxonomy shared by the playback, transcription and persistence layers.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace podscribe::domain {

enum class ErrorKind {
    MediaUnavailable,
    DownloadFailed,
    LocaleUnsupported,
    AssetInstallFailed,
    RecognitionFailed,
    PersistenceFailure,
    EmptySummaryResponse
};

inline const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MediaUnavailable: return "MediaUnavailable";
        case ErrorKind::DownloadFailed: return "DownloadFailed";
        case ErrorKind::LocaleUnsupported: return "LocaleUnsupported";
        case ErrorKind::AssetInstallFailed: return "AssetInstallFailed";
        case ErrorKind::RecognitionFailed: return "RecognitionFailed";
        case ErrorKind::PersistenceFailure: return "PersistenceFailure";
        case ErrorKind::EmptySummaryResponse: return "EmptySummaryResponse";
    }
    return "Unknown";
}

/**
 * @class CoreError
 * @brief Exception raised by adapters; carries the taxonomy kind next to a readable message.
 */
class CoreError : public std::runtime_error {
public:
    CoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace podscribe::domain
