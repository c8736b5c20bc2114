/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Every key is optional; anything missing keeps its default.
 */

#pragma once

#include <filesystem>
#include <string>

#include "application/PlaybackEngine.hpp"
#include "application/TranscriptionPipeline.hpp"

namespace podscribe::infrastructure {

struct WhisperConfig {
    std::string modelPath;   ///< ggml model file. Empty means models dir / ggml-base.bin.
    std::string modelUrl = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.bin";
    double chunkSeconds = 30.0;
    int threads = 0;         ///< 0 means hardware concurrency.
};

struct SummarizerConfig {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "llama3.2";
};

struct AppConfig {
    application::PlaybackConfig playback;
    application::TranscriptionConfig transcription;
    WhisperConfig whisper;
    SummarizerConfig summarizer;
    std::string storePath;   ///< Empty means data home / transcripts.json.
};

class ConfigLoader {
public:
    /** @brief Defaults with every path resolved against the XDG directories. */
    static AppConfig Defaults();

    /**
     * @brief Reads settings.json on top of the defaults.
     * @param settingsPath File to read. A missing or malformed file yields the defaults.
     */
    static AppConfig Load(const std::filesystem::path& settingsPath);

    /** @brief Load() from PathUtils::GetSettingsFile(). */
    static AppConfig LoadDefault();

    /**
     * @brief Writes the configuration, preserving unrelated keys already in the file.
     * @return False on I/O failure.
     */
    static bool Save(const std::filesystem::path& settingsPath, const AppConfig& config);
};

} // namespace podscribe::infrastructure
