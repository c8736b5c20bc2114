/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace podscribe::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

template <typename T>
void ReadKey(const json& section, const char* key, T& out) {
    if (section.contains(key) && !section[key].is_null()) {
        out = section[key].get<T>();
    }
}

void ReadMillis(const json& section, const char* key, std::chrono::milliseconds& out) {
    if (section.contains(key) && section[key].is_number()) {
        out = std::chrono::milliseconds(section[key].get<long long>());
    }
}

} // namespace

AppConfig ConfigLoader::Defaults() {
    AppConfig config;
    config.whisper.modelPath = (PathUtils::GetModelsDir() / "ggml-base.bin").string();
    config.storePath = PathUtils::GetTranscriptsFile().string();
    return config;
}

AppConfig ConfigLoader::Load(const fs::path& settingsPath) {
    AppConfig config = Defaults();
    if (!fs::exists(settingsPath)) {
        return config;
    }

    try {
        std::ifstream f(settingsPath);
        json j;
        f >> j;

        if (j.contains("playback")) {
            const auto& p = j["playback"];
            ReadKey(p, "skip_forward_seconds", config.playback.skipForwardSeconds);
            ReadKey(p, "skip_backward_seconds", config.playback.skipBackwardSeconds);
            ReadMillis(p, "position_interval_ms", config.playback.positionInterval);
            ReadMillis(p, "duration_poll_interval_ms", config.playback.durationPoll.interval);
            ReadMillis(p, "duration_poll_timeout_ms", config.playback.durationPoll.timeout);
        }
        if (j.contains("transcription")) {
            const auto& t = j["transcription"];
            ReadKey(t, "device_locale", config.transcription.deviceLocale);
            ReadKey(t, "fallback_locale", config.transcription.fallbackLocale);
            ReadKey(t, "temp_directory", config.transcription.tempDirectory);
            ReadKey(t, "model_path", config.whisper.modelPath);
            ReadKey(t, "model_url", config.whisper.modelUrl);
            ReadKey(t, "chunk_seconds", config.whisper.chunkSeconds);
            ReadKey(t, "threads", config.whisper.threads);
        }
        if (j.contains("summarizer")) {
            const auto& s = j["summarizer"];
            ReadKey(s, "host", config.summarizer.host);
            ReadKey(s, "port", config.summarizer.port);
            ReadKey(s, "model", config.summarizer.model);
        }
        if (j.contains("store")) {
            ReadKey(j["store"], "path", config.storePath);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
        return Defaults();
    }

    return config;
}

AppConfig ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetSettingsFile());
}

bool ConfigLoader::Save(const fs::path& settingsPath, const AppConfig& config) {
    json j = json::object();

    // Try to load existing to preserve other settings
    if (fs::exists(settingsPath)) {
        try {
            std::ifstream f(settingsPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings unreadable, rewriting: " << e.what() << std::endl;
            j = json::object();
        }
    }

    j["playback"] = {
        {"skip_forward_seconds", config.playback.skipForwardSeconds},
        {"skip_backward_seconds", config.playback.skipBackwardSeconds},
        {"position_interval_ms", config.playback.positionInterval.count()},
        {"duration_poll_interval_ms", config.playback.durationPoll.interval.count()},
        {"duration_poll_timeout_ms", config.playback.durationPoll.timeout.count()}
    };
    j["transcription"] = {
        {"device_locale", config.transcription.deviceLocale},
        {"fallback_locale", config.transcription.fallbackLocale},
        {"temp_directory", config.transcription.tempDirectory},
        {"model_path", config.whisper.modelPath},
        {"model_url", config.whisper.modelUrl},
        {"chunk_seconds", config.whisper.chunkSeconds},
        {"threads", config.whisper.threads}
    };
    j["summarizer"] = {
        {"host", config.summarizer.host},
        {"port", config.summarizer.port},
        {"model", config.summarizer.model}
    };
    j["store"] = {{"path", config.storePath}};

    try {
        if (settingsPath.has_parent_path()) {
            fs::create_directories(settingsPath.parent_path());
        }
        std::ofstream f(settingsPath);
        f << j.dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << settingsPath << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace podscribe::infrastructure
