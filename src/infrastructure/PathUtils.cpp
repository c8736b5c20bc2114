#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace podscribe::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path FromEnv(const char* xdgVar, const char* homeSuffix) {
    const char* xdg = std::getenv(xdgVar);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeSuffix;
    }
    return fs::current_path(); // Fallback
}

fs::path EnsureDir(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[PathUtils] Could not create " << dir << ": " << ec.message() << std::endl;
        }
    }
    return dir;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return FromEnv("XDG_DATA_HOME", ".local/share");
}

fs::path PathUtils::GetConfigHome() {
    return FromEnv("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetModelsDir() {
    return EnsureDir(GetDataHome() / "Podscribe" / "models");
}

fs::path PathUtils::GetTranscriptsFile() {
    return EnsureDir(GetDataHome() / "Podscribe") / "transcripts.json";
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / "Podscribe" / "settings.json";
}

} // namespace podscribe::infrastructure
