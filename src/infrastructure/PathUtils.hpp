// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace podscribe::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetModelsDir();
    static std::filesystem::path GetTranscriptsFile();
    static std::filesystem::path GetSettingsFile();
};

} // namespace podscribe::infrastructure
