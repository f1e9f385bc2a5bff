// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace deskpal::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    /** @brief Default record directory: <data home>/DeskPal. */
    static std::filesystem::path GetAppDataDir();
    /** @brief <config home>/DeskPal/settings.json. */
    static std::filesystem::path GetSettingsPath();
};

} // namespace deskpal::infrastructure
