/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to access configuration like the data directory or
 * the default pomodoro length without scattering JSON parsing logic
 * throughout the codebase.
 */

#pragma once

#include <chrono>
#include <filesystem>

namespace deskpal::infrastructure {

/**
 * @struct AppConfig
 * @brief Settings read from settings.json, with their defaults.
 */
struct AppConfig {
    std::filesystem::path dataDir;                       ///< "data_dir"; defaults to PathUtils::GetAppDataDir().
    std::chrono::minutes defaultTimerDuration{25};       ///< "default_timer_minutes", 1 to 1440.
    std::chrono::seconds pollInterval{1};                ///< "poll_interval_seconds", 1 to 3600.
};

class ConfigLoader {
public:
    /** @brief Settings used when no file (or no valid value) is present. */
    static AppConfig Defaults();

    /**
     * @brief Reads settings from the given file.
     *
     * A missing file yields Defaults(). A malformed file or an out-of-range
     * value is reported on stderr and replaced by its default.
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /** @brief Load() from PathUtils::GetSettingsPath(). */
    static AppConfig LoadDefault();

    /**
     * @brief Saves the settings, preserving other keys if possible.
     * @throws domain::StorageError if the file cannot be written.
     */
    static void Save(const std::filesystem::path& configPath, const AppConfig& config);
};

} // namespace deskpal::infrastructure
