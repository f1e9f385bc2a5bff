/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/TimerEngine.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace deskpal::infrastructure {

namespace {

// Reads an integer setting in [1, max], keeping the fallback on any problem.
long long ReadPositive(const nlohmann::json& j, const char* key, long long fallback, long long max) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer() || value.get<long long>() <= 0 || value.get<long long>() > max) {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "': " << value.dump() << std::endl;
        return fallback;
    }
    return value.get<long long>();
}

} // namespace

AppConfig ConfigLoader::Defaults() {
    AppConfig config;
    config.dataDir = PathUtils::GetAppDataDir();
    return config;
}

AppConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    AppConfig config = Defaults();
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return config;
    }

    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << configPath << " is not a JSON object; using defaults" << std::endl;
        return config;
    }

    if (j.contains("data_dir")) {
        if (j["data_dir"].is_string() && !j["data_dir"].get<std::string>().empty()) {
            config.dataDir = j["data_dir"].get<std::string>();
        } else {
            std::cerr << "[ConfigLoader] Ignoring invalid 'data_dir': " << j["data_dir"].dump() << std::endl;
        }
    }

    config.defaultTimerDuration = std::chrono::minutes(
        ReadPositive(j, "default_timer_minutes", config.defaultTimerDuration.count(),
                     std::chrono::duration_cast<std::chrono::minutes>(domain::kMaxTimerDuration).count()));
    config.pollInterval = std::chrono::seconds(
        ReadPositive(j, "poll_interval_seconds", config.pollInterval.count(), 3600));

    return config;
}

AppConfig ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetSettingsPath());
}

void ConfigLoader::Save(const std::filesystem::path& configPath, const AppConfig& config) {
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json existing;
            f >> existing;
            if (existing.is_object()) {
                j = existing;
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
        }
    }

    j["data_dir"] = config.dataDir.string();
    j["default_timer_minutes"] = config.defaultTimerDuration.count();
    j["poll_interval_seconds"] = config.pollInterval.count();

    PersistenceService::WriteAtomically(configPath, j.dump(4));
}

} // namespace deskpal::infrastructure
