#include "SettingsParser.hpp"

#include "Logger.hpp"

#include <limits>

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool SettingsParser::load(const std::filesystem::path& filePath) {
    m_settings = Settings{};

    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec)) {
        DS_LOG_DEBUG("No settings file at " << filePath.string() << "; using defaults.");
        return !ec;
    }

    std::ifstream settingsFile(filePath);
    if (!settingsFile) {
        DS_LOG_WARN("Failed to open settings file: " << filePath.string());
        return false;
    }

    json data;
    try {
        settingsFile >> data;
    } catch (const json::parse_error& e) {
        DS_LOG_WARN("Failed to parse settings file: " << e.what());
        return false;
    }

    if (!data.is_object()) {
        DS_LOG_WARN("Settings file " << filePath.string() << " must contain a JSON object.");
        return false;
    }

    Settings parsed;
    if (!parseSettings(data, parsed)) {
        return false;
    }

    m_settings = parsed;
    DS_LOG_DEBUG("Loaded settings from " << filePath.string());
    return true;
}

bool SettingsParser::parseSettings(const json& data, Settings& out) {
    try {
        if (auto it = data.find("interval_seconds"); it != data.end()) {
            if (!it->is_number_integer() || it->get<long long>() < 1 ||
                it->get<long long>() > std::numeric_limits<int>::max()) {
                DS_LOG_WARN("`interval_seconds` must be a positive integer no larger than "
                            << std::numeric_limits<int>::max() << ".");
                return false;
            }
            out.intervalSeconds = static_cast<int>(it->get<long long>());
        }

        if (auto it = data.find("worker_threads"); it != data.end()) {
            if (!it->is_number_integer() || it->get<long long>() < 0) {
                DS_LOG_WARN("`worker_threads` must be zero or a positive integer.");
                return false;
            }
            out.workerThreads = it->get<std::size_t>();
        }

        if (auto it = data.find("move_folders_whole"); it != data.end()) {
            if (!it->is_boolean()) {
                DS_LOG_WARN("`move_folders_whole` must be a boolean value.");
                return false;
            }
            out.moveFoldersWhole = it->get<bool>();
        }

        if (auto it = data.find("log_level"); it != data.end()) {
            if (!it->is_string() || !Logger::parseLevel(it->get<std::string>())) {
                DS_LOG_WARN("`log_level` must be one of trace, debug, info, warn or error.");
                return false;
            }
            out.logLevel = it->get<std::string>();
        }

        if (auto it = data.find("log_file"); it != data.end()) {
            if (!it->is_string()) {
                DS_LOG_WARN("`log_file` must be a string.");
                return false;
            }
            out.logFile = it->get<std::string>();
        }
    } catch (const json::exception& e) {
        DS_LOG_WARN("Invalid settings: " << e.what());
        return false;
    }
    return true;
}
