#include "application/config/ConfigManager.hpp"
#include "jobcore/types/Error.hpp"
#include "jobcore/utils/TextDecoder.hpp"
#include "logger/Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <nlohmann/json.hpp>

namespace jobcore::config {
    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            configPath_ = configPath;
        }

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        std::ifstream file(configPath);
        std::stringstream content;
        content << file.rdbuf();
        parseJson(content.str(), configPath);
    }

    void ConfigManager::loadFromString(const std::string &json) {
        parseJson(json, "string");
    }

    void ConfigManager::parseJson(const std::string &content, const std::string &origin) {
        try {
            nlohmann::json json = nlohmann::json::parse(content);
            std::unordered_map<std::string, std::string> parsed;

            // Flatten JSON into dotted key-value pairs
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        parsed[key] = it.value().get<std::string>();
                    } else {
                        parsed[key] = it.value().dump();
                    }
                }
            };
            flatten(json, "");

            std::lock_guard<std::mutex> lock(configMutex_);
            for (auto &[key, value]: parsed) {
                config_[key] = std::move(value);
            }
            Logger::logInfo("[ConfigManager] Loaded " + std::to_string(parsed.size()) + " settings from " + origin);
        } catch (const nlohmann::json::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config from " + origin + ": " + std::string(e.what()));
        }
    }

    void ConfigManager::loadFromEnv() {
        const char *envVars[] = {
            "JOB_STATUS_INTERVAL_MS", "JOB_DEFAULT_ENCODING",
            "GCODE_STRIP_COMMENTS", "GCODE_TOOL_TEMPERATURE_OFFSET", "GCODE_BED_TEMPERATURE_OFFSET",
            "LOGGING_FOLDER", "LOGGING_FILE_OUTPUT"
        };
        const char *keys[] = {
            "job.status.interval.ms", "job.default.encoding",
            "gcode.strip.comments", "gcode.tool.temperature.offset", "gcode.bed.temperature.offset",
            "logging.folder", "logging.file.output"
        };

        std::lock_guard<std::mutex> lock(configMutex_);
        int loaded = 0;
        for (size_t i = 0; i < sizeof(envVars) / sizeof(envVars[0]); ++i) {
            const char *value = std::getenv(envVars[i]);
            if (value) {
                config_[keys[i]] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    bool ConfigManager::reload() {
        std::string path;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            path = configPath_;
        }
        if (path.empty()) return false;

        loadFromFile(path);
        return true;
    }

    void ConfigManager::reset() {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_.clear();
        setDefaults();
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    JobConfig ConfigManager::getJobConfig() const {
        JobConfig config;
        config.statusIntervalMs = get<int>("job.status.interval.ms", 2000);
        config.defaultEncoding = get<std::string>("job.default.encoding", "utf-8");
        return config;
    }

    GCodeConfig ConfigManager::getGCodeConfig() const {
        GCodeConfig config;
        config.stripComments = get<bool>("gcode.strip.comments", true);
        config.toolTemperatureOffset = get<double>("gcode.tool.temperature.offset", 0.0);
        config.bedTemperatureOffset = get<double>("gcode.bed.temperature.offset", 0.0);
        return config;
    }

    LoggingConfig ConfigManager::getLoggingConfig() const {
        LoggingConfig config;
        config.folder = get<std::string>("logging.folder", "logs");
        config.fileOutput = get<bool>("logging.file.output", false);
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        if (get<int>("job.status.interval.ms", -1) < 100) {
            result.errors.push_back("job.status.interval.ms must be >= 100");
        }

        try {
            utils::parseEncoding(get<std::string>("job.default.encoding", ""));
        } catch (const types::UnsupportedEncodingException &e) {
            result.errors.push_back("job.default.encoding: " + std::string(e.what()));
        }

        if (get<std::string>("logging.folder", "").empty()) {
            result.errors.push_back("logging.folder must not be empty");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        config_["job.status.interval.ms"] = "2000";
        config_["job.default.encoding"] = "utf-8";

        config_["gcode.strip.comments"] = "true";
        config_["gcode.tool.temperature.offset"] = "0";
        config_["gcode.bed.temperature.offset"] = "0";

        config_["logging.folder"] = "logs";
        config_["logging.file.output"] = "false";
    }
} // namespace jobcore::config
