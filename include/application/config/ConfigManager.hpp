#pragma once

#include "jobcore/gcode/GCodeLineProcessor.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace jobcore::config {
    struct JobConfig {
        int statusIntervalMs = 2000;
        std::string defaultEncoding = "utf-8";
    };

    struct GCodeConfig {
        bool stripComments = true;
        double toolTemperatureOffset = 0.0;
        double bedTemperatureOffset = 0.0;

        gcode::GCodeProcessingOptions toOptions() const {
            return {stripComments, toolTemperatureOffset, bedTemperatureOffset};
        }
    };

    struct LoggingConfig {
        std::string folder = "logs";
        bool fileOutput = false;
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration
        void loadFromFile(const std::string &configPath = "config.json");

        void loadFromEnv();

        void loadFromString(const std::string &json);

        bool reload();

        void reset();

        // Configuration access
        JobConfig getJobConfig() const;

        GCodeConfig getGCodeConfig() const;

        LoggingConfig getLoggingConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        void set(const std::string &key, const std::string &value);

        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        std::string configPath_;

        void setDefaults();

        void parseJson(const std::string &content, const std::string &origin);
    };

    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }

    template<>
    inline double ConfigManager::get<double>(const std::string &key, const double &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stod(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }
} // namespace jobcore::config
