/*
 * Configuration Manager
 * key = value configuration shared by aggregation and privacy settings
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <map>

namespace fedcore {
namespace utils {

class ConfigManager {
public:
    static ConfigManager& getInstance() {
        static ConfigManager instance;
        return instance;
    }

    // Load configuration from file; keys already present are overwritten
    bool loadFromFile(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            std::cerr << "[Config] Failed to open config file: " << filepath << std::endl;
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        loadFromString(buffer.str());
        return true;
    }

    void loadFromString(const std::string& contents) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::istringstream stream(contents);
        std::string line;
        while (std::getline(stream, line)) {
            size_t comment_pos = line.find('#');
            if (comment_pos != std::string::npos) {
                line = line.substr(0, comment_pos);
            }

            trim(line);
            if (line.empty()) continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                std::cerr << "[Config] Ignoring malformed line: " << line << std::endl;
                continue;
            }

            std::string key = line.substr(0, equals_pos);
            std::string value = line.substr(equals_pos + 1);
            trim(key);
            trim(value);
            config_[key] = value;
        }
    }

    bool hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.find(key) != config_.end();
    }

    std::string getString(const std::string& key, const std::string& default_value = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : default_value;
    }

    int getInt(const std::string& key, int default_value = 0) const {
        std::string str_value = getString(key);
        if (str_value.empty()) return default_value;

        try {
            return std::stoi(str_value);
        } catch (const std::exception&) {
            warnInvalid(key, str_value);
            return default_value;
        }
    }

    uint64_t getUInt64(const std::string& key, uint64_t default_value = 0) const {
        std::string str_value = getString(key);
        if (str_value.empty()) return default_value;

        try {
            return std::stoull(str_value);
        } catch (const std::exception&) {
            warnInvalid(key, str_value);
            return default_value;
        }
    }

    double getDouble(const std::string& key, double default_value = 0.0) const {
        std::string str_value = getString(key);
        if (str_value.empty()) return default_value;

        try {
            return std::stod(str_value);
        } catch (const std::exception&) {
            warnInvalid(key, str_value);
            return default_value;
        }
    }

    bool getBool(const std::string& key, bool default_value = false) const {
        std::string str_value = getString(key);
        if (str_value.empty()) return default_value;

        std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return (str_value == "true" || str_value == "1" || str_value == "yes" || str_value == "on");
    }

    void setValue(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.clear();
    }

    bool saveToFile(const std::string& filepath) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ofstream file(filepath);
        if (!file.is_open()) {
            return false;
        }

        file << "# FedCore Configuration File\n";
        file << "# Generated automatically\n\n";

        for (const auto& entry : config_) {
            file << entry.first << " = " << entry.second << "\n";
        }

        return true;
    }

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    static void trim(std::string& s) {
        s.erase(0, s.find_first_not_of(" \t\r"));
        size_t last = s.find_last_not_of(" \t\r");
        if (last == std::string::npos) {
            s.clear();
        } else {
            s.erase(last + 1);
        }
    }

    static void warnInvalid(const std::string& key, const std::string& value) {
        std::cerr << "[Config] Invalid value for " << key << ": '" << value
                  << "', using default" << std::endl;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> config_;
};

} // namespace utils
} // namespace fedcore
