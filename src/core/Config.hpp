#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include "Logger.hpp"
#include "../utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace botarr::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Manages application settings with:
 * - Type-safe getters with defaults
 * - JSON persistence
 * - Dot-path keys ("downloads.maxRetries")
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file, merged over the current values
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                Logger::instance().warn("Config file {} is not a JSON object", path);
                return false;
            }
            m_config.merge_patch(loaded);
            m_configPath = path;
            return true;

        } catch (const json::exception& e) {
            Logger::instance().error("Failed to parse config {}: {}", path, e.what());
            return false;
        } catch (const std::filesystem::filesystem_error& e) {
            Logger::instance().error("Failed to read config {}: {}", path, e.what());
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            m_configPath = savePath;
            return true;

        } catch (const std::exception& e) {
            Logger::instance().error("Failed to save config {}: {}", savePath, e.what());
            return false;
        }
    }

    /**
     * Set default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"connection", {
                {"useSsl", true},
                {"connectTimeout", 15},
                {"generalTimeout", 120},
                {"proxyEnabled", false},
                {"proxyUrl", ""}
            }},
            {"identity", {
                {"nickname", "botarr" + utils::StringUtils::randomNumber(10000)},
                {"username", "botarr"},
                {"realname", "Botarr XDCC Client"}
            }},
            {"downloads", {
                {"directory", "downloads"},
                {"maxConcurrent", 4},
                {"maxRetries", 3},
                {"retryDelay", 5},
                {"resumeEnabled", true}
            }},
            {"networks", {
                {"SceneP2P", {
                    {"host", "irc.scenep2p.net"},
                    {"port", 6697},
                    {"ssl", true},
                    {"autojoinChannels", json::array()},
                    {"joinDelay", 6}
                }},
                {"Rizon", {
                    {"host", "irc.rizon.net"},
                    {"port", 6667},
                    {"ssl", false},
                    {"autojoinChannels", json::array()},
                    {"joinDelay", 6}
                }},
                {"Abjects", {
                    {"host", "irc.abjects.net"},
                    {"port", 6667},
                    {"ssl", false},
                    {"autojoinChannels", json::array()},
                    {"joinDelay", 6}
                }}
            }},
            {"postprocess", {
                {"moveCompleted", false},
                {"moveCompletedDir", ""},
                {"scriptEnabled", false},
                {"script", ""},
                {"scriptTimeout", 300}
            }},
            {"logging", {
                {"level", "info"}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.maxRetries")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception& e) {
            Logger::instance().warn("Config key {} has an unexpected type: {}", key, e.what());
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "downloads.directory")
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            m_config[ptr] = value;
        } catch (const json::exception& e) {
            Logger::instance().error("Cannot set config key {}: {}", key, e.what());
        }
    }

    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            return m_config.contains(toJsonPointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Get entire configuration as JSON
     * @return JSON configuration object
     */
    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    /**
     * Merge configuration values
     * @param other JSON object to merge
     */
    void merge(const json& other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(other);
    }

    std::string path() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_configPath;
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace botarr::core
