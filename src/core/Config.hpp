#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace downpour::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Keys are addressed with dot notation ("downloads.maxConcurrent").
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
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!std::filesystem::exists(path)) {
            return false;
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::instance().warn("Cannot open config file {}", path);
            return false;
        }

        try {
            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                Logger::instance().warn("Ignoring config {}: top level is not an object", path);
                return false;
            }
            m_config = defaults();
            m_config.merge_patch(loaded);
            m_configPath = path;
            return true;
        } catch (const json::exception& e) {
            Logger::instance().warn("Ignoring malformed config {}: {}", path, e.what());
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

        std::error_code ec;
        auto parent = std::filesystem::path(savePath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                Logger::instance().warn("Cannot create {}: {}", parent.string(), ec.message());
                return false;
            }
        }

        std::ofstream file(savePath);
        if (!file.is_open()) {
            Logger::instance().warn("Cannot write config file {}", savePath);
            return false;
        }

        file << m_config.dump(4);
        m_configPath = savePath;
        return static_cast<bool>(file);
    }

    /**
     * Reset to default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.maxConcurrent")
     * @param defaultValue Default value if key not found or has another type
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
            Logger::instance().debug("Config key {} unusable: {}", key, e.what());
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            m_config[toJsonPointer(key)] = value;
        } catch (const json::exception& e) {
            Logger::instance().warn("Cannot set config key {}: {}", key, e.what());
        }
    }

    /**
     * Check if key exists
     * @param key Key path
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
     * Merge configuration values (RFC 7386 merge patch)
     * @param other JSON object to merge
     */
    void merge(const json& other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(other);
    }

private:
    Config() : m_config(defaults()) {}

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json defaults() {
        return {
            {"version", "1.0.0"},
            {"downloads", {
                {"maxConcurrent", 3},
                {"directory", ""},
                {"progressIntervalMs", 50},
                {"retryCount", 3},
                {"retryDelay", 1000},
                {"timeout", 0},
                {"connectTimeout", 10000},
                {"segments", 8},
                {"minSegmentSize", 1048576},
                {"userAgent", "Downpour/1.0"}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""}
            }}
        };
    }

    /**
     * Convert dot notation to JSON pointer
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

} // namespace downpour::core
