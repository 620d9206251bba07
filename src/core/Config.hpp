#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace gas::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Manages application settings with:
 * - Type-safe getters with defaults
 * - JSON persistence
 * - Values from disk layered over built-in defaults
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
     * Load configuration from file
     * Values found on disk are merged over the defaults, so a partial file is valid.
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
                return false;
            }

            m_config.merge_patch(loaded);
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
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
            std::filesystem::create_directories(
                std::filesystem::path(savePath).parent_path()
            );

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            m_configPath = savePath;
            return true;

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Set default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "0.3.0"},
            {"logging", {
                {"level", "warn"},
                {"file", true},
                {"maxSizeMb", 5},
                {"maxFiles", 3}
            }},
            {"oauth", {
                {"host", "github.com"},
                {"clientId", "Ov23li6WaAMnOZW2RXsa"},
                {"scope", "repo read:user"},
                {"deviceCodeUrl", "https://github.com/login/device/code"},
                {"tokenUrl", "https://github.com/login/oauth/access_token"},
                {"userUrl", "https://api.github.com/user"},
                {"timeoutSeconds", 30}
            }},
            {"paths", {
#if defined(_WIN32) || defined(__APPLE__)
                {"caseInsensitive", true}
#else
                {"caseInsensitive", false}
#endif
            }},
            {"lock", {
                {"retries", 20},
                {"backoffMs", 25},
                {"maxBackoffMs", 500}
            }},
            {"vault", {
                {"service", "gas"}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "oauth.clientId")
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
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
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

} // namespace gas::core
