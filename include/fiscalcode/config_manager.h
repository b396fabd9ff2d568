/**
 * @file config_manager.h
 * @brief Centralized configuration management
 *
 * Environment variables with typed accessors and defaults, behind a
 * thread-safe singleton. Codec functions never read configuration; only
 * the command-line tool does.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace fiscalcode {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     * @throws ConfigException if the key is missing or not an integer
     */
    int requireInt(const std::string& key) const;

    /**
     * @brief Get boolean configuration value (true/false, 1/0, yes/no, on/off)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /**
     * @brief Load known keys from the environment
     */
    void loadFromEnvironment();

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys
    static constexpr const char* LOG_LEVEL = "FISCALCODE_LOG_LEVEL";
    static constexpr const char* LOG_FILE = "FISCALCODE_LOG_FILE";
    static constexpr const char* LOG_TO_FILE = "FISCALCODE_LOG_TO_FILE";
    static constexpr const char* REFERENCE_YEAR = "FISCALCODE_REFERENCE_YEAR";
};

} // namespace fiscalcode
