/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to explicit overrides and environment variables.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace ocmf::common {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Lookup order: values set with set(), then environment variables (read at
 * lookup time), then the caller's default.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager() = default;

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
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     *
     * @param key Configuration key
     * @param defaultValue Default value if key not found or unparseable
     * @return Configuration value
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value (overrides the environment)
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicit override
     */
    void remove(const std::string& key);

    /// @name Predefined Configuration Keys

    // Logging
    static constexpr const char* LOG_LEVEL = "OCMF_LOG_LEVEL";
    static constexpr const char* LOG_FILE = "OCMF_LOG_FILE";

    // Validation policy
    static constexpr const char* REQUIRE_METER_SERIAL = "OCMF_REQUIRE_METER_SERIAL";

    // Compliance policy
    static constexpr const char* ID_MISMATCH_SEVERITY = "OCMF_ID_MISMATCH_SEVERITY";
};

} // namespace ocmf::common
