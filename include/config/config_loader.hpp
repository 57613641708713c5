#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string>

namespace alertwatch {

// ============================================================================
// Environment variables (applied on top of the TOML file)
// ============================================================================

namespace env {
    inline constexpr const char* WEBHOOK_URL      = "SLACK_WEBHOOK_URL";
    inline constexpr const char* LOG_PATH         = "LOG_PATH";
    inline constexpr const char* WINDOW           = "ALERT_ERROR_WINDOW";
    inline constexpr const char* THRESHOLD        = "ALERT_ERROR_THRESHOLD";
    inline constexpr const char* COOLDOWN_SECONDS = "ALERT_COOLDOWN_SECONDS";
    inline constexpr const char* PRIMARY_POOL     = "PRIMARY_POOL";
    inline constexpr const char* MAINTENANCE_FLAG = "MAINTENANCE_FLAG_FILE";
    inline constexpr const char* LOG_LEVEL        = "ALERT_LOG_LEVEL";
    inline constexpr const char* CONFIG_FILE      = "ALERT_WATCHER_CONFIG";
}

// ============================================================================
// ConfigLoader - Build a validated WatcherConfig
// ============================================================================

/**
 * Sources, lowest precedence first:
 * 1. Built-in defaults (WatcherConfig)
 * 2. Optional TOML file: [watcher] and [tailer] tables, ${VAR} expansion
 *    in string values
 * 3. Environment variables (see env::)
 *
 * Example:
 *
 *   [watcher]
 *   webhook_url = "${SLACK_WEBHOOK_URL}"
 *   log_path = "/var/log/nginx/app_access.log"
 *   window_size = 200
 *   error_threshold = 0.02
 *   cooldown_seconds = 300
 *   primary_pool = "blue"
 *   maintenance_flag_file = "/run/alert-watcher/maintenance"
 *
 *   [tailer]
 *   idle_interval_ms = 200
 *   reopen_backoff_ms = 1000
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        WatcherConfig config;

        static LoadResult ok(WatcherConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file, then apply environment overrides
     * @param config_path Path to the .toml file
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML content, then apply environment overrides
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Defaults plus environment only (no config file)
     */
    [[nodiscard]] static LoadResult load_from_env();

    /**
     * @brief Check required fields and ranges
     * @return Error description, or std::nullopt when valid
     */
    [[nodiscard]] static std::optional<std::string> validate(const WatcherConfig& config);

private:
    // Throws std::runtime_error on malformed numeric values
    static void apply_env_overrides(WatcherConfig& config);

    static LoadResult finish(WatcherConfig config);
};

} // namespace alertwatch
