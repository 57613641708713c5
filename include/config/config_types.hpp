#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace alertwatch {

// ============================================================================
// Configuration Types
// ============================================================================

inline constexpr const char* kDefaultLogPath = "/var/log/nginx/app_access.log";

struct TailerConfig {
    std::chrono::milliseconds idle_interval{200};     // sleep when caught up
    std::chrono::milliseconds reopen_backoff{1000};   // sleep while the file is missing
};

/**
 * @brief Complete watcher configuration, immutable after load
 */
struct WatcherConfig {
    std::string webhook_url;                          // required
    std::string log_path = kDefaultLogPath;
    size_t window_size = 200;
    double error_threshold = 0.02;                    // fraction, 0..1
    std::chrono::seconds cooldown{300};
    std::string primary_pool;                         // empty = no recovery classification
    std::string maintenance_flag_file;                // empty = maintenance mode disabled
    std::string log_level = "info";
    std::chrono::milliseconds webhook_timeout{5000};
    TailerConfig tailer;
};

} // namespace alertwatch
