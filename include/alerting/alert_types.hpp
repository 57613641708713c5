#pragma once

#include <string>
#include <string_view>

namespace alertwatch {

namespace keys {
    inline constexpr std::string_view ERROR_RATE = "error_rate";
    inline constexpr std::string_view FAILOVER   = "failover";
    inline constexpr std::string_view RECOVERY   = "recovery";
}

enum class AlertType {
    ERROR_RATE,
    FAILOVER,
    RECOVERY
};

/**
 * @brief A detector's request to notify operators
 */
struct AlertEvent {
    AlertType type = AlertType::ERROR_RATE;
    std::string message;
};

/**
 * @brief Outcome of one NotificationGate::dispatch() call
 */
enum class DispatchResult {
    SENT,
    SUPPRESSED_COOLDOWN,
    SUPPRESSED_MAINTENANCE,
    SUPPRESSED_NO_WEBHOOK,
    FAILED_HTTP_STATUS,
    FAILED_TRANSPORT
};

[[nodiscard]] constexpr std::string_view alert_type_to_string(AlertType t) {
    switch (t) {
        case AlertType::ERROR_RATE: return keys::ERROR_RATE;
        case AlertType::FAILOVER:   return keys::FAILOVER;
        case AlertType::RECOVERY:   return keys::RECOVERY;
        default: return "unknown";
    }
}

[[nodiscard]] constexpr std::string_view dispatch_result_to_string(DispatchResult r) {
    switch (r) {
        case DispatchResult::SENT:                   return "sent";
        case DispatchResult::SUPPRESSED_COOLDOWN:    return "suppressed_cooldown";
        case DispatchResult::SUPPRESSED_MAINTENANCE: return "suppressed_maintenance";
        case DispatchResult::SUPPRESSED_NO_WEBHOOK:  return "suppressed_no_webhook";
        case DispatchResult::FAILED_HTTP_STATUS:     return "failed_http_status";
        case DispatchResult::FAILED_TRANSPORT:       return "failed_transport";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr bool is_suppressed(DispatchResult r) {
    return r == DispatchResult::SUPPRESSED_COOLDOWN
        || r == DispatchResult::SUPPRESSED_MAINTENANCE
        || r == DispatchResult::SUPPRESSED_NO_WEBHOOK;
}

} // namespace alertwatch
