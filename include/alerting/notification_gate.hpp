#pragma once

#include "alerting/alert_transport.hpp"
#include "alerting/alert_types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace alertwatch {

/**
 * @brief Decides whether an alert goes out, and sends it if so
 *
 * Gates, in order:
 * 1. Cooldown: same alert type sent successfully less than `cooldown` ago
 * 2. Maintenance: the flag file exists (checked on every call)
 * 3. Misconfiguration: no webhook URL or no transport
 *
 * Only a successful send (HTTP status < 400) starts a cooldown. Failed
 * sends are logged and dropped.
 *
 * Single-threaded: owned and driven by the AlertWatcher loop.
 */
class NotificationGate {
public:
    struct Config {
        std::string webhook_url;
        std::chrono::seconds cooldown{300};
        std::string maintenance_flag_file;
    };

    struct Stats {
        uint64_t sent = 0;
        uint64_t suppressed = 0;
        uint64_t failed = 0;
    };

    NotificationGate(Config config, std::shared_ptr<IAlertTransport> transport);

    [[nodiscard]] DispatchResult dispatch(const AlertEvent& event);

    [[nodiscard]] bool in_cooldown(AlertType type) const;
    [[nodiscard]] bool maintenance_active() const;

    [[nodiscard]] Stats get_stats() const { return stats_; }

    /// {"text": ":rotating_light: <message>"}
    [[nodiscard]] static std::string build_payload(std::string_view message);

private:
    DispatchResult record(DispatchResult result);

    Config config_;
    std::shared_ptr<IAlertTransport> transport_;

    // Last successful dispatch per alert type key
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_sent_;

    Stats stats_;
};

} // namespace alertwatch
