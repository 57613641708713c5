#pragma once

#include "alerting/alert_transport.hpp"
#include "alerting/notification_gate.hpp"
#include "config/config_types.hpp"
#include "detector/error_rate_detector.hpp"
#include "detector/pool_failover_detector.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace alertwatch {

/**
 * @brief Detection pipeline for one access log
 *
 * process_line() runs one raw line through:
 *   parse_log_line → ErrorRateDetector → PoolFailoverDetector → NotificationGate
 *
 * All state (rolling window, tracked pool, cooldowns) lives here and is
 * touched only from the tailing loop, so no locking is needed. Bad input
 * never escapes as an exception.
 */
class AlertWatcher {
public:
    AlertWatcher(const WatcherConfig& config, std::shared_ptr<IAlertTransport> transport);

    AlertWatcher(const AlertWatcher&) = delete;
    AlertWatcher& operator=(const AlertWatcher&) = delete;

    void process_line(std::string_view line);

    struct Stats {
        uint64_t lines_processed = 0;
        uint64_t lines_skipped = 0;
        uint64_t alerts_raised = 0;
        NotificationGate::Stats notifications;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const ErrorRateDetector& error_rate() const { return error_rate_; }
    [[nodiscard]] const PoolFailoverDetector& pool_failover() const { return pool_failover_; }

private:
    void notify(const AlertEvent& event);

    ErrorRateDetector error_rate_;
    PoolFailoverDetector pool_failover_;
    NotificationGate gate_;

    uint64_t lines_processed_ = 0;
    uint64_t lines_skipped_ = 0;
    uint64_t alerts_raised_ = 0;
};

} // namespace alertwatch
