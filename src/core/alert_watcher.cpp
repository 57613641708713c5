#include "core/alert_watcher.hpp"
#include "core/utils.hpp"
#include "parser/log_entry.hpp"

#include <format>

namespace alertwatch {

AlertWatcher::AlertWatcher(const WatcherConfig& config, std::shared_ptr<IAlertTransport> transport)
    : error_rate_(config.window_size, config.error_threshold),
      pool_failover_(config.primary_pool),
      gate_(NotificationGate::Config{config.webhook_url, config.cooldown, config.maintenance_flag_file},
            std::move(transport)) {}

void AlertWatcher::process_line(std::string_view line) {
    const auto entry = parse_log_line(line);
    // "{}" carries nothing to classify
    if (!entry || entry->empty()) {
        ++lines_skipped_;
        return;
    }
    ++lines_processed_;

    if (auto event = error_rate_.record_and_check(*entry)) {
        notify(*event);
    }
    if (auto event = pool_failover_.observe(*entry)) {
        notify(*event);
    }
}

void AlertWatcher::notify(const AlertEvent& event) {
    ++alerts_raised_;
    try {
        const DispatchResult result = gate_.dispatch(event);
        utils::log::debug(std::format("{} alert: {}",
            alert_type_to_string(event.type), dispatch_result_to_string(result)));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Dispatch of {} alert failed: {}",
                                      alert_type_to_string(event.type), e.what()));
    }
}

AlertWatcher::Stats AlertWatcher::get_stats() const {
    Stats s;
    s.lines_processed = lines_processed_;
    s.lines_skipped = lines_skipped_;
    s.alerts_raised = alerts_raised_;
    s.notifications = gate_.get_stats();
    return s;
}

} // namespace alertwatch
