#pragma once

#include "alerting/alert_types.hpp"
#include "core/json.hpp"
#include "detector/rolling_window.hpp"
#include "parser/log_entry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace alertwatch {

/**
 * @brief Rolling upstream 5xx rate over the last N requests
 *
 * Every entry is classified (is_error) and pushed into the window. Until
 * the window is full nothing is decided. Once full, the rate is
 * recomputed on every call:
 * - rate >= threshold, not active → activate, emit one ERROR_RATE event
 * - rate >= threshold, active     → nothing (edge-triggered)
 * - rate <  threshold             → deactivate silently
 */
class ErrorRateDetector {
public:
    ErrorRateDetector(size_t window_size, double threshold);

    [[nodiscard]] std::optional<AlertEvent> record_and_check(const LogEntry& entry);

    /**
     * @brief Classify an entry as an upstream error
     *
     * Uses the first parseable upstream hop status, falling back to the
     * top-level `status`. Anything unresolvable is a non-error. Never throws.
     */
    [[nodiscard]] static bool is_error(const LogEntry& entry);

    /// First token of a scalar/comma-joined/array status field that parses as an integer
    [[nodiscard]] static std::optional<int64_t> first_status(const JsonValue& value);

    /// Split a flexible status field into trimmed string tokens
    [[nodiscard]] static std::vector<std::string> status_tokens(const JsonValue& value);

    /// Rate over the window, empty until the window has filled
    [[nodiscard]] std::optional<double> current_rate() const;

    [[nodiscard]] bool alert_active() const { return alert_active_; }
    [[nodiscard]] const RollingWindow& window() const { return window_; }

private:
    RollingWindow window_;
    double threshold_;
    bool alert_active_ = false;
};

} // namespace alertwatch
