#pragma once

#include "alerting/alert_types.hpp"
#include "parser/log_entry.hpp"

#include <optional>
#include <string>

namespace alertwatch {

/**
 * @brief Tracks which backend pool is serving traffic
 *
 * Only entries with status exactly 200 and a non-empty pool move the
 * tracked pool. The first such entry sets the baseline silently; later
 * changes raise RECOVERY when the new pool is the configured primary and
 * FAILOVER otherwise.
 */
class PoolFailoverDetector {
public:
    /// @param primary_pool Designated primary; empty disables RECOVERY events
    explicit PoolFailoverDetector(std::string primary_pool = {});

    [[nodiscard]] std::optional<AlertEvent> observe(const LogEntry& entry);

    [[nodiscard]] const std::optional<std::string>& current_pool() const { return current_pool_; }
    [[nodiscard]] const std::string& primary_pool() const { return primary_pool_; }

private:
    std::string primary_pool_;
    std::optional<std::string> current_pool_;
};

} // namespace alertwatch
