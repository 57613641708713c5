#include "detector/pool_failover_detector.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace alertwatch {

namespace {

constexpr double kHealthyStatus = 200.0;

// Strict: the JSON number 200, not "200"
bool is_healthy(const JsonValue& status) {
    return status.is_number() && status.get<double>() == kHealthyStatus;
}

} // anonymous namespace

PoolFailoverDetector::PoolFailoverDetector(std::string primary_pool)
    : primary_pool_(utils::to_lower(utils::trim(primary_pool))) {}

std::optional<AlertEvent> PoolFailoverDetector::observe(const LogEntry& entry) {
    const std::string pool = entry.pool();
    if (pool.empty() || !is_healthy(entry.field(fields::STATUS))) {
        return std::nullopt;
    }

    if (current_pool_ == pool) {
        return std::nullopt;
    }

    const std::optional<std::string> previous = std::exchange(current_pool_, pool);
    const std::string release = entry.release();

    if (!previous) {
        utils::log::info(std::format("Initial pool observed: {} (release {})", pool, release));
        return std::nullopt;
    }

    if (!primary_pool_.empty() && pool == primary_pool_) {
        return AlertEvent{
            AlertType::RECOVERY,
            std::format("Traffic recovered to primary pool '{}' (was '{}'). Release {} now serving.",
                        pool, *previous, release)};
    }

    return AlertEvent{
        AlertType::FAILOVER,
        std::format("Failover detected: traffic moved from '{}' to '{}'. Release {} now serving.",
                    *previous, pool, release)};
}

} // namespace alertwatch
