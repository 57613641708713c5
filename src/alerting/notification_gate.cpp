#include "alerting/notification_gate.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <system_error>

namespace alertwatch {

namespace {

constexpr std::string_view kAlertMarker = ":rotating_light:";

} // anonymous namespace

NotificationGate::NotificationGate(Config config, std::shared_ptr<IAlertTransport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)) {
    config_.webhook_url = utils::trim(config_.webhook_url);
    config_.maintenance_flag_file = utils::trim(config_.maintenance_flag_file);
}

bool NotificationGate::in_cooldown(AlertType type) const {
    const auto it = last_sent_.find(std::string(alert_type_to_string(type)));
    if (it == last_sent_.end()) return false;
    return std::chrono::steady_clock::now() - it->second < config_.cooldown;
}

bool NotificationGate::maintenance_active() const {
    if (config_.maintenance_flag_file.empty()) return false;
    // Flag may vanish between calls; any stat error reads as "absent"
    std::error_code ec;
    return std::filesystem::exists(config_.maintenance_flag_file, ec) && !ec;
}

std::string NotificationGate::build_payload(std::string_view message) {
    return std::format("{{\"text\":\"{} {}\"}}", kAlertMarker, utils::escape_json(message));
}

DispatchResult NotificationGate::record(DispatchResult result) {
    if (result == DispatchResult::SENT) {
        ++stats_.sent;
    } else if (is_suppressed(result)) {
        ++stats_.suppressed;
    } else {
        ++stats_.failed;
    }
    return result;
}

DispatchResult NotificationGate::dispatch(const AlertEvent& event) {
    const std::string_view type = alert_type_to_string(event.type);

    if (in_cooldown(event.type)) {
        utils::log::debug(std::format("Cooldown active; dropping {} alert: {}", type, event.message));
        return record(DispatchResult::SUPPRESSED_COOLDOWN);
    }

    if (maintenance_active()) {
        utils::log::info(std::format("Maintenance mode active; suppressing {} alert: {}",
                                     type, event.message));
        return record(DispatchResult::SUPPRESSED_MAINTENANCE);
    }

    if (config_.webhook_url.empty() || !transport_) {
        utils::log::warn(std::format("Cannot send {} alert (no webhook configured): {}",
                                     type, event.message));
        return record(DispatchResult::SUPPRESSED_NO_WEBHOOK);
    }

    const WebhookResponse response = transport_->post_json(build_payload(event.message));

    if (response.transport_failed()) {
        utils::log::error(std::format("Failed to send {} alert via {}: {}",
                                      type, transport_->name(), response.error));
        return record(DispatchResult::FAILED_TRANSPORT);
    }

    if (response.status >= 400) {
        utils::log::error(std::format("Webhook returned {} for {} alert: {}",
                                      response.status, type, utils::trim(response.body)));
        return record(DispatchResult::FAILED_HTTP_STATUS);
    }

    utils::log::info(std::format("Sent {} alert: {}", type, event.message));
    last_sent_[std::string(type)] = std::chrono::steady_clock::now();
    return record(DispatchResult::SENT);
}

} // namespace alertwatch
