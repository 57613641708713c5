#include <catch2/catch_test_macros.hpp>
#include "alerting/notification_gate.hpp"
#include "mocks/mock_alert_transport.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

using namespace alertwatch;
using alertwatch::testing::MockAlertTransport;

namespace {

NotificationGate::Config gate_config(std::chrono::seconds cooldown = std::chrono::seconds{300},
                                     std::string maintenance_flag = {}) {
    NotificationGate::Config cfg;
    cfg.webhook_url = "https://hooks.example.com/services/T000/B000/XXXX";
    cfg.cooldown = cooldown;
    cfg.maintenance_flag_file = std::move(maintenance_flag);
    return cfg;
}

AlertEvent failover_event() {
    return AlertEvent{AlertType::FAILOVER, "Failover detected: traffic moved from 'blue' to 'green'."};
}

void touch(const std::string& path) {
    std::ofstream ofs(path);
    ofs << "maintenance\n";
}

} // anonymous namespace

// ============================================================================
// Payload
// ============================================================================

TEST_CASE("NotificationGate: payload carries marker and message", "[alerting][gate]") {
    CHECK(NotificationGate::build_payload("pool moved") ==
          R"({"text":":rotating_light: pool moved"})");
}

TEST_CASE("NotificationGate: payload escapes JSON specials", "[alerting][gate]") {
    CHECK(NotificationGate::build_payload("from 'a' to \"b\"\n") ==
          R"({"text":":rotating_light: from 'a' to \"b\"\n"})");
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("NotificationGate: successful send posts once", "[alerting][gate]") {
    auto transport = std::make_shared<MockAlertTransport>();
    NotificationGate gate(gate_config(), transport);

    CHECK(gate.dispatch(failover_event()) == DispatchResult::SENT);
    REQUIRE(transport->call_count() == 1);
    CHECK(transport->payloads()[0].find("traffic moved from 'blue'") != std::string::npos);
    CHECK(gate.get_stats().sent == 1);
}

TEST_CASE("NotificationGate: cooldown suppresses repeats of the same type", "[alerting][gate]") {
    auto transport = std::make_shared<MockAlertTransport>();
    NotificationGate gate(gate_config(std::chrono::seconds{1}), transport);

    CHECK(gate.dispatch(failover_event()) == DispatchResult::SENT);
    CHECK(gate.in_cooldown(AlertType::FAILOVER));
    CHECK(gate.dispatch(failover_event()) == DispatchResult::SUPPRESSED_COOLDOWN);
    CHECK(transport->call_count() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds{1100});

    CHECK_FALSE(gate.in_cooldown(AlertType::FAILOVER));
    CHECK(gate.dispatch(failover_event()) == DispatchResult::SENT);
    CHECK(transport->call_count() == 2);
}

TEST_CASE("NotificationGate: cooldown is per alert type", "[alerting][gate]") {
    auto transport = std::make_shared<MockAlertTransport>();
    NotificationGate gate(gate_config(), transport);

    CHECK(gate.dispatch(failover_event()) == DispatchResult::SENT);
    CHECK(gate.dispatch(AlertEvent{AlertType::RECOVERY, "back on blue"}) == DispatchResult::SENT);
    CHECK(gate.dispatch(AlertEvent{AlertType::ERROR_RATE, "5xx spike"}) == DispatchResult::SENT);
    CHECK(transport->call_count() == 3);

    CHECK(gate.dispatch(AlertEvent{AlertType::RECOVERY, "back on blue again"}) ==
          DispatchResult::SUPPRESSED_COOLDOWN);
    CHECK(transport->call_count() == 3);
}

TEST_CASE("NotificationGate: zero cooldown never suppresses", "[alerting][gate]") {
    auto transport = std::make_shared<MockAlertTransport>();
    NotificationGate gate(gate_config(std::chrono::seconds{0}), transport);

    CHECK(gate.dispatch(failover_event()) == DispatchResult::SENT);
    CHECK(gate.dispatch(failover_event()) == DispatchResult::SENT);
    CHECK(transport->call_count() == 2);
}

TEST_CASE("NotificationGate: maintenance flag file suppresses", "[alerting][gate]") {
    const std::string flag = "/tmp/test_alertwatch_maintenance.flag";
    std::filesystem::remove(flag);

    auto transport = std::make_shared<MockAlertTransport>();
    NotificationGate gate(gate_config(std::chrono::seconds{300}, flag), transport);

    touch(flag);
    CHECK(gate.maintenance_active());
    CHECK(gate.dispatch(failover_event()) == DispatchResult::SUPPRESSED_MAINTENANCE);
    CHECK(gate.dispatch(AlertEvent{AlertType::ERROR_RATE, "5xx spike"}) ==
          DispatchResult::SUPPRESSED_MAINTENANCE);
    CHECK(transport->call_count() == 0);

    // Suppression does not start a cooldown
    std::filesystem::remove(flag);
    CHECK_FALSE(gate.maintenance_active());
    CHECK(gate.dispatch(failover_event()) == DispatchResult::SENT);
    CHECK(transport->call_count() == 1);
    CHECK(gate.get_stats().suppressed == 2);
}

TEST_CASE("NotificationGate: unset maintenance path is never active", "[alerting][gate]") {
    auto transport = std::make_shared<MockAlertTransport>();
    NotificationGate gate(gate_config(), transport);
    CHECK_FALSE(gate.maintenance_active());
}

TEST_CASE("NotificationGate: empty webhook URL suppresses", "[alerting][gate]") {
    auto transport = std::make_shared<MockAlertTransport>();
    auto cfg = gate_config();
    cfg.webhook_url = "   ";
    NotificationGate gate(cfg, transport);

    CHECK(gate.dispatch(failover_event()) == DispatchResult::SUPPRESSED_NO_WEBHOOK);
    CHECK(transport->call_count() == 0);
}

TEST_CASE("NotificationGate: HTTP error does not start cooldown", "[alerting][gate]") {
    auto transport = std::make_shared<MockAlertTransport>();
    transport->set_status(500, "internal error");
    NotificationGate gate(gate_config(), transport);

    CHECK(gate.dispatch(failover_event()) == DispatchResult::FAILED_HTTP_STATUS);
    CHECK_FALSE(gate.in_cooldown(AlertType::FAILOVER));

    transport->set_status(404, "no_service");
    CHECK(gate.dispatch(failover_event()) == DispatchResult::FAILED_HTTP_STATUS);

    transport->set_status(200, "ok");
    CHECK(gate.dispatch(failover_event()) == DispatchResult::SENT);
    CHECK(transport->call_count() == 3);
    CHECK(gate.get_stats().failed == 2);
}

TEST_CASE("NotificationGate: redirect status counts as success", "[alerting][gate]") {
    auto transport = std::make_shared<MockAlertTransport>(302);
    NotificationGate gate(gate_config(), transport);
    CHECK(gate.dispatch(failover_event()) == DispatchResult::SENT);
    CHECK(gate.in_cooldown(AlertType::FAILOVER));
}

TEST_CASE("NotificationGate: transport failure does not start cooldown", "[alerting][gate]") {
    auto transport = std::make_shared<MockAlertTransport>();
    transport->set_transport_error("Connection timed out");
    NotificationGate gate(gate_config(), transport);

    CHECK(gate.dispatch(failover_event()) == DispatchResult::FAILED_TRANSPORT);
    CHECK_FALSE(gate.in_cooldown(AlertType::FAILOVER));
    CHECK(gate.dispatch(failover_event()) == DispatchResult::FAILED_TRANSPORT);
    CHECK(transport->call_count() == 2);
}
