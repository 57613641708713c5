#pragma once

#include "alerting/alert_transport.hpp"

#include <chrono>
#include <string>

namespace alertwatch {

/**
 * @brief HTTP(S) POST transport for Slack-style incoming webhooks
 *
 * Uses the cpp-httplib client; https URLs need the library built with
 * OpenSSL support. One attempt per call, connect/read/write all bounded
 * by the configured timeout.
 */
class WebhookTransport : public IAlertTransport {
public:
    struct Config {
        std::string url;
        std::chrono::milliseconds timeout{5000};
    };

    explicit WebhookTransport(const Config& config);

    [[nodiscard]] WebhookResponse post_json(const std::string& payload) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] int port() const { return port_; }
    [[nodiscard]] bool use_ssl() const { return use_ssl_; }

private:
    Config config_;

    // Parsed from URL
    std::string host_;
    std::string path_ = "/";
    int port_ = 443;
    bool use_ssl_ = true;
};

} // namespace alertwatch
