#pragma once

#include <string>

namespace alertwatch {

/**
 * @brief Result of one outbound POST
 *
 * `error` is non-empty when no HTTP response was received (connection
 * refused, TLS failure, timeout). Otherwise `status` and `body` hold
 * the response.
 */
struct WebhookResponse {
    int status = 0;
    std::string body;
    std::string error;

    [[nodiscard]] bool transport_failed() const { return !error.empty(); }
};

/**
 * @brief Abstract interface for alert delivery
 *
 * Implementations perform exactly one attempt per call and report the
 * outcome; they do not retry and do not throw for delivery failures.
 */
class IAlertTransport {
public:
    virtual ~IAlertTransport() = default;

    /// POST a JSON document. Blocks for at most the configured timeout.
    [[nodiscard]] virtual WebhookResponse post_json(const std::string& payload) = 0;

    /// Human-readable destination for logging (e.g. "webhook:https://hooks.example.com")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace alertwatch
