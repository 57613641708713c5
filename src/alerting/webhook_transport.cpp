#include "alerting/webhook_transport.hpp"
#include "alerting/http_constants.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace alertwatch {

WebhookTransport::WebhookTransport(const Config& config)
    : config_(config) {
    // Parse URL into host/port/path
    std::string url = utils::trim(config_.url);

    if (url.starts_with(http::kHttpsScheme)) {
        use_ssl_ = true;
        url = url.substr(http::kHttpsScheme.size());
        port_ = 443;
    } else if (url.starts_with(http::kHttpScheme)) {
        use_ssl_ = false;
        url = url.substr(http::kHttpScheme.size());
        port_ = 80;
    }

    const auto path_pos = url.find('/');
    if (path_pos != std::string::npos) {
        host_ = url.substr(0, path_pos);
        path_ = url.substr(path_pos);
    } else {
        host_ = url;
        path_ = "/";
    }

    // Check for explicit port
    const auto port_pos = host_.find(':');
    if (port_pos != std::string::npos) {
        port_ = utils::parse_int<int>(std::string_view(host_).substr(port_pos + 1), port_);
        host_ = host_.substr(0, port_pos);
    }
}

WebhookResponse WebhookTransport::post_json(const std::string& payload) {
    WebhookResponse response;
    try {
        const std::string scheme_host = std::format("{}{}:{}",
            use_ssl_ ? http::kHttpsScheme : http::kHttpScheme, host_, port_);
        httplib::Client client(scheme_host);
        client.set_connection_timeout(config_.timeout);
        client.set_read_timeout(config_.timeout);
        client.set_write_timeout(config_.timeout);

        auto res = client.Post(path_, payload, http::kJsonContentType);
        if (!res) {
            response.error = httplib::to_string(res.error());
            return response;
        }
        response.status = res->status;
        response.body = res->body;
    } catch (const std::exception& e) {
        response.error = e.what();
    }
    return response;
}

std::string WebhookTransport::name() const {
    return std::format("webhook:{}{}:{}",
        use_ssl_ ? http::kHttpsScheme : http::kHttpScheme, host_, port_);
}

} // namespace alertwatch
