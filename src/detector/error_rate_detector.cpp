#include "detector/error_rate_detector.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <string_view>
#include <system_error>

namespace alertwatch {

namespace {

constexpr int64_t kServerErrorFloor = 500;

// Integer token; digits beyond the int64_t range saturate rather than fail
std::optional<int64_t> parse_status_token(std::string_view token) {
    if (auto code = utils::try_parse_int<int64_t>(token)) {
        return code;
    }
    if (!token.empty() && token.front() == '+') token.remove_prefix(1);
    int64_t ignored{};
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), ignored);
    if (ec == std::errc::result_out_of_range && ptr == token.data() + token.size()) {
        return token.front() == '-' ? std::numeric_limits<int64_t>::min()
                                    : std::numeric_limits<int64_t>::max();
    }
    return std::nullopt;
}

// Top-level `status`: JSON number, or a string holding one integer
std::optional<int64_t> scalar_status(const JsonValue& value) {
    if (value.is_number()) {
        const double d = value.get<double>();
        if (std::isnan(d)) return std::nullopt;
        // 2^63 is exactly representable; anything at or beyond it saturates
        constexpr double kLimit = 9223372036854775808.0;
        if (d >= kLimit) return std::numeric_limits<int64_t>::max();
        if (d < -kLimit) return std::numeric_limits<int64_t>::min();
        return static_cast<int64_t>(d);
    }
    if (value.is_string()) {
        const std::string text = utils::trim(value.get<std::string>());
        if (text.empty()) return std::nullopt;
        return parse_status_token(text);
    }
    return std::nullopt;
}

} // anonymous namespace

ErrorRateDetector::ErrorRateDetector(size_t window_size, double threshold)
    : window_(window_size),
      threshold_(threshold) {}

std::vector<std::string> ErrorRateDetector::status_tokens(const JsonValue& value) {
    std::vector<std::string> tokens;
    if (value.is_array()) {
        for (const auto& item : value.elements()) {
            tokens.push_back(utils::trim(JsonValue(item).to_text()));
        }
        return tokens;
    }
    if (value.is_string() || value.is_number()) {
        for (auto& part : utils::split(value.to_text(), ',')) {
            tokens.push_back(utils::trim(part));
        }
    }
    return tokens;
}

std::optional<int64_t> ErrorRateDetector::first_status(const JsonValue& value) {
    for (const auto& token : status_tokens(value)) {
        if (token.empty()) continue;
        if (auto code = parse_status_token(token)) {
            return code;
        }
    }
    return std::nullopt;
}

bool ErrorRateDetector::is_error(const LogEntry& entry) {
    auto code = first_status(entry.field(fields::UPSTREAM_STATUS));
    if (!code) {
        code = scalar_status(entry.field(fields::STATUS));
    }
    return code && *code >= kServerErrorFloor;
}

std::optional<double> ErrorRateDetector::current_rate() const {
    if (!window_.full()) return std::nullopt;
    return window_.rate();
}

std::optional<AlertEvent> ErrorRateDetector::record_and_check(const LogEntry& entry) {
    window_.push(is_error(entry));

    if (!window_.full()) {
        return std::nullopt;
    }

    const double rate = window_.rate();
    if (rate < threshold_) {
        alert_active_ = false;
        return std::nullopt;
    }

    if (alert_active_) {
        return std::nullopt;
    }

    alert_active_ = true;
    return AlertEvent{
        AlertType::ERROR_RATE,
        std::format("High upstream error rate detected: {:.2f}% over last {} requests.",
                    rate * 100.0, window_.size())};
}

} // namespace alertwatch
