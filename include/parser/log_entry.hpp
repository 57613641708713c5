#pragma once

#include "core/json.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace alertwatch {

namespace fields {
    inline constexpr std::string_view STATUS          = "status";
    inline constexpr std::string_view UPSTREAM_STATUS = "upstream_status";
    inline constexpr std::string_view POOL            = "pool";
    inline constexpr std::string_view RELEASE         = "release";
}

inline constexpr std::string_view kUnknownRelease = "unknown";

/**
 * @brief One decoded access-log record
 *
 * Holds the JSON object exactly as decoded. Accessors never throw:
 * a missing or mistyped field reads as absent.
 */
class LogEntry {
public:
    explicit LogEntry(JsonValue fields) : fields_(std::move(fields)) {}

    /// Raw field value, null when absent
    [[nodiscard]] JsonValue field(std::string_view key) const { return fields_[key]; }

    [[nodiscard]] bool has(std::string_view key) const { return fields_.contains(key); }

    /// True for "{}"
    [[nodiscard]] bool empty() const { return fields_.empty(); }

    /// `pool`, trimmed and ASCII lower-cased; empty when absent or not a string
    [[nodiscard]] std::string pool() const;

    /// `release` as text, "unknown" when absent or empty
    [[nodiscard]] std::string release() const;

private:
    JsonValue fields_;
};

/**
 * @brief Decode one raw log line
 *
 * Blank lines yield std::nullopt silently. Lines that are not a JSON
 * object yield std::nullopt and log a warning with the offending text.
 */
[[nodiscard]] std::optional<LogEntry> parse_log_line(std::string_view raw_line);

} // namespace alertwatch
