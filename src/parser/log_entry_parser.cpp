#include "parser/log_entry.hpp"
#include "core/utils.hpp"

#include <format>

namespace alertwatch {

std::string LogEntry::pool() const {
    const JsonValue value = fields_[fields::POOL];
    if (!value.is_string()) return {};
    return utils::to_lower(utils::trim(value.get<std::string>()));
}

std::string LogEntry::release() const {
    const JsonValue value = fields_[fields::RELEASE];
    if (value.is_null() || value.is_object() || value.is_array()) {
        return std::string(kUnknownRelease);
    }
    std::string text = value.to_text();
    if (text.empty()) return std::string(kUnknownRelease);
    return text;
}

std::optional<LogEntry> parse_log_line(std::string_view raw_line) {
    const std::string line = utils::trim(raw_line);
    if (line.empty()) {
        return std::nullopt;
    }

    try {
        JsonValue decoded = JsonValue::parse(line);
        if (!decoded.is_object()) {
            utils::log::warn(std::format("Skipping non-object log line: {}", line));
            return std::nullopt;
        }
        return LogEntry(std::move(decoded));
    } catch (const JsonValue::parse_error&) {
        utils::log::warn(std::format("Skipping unparsable log line: {}", line));
        return std::nullopt;
    }
}

} // namespace alertwatch
