#pragma once

#include <string_view>

namespace alertwatch::http {

inline constexpr std::string_view kHttpsScheme = "https://";
inline constexpr std::string_view kHttpScheme = "http://";
inline constexpr const char* kJsonContentType = "application/json";

} // namespace alertwatch::http
