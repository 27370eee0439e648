#pragma once

#include <string>
#include <string_view>

namespace aegis::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kRequestIdHeader = "X-Request-Id";

inline constexpr std::string_view kServiceName = "aegis-proxy";
inline constexpr std::string_view kServiceVersion = "1.0.0";

} // namespace aegis::http
