#pragma once

#include <string>
#include <string_view>

namespace satnogsproxy::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAcceptHeader = "Accept";
inline const std::string kLinkHeader = "Link";

inline const std::string kAllowOriginHeader = "Access-Control-Allow-Origin";
inline const std::string kAllowHeadersHeader = "Access-Control-Allow-Headers";
inline const std::string kAllowMethodsHeader = "Access-Control-Allow-Methods";
inline const std::string kExposeHeadersHeader = "Access-Control-Expose-Headers";

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kOctetStreamContentType = "application/octet-stream";
inline constexpr std::string_view kJsonMediaType = "application/json";

inline constexpr std::string_view kMethodGet = "GET";
inline constexpr std::string_view kMethodOptions = "OPTIONS";

} // namespace satnogsproxy::http
