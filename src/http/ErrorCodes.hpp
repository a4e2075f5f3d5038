#pragma once

#include <string_view>

namespace mdc::http::errors {

inline constexpr std::string_view timeframe_invalid = "timeframe_invalid";
inline constexpr std::string_view upstream_unreachable = "upstream_unreachable";
inline constexpr std::string_view upstream_http_error = "upstream_http_error";
inline constexpr std::string_view upstream_malformed_response = "upstream_malformed_response";
inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view internal_error = "internal_error";

}  // namespace mdc::http::errors
