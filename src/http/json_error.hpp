#pragma once

#include <string_view>

#include <boost/json/object.hpp>

#include "api/Controllers.hpp"

namespace mdc::http {

// Writes {"error":"<code>", ...extra} and sets the HTTP status.
void json_error(mdc::api::Response& response,
                int statusCode,
                std::string_view errorCode,
                const boost::json::object& extra = {});

}  // namespace mdc::http
