#pragma once

#include <string>

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace mdc::http {

std::string status_reason(int statusCode);

std::string serialize_json(const boost::json::value& value);

// Serializes a JSON value into the response and sets status 200 plus the JSON content type.
void write_json(mdc::api::Response& response, const boost::json::value& value);

}  // namespace mdc::http
