#include "http/json_error.hpp"

#include "http/HttpJson.hpp"

namespace mdc::http {

void json_error(mdc::api::Response& response,
                int statusCode,
                std::string_view errorCode,
                const boost::json::object& extra) {
    boost::json::object payload;
    payload["error"] = boost::json::string_view{errorCode.data(), errorCode.size()};
    for (const auto& field : extra) {
        payload[field.key()] = field.value();
    }

    response.body = serialize_json(payload);
    response.statusCode = statusCode;
    response.statusText = status_reason(statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

}  // namespace mdc::http
