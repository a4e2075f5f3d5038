#include "http/HttpJson.hpp"

#include <string>

#include <boost/json/serialize.hpp>

namespace mdc::http {

std::string status_reason(int statusCode) {
    switch (statusCode) {
    case 200:
        return "OK";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    default:
        break;
    }
    return "Unknown";
}

std::string serialize_json(const boost::json::value& value) {
    return boost::json::serialize(value);
}

void write_json(mdc::api::Response& response, const boost::json::value& value) {
    response.body = serialize_json(value);
    response.statusCode = 200;
    response.statusText = status_reason(response.statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

}  // namespace mdc::http
