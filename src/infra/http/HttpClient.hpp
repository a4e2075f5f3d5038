#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace mdc::infra::http {

struct Url {
    std::string scheme;    // "http" or "https"
    std::string host;
    std::string port;      // defaults to 80/443 when absent from the URL
    std::string basePath;  // never ends with '/'; empty for the root

    bool secure() const { return scheme == "https"; }
    std::string origin() const;
};

struct RequestOptions {
    std::chrono::seconds timeout{10};
    std::string userAgent{"mdc-chart-service/1.0"};
    int maxRedirects{5};
};

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    // Where the response actually came from once redirects were followed.
    std::string final_host;
    std::string final_target;
};

// The request could not be completed: resolve, connect, TLS, write, read or deadline failure.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws std::invalid_argument for anything that is not an absolute http(s) URL.
Url parse_url(const std::string& url);

// GET {url.origin()}{target} with Accept: application/json. Follows 301/302/307/308 redirects
// (never from https to http). Non-2xx statuses are returned, not thrown.
HttpResponse http_get(const Url& url, const std::string& target, const RequestOptions& options);

}  // namespace mdc::infra::http
