#include "infra/http/HttpClient.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace mdc::infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

using Response = bhttp::response<bhttp::string_body>;

// Upstream chart payloads for 90 days stay in the low megabytes.
constexpr std::uint64_t kMaxBodyBytes = 32U * 1024U * 1024U;

TransportError makeError(const Url& url, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "GET " << url.origin() << target << " failed: " << message;
    return TransportError(oss.str());
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 307U || status == 308U;
}

// Drives the io_context until the pending operation's handler has run.
void runPending(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

net::ip::tcp::resolver::results_type resolve(net::io_context& ioc,
                                             const Url& url,
                                             const std::string& target,
                                             std::chrono::seconds timeout) {
    net::ip::tcp::resolver resolver(ioc);
    net::steady_timer deadline(ioc);
    beast::error_code ec;
    net::ip::tcp::resolver::results_type results;
    bool timedOut = false;

    deadline.expires_after(timeout);
    deadline.async_wait([&](const beast::error_code& waitEc) {
        if (!waitEc) {
            timedOut = true;
            resolver.cancel();
        }
    });
    resolver.async_resolve(url.host, url.port,
                           [&](const beast::error_code& resolveEc, net::ip::tcp::resolver::results_type found) {
                               ec = resolveEc;
                               results = std::move(found);
                               deadline.cancel();
                           });
    runPending(ioc);

    if (timedOut) {
        throw makeError(url, target, "DNS resolution timed out");
    }
    if (ec) {
        throw makeError(url, target, "DNS resolution error: " + ec.message());
    }
    return results;
}

template <class Stream>
Response exchange(net::io_context& ioc,
                  Stream& stream,
                  const Url& url,
                  const std::string& target,
                  const RequestOptions& options) {
    auto& lowestLayer = beast::get_lowest_layer(stream);
    beast::error_code ec;

    bhttp::request<bhttp::empty_body> req{bhttp::verb::get, target, 11};
    req.set(bhttp::field::host, url.host);
    req.set(bhttp::field::user_agent, options.userAgent);
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::connection, "close");

    lowestLayer.expires_after(options.timeout);
    bhttp::async_write(stream, req, [&](const beast::error_code& writeEc, std::size_t) { ec = writeEc; });
    runPending(ioc);
    if (ec) {
        throw makeError(url, target, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    bhttp::response_parser<bhttp::string_body> parser;
    parser.body_limit(kMaxBodyBytes);
    lowestLayer.expires_after(options.timeout);
    bhttp::async_read(stream, buffer, parser, [&](const beast::error_code& readEc, std::size_t) { ec = readEc; });
    runPending(ioc);
    if (ec) {
        throw makeError(url, target, "Read error: " + ec.message());
    }
    return parser.release();
}

Response performPlain(const Url& url, const std::string& target, const RequestOptions& options) {
    net::io_context ioc;
    const auto results = resolve(ioc, url, target, options.timeout);

    beast::tcp_stream stream(ioc);
    beast::error_code ec;
    stream.expires_after(options.timeout);
    stream.async_connect(results, [&](const beast::error_code& connectEc, const auto&) { ec = connectEc; });
    runPending(ioc);
    if (ec) {
        throw makeError(url, target, "Connection error: " + ec.message());
    }

    auto response = exchange(ioc, stream, url, target, options);
    stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
    return response;
}

Response performTls(const Url& url, const std::string& target, const RequestOptions& options) {
    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    const auto results = resolve(ioc, url, target, options.timeout);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << url.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(url, target, oss.str());
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    auto& lowestLayer = beast::get_lowest_layer(stream);
    beast::error_code ec;
    lowestLayer.expires_after(options.timeout);
    lowestLayer.async_connect(results, [&](const beast::error_code& connectEc, const auto&) { ec = connectEc; });
    runPending(ioc);
    if (ec) {
        throw makeError(url, target, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(options.timeout);
    stream.async_handshake(ssl::stream_base::client, [&](const beast::error_code& handshakeEc) { ec = handshakeEc; });
    runPending(ioc);
    if (ec) {
        throw makeError(url, target, "TLS handshake error: " + ec.message());
    }

    auto response = exchange(ioc, stream, url, target, options);

    // The body is complete at this point; a slow or truncated close_notify is not an error.
    lowestLayer.expires_after(options.timeout);
    stream.async_shutdown([&](const beast::error_code& shutdownEc) { ec = shutdownEc; });
    runPending(ioc);
    return response;
}

}  // namespace

std::string Url::origin() const {
    std::string result = scheme + "://" + host;
    const bool defaultPort = (secure() && port == "443") || (!secure() && port == "80");
    if (!defaultPort) {
        result += ':' + port;
    }
    return result;
}

Url parse_url(const std::string& url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }

    Url result{};
    result.scheme = toLower(url.substr(0, schemeEnd));
    if (result.scheme != "http" && result.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + result.scheme);
    }

    const std::string rest = url.substr(schemeEnd + 3);
    const auto slashPos = rest.find('/');
    std::string authority = slashPos == std::string::npos ? rest : rest.substr(0, slashPos);
    std::string path = slashPos == std::string::npos ? std::string{} : rest.substr(slashPos);

    if (authority.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    const auto colonPos = authority.rfind(':');
    if (colonPos != std::string::npos) {
        result.port = authority.substr(colonPos + 1);
        authority = authority.substr(0, colonPos);
        if (result.port.empty()
            || !std::all_of(result.port.begin(), result.port.end(), [](unsigned char ch) {
                   return std::isdigit(ch) != 0;
               })) {
            throw std::invalid_argument("Invalid URL port: " + url);
        }
    }
    else {
        result.port = result.secure() ? "443" : "80";
    }
    if (authority.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    result.host = authority;

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    result.basePath = path;
    return result;
}

HttpResponse http_get(const Url& url, const std::string& target, const RequestOptions& options) {
    if (url.host.empty()) {
        throw std::invalid_argument("HTTP GET requires a non-empty host");
    }
    if (options.timeout.count() <= 0) {
        throw std::invalid_argument("HTTP GET timeout must be positive");
    }

    Url currentUrl = url;
    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= options.maxRedirects; ++redirectCount) {
        Response response;
        try {
            response = currentUrl.secure() ? performTls(currentUrl, currentTarget, options)
                                           : performPlain(currentUrl, currentTarget, options);
        } catch (const boost::system::system_error& ex) {
            throw makeError(currentUrl, currentTarget, ex.what());
        }

        const auto status = static_cast<unsigned>(response.result_int());
        if (isRedirect(status)) {
            const std::string location{response.base()[bhttp::field::location]};
            if (location.empty()) {
                throw makeError(currentUrl, currentTarget, "Redirect response missing Location header");
            }
            if (location.find("://") != std::string::npos) {
                Url next{};
                try {
                    next = parse_url(location);
                } catch (const std::invalid_argument& ex) {
                    throw makeError(currentUrl, currentTarget, ex.what());
                }
                if (currentUrl.secure() && !next.secure()) {
                    throw makeError(currentUrl, currentTarget, "Insecure redirect to HTTP is not supported");
                }
                const auto pathStart = location.find('/', location.find("://") + 3);
                currentTarget = pathStart == std::string::npos ? std::string{"/"} : location.substr(pathStart);
                next.basePath.clear();
                currentUrl = std::move(next);
            }
            else {
                currentTarget = location.front() == '/' ? location : "/" + location;
            }
            continue;
        }

        HttpResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = currentUrl.host;
        result.final_target = currentTarget;
        return result;
    }

    throw makeError(currentUrl, currentTarget, "Too many redirects");
}

}  // namespace mdc::infra::http
