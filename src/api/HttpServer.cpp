#include "api/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"

namespace mdc::api {

namespace {

// Closes the descriptor on scope exit unless ownership was released.
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    int release() { return std::exchange(fd_, -1); }

private:
    int fd_;
};

std::runtime_error socketError(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}

sockaddr_in makeListenAddress(const Endpoint& endpoint) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);
    if (endpoint.address.empty() || endpoint.address == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
    else if (::inet_pton(AF_INET, endpoint.address.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + endpoint.address);
    }
    return addr;
}

// Reads until the blank line that ends the request head, EOF, timeout or the size cap.
std::string readRequestHead(int clientFd, std::size_t maxBytes) {
    std::string head;
    char chunk[1024];
    while (head.find("\r\n\r\n") == std::string::npos && head.size() <= maxBytes) {
        const auto received = ::recv(clientFd, chunk, sizeof(chunk), 0);
        if (received <= 0) {
            break;
        }
        head.append(chunk, static_cast<std::size_t>(received));
    }
    return head;
}

// Only the request line matters here: "METHOD target HTTP/x.y".
Request parseRequestLine(const std::string& head) {
    Request request{};
    const auto lineEnd = head.find("\r\n");
    std::istringstream line(head.substr(0, lineEnd));
    line >> request.method >> request.target >> request.version;

    const auto queryPos = request.target.find('?');
    request.path = request.target.substr(0, queryPos);
    if (queryPos != std::string::npos) {
        request.query = request.target.substr(queryPos + 1);
    }
    return request;
}

std::string renderResponse(const Response& response, const HttpServer::CorsConfig& cors) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.statusCode << ' ' << response.statusText << "\r\n"
        << "Content-Type: " << (response.contentType.empty() ? "application/json" : response.contentType) << "\r\n";
    for (const auto& [name, value] : response.headers) {
        if (!name.empty()) {
            out << name << ": " << value << "\r\n";
        }
    }
    if (cors.enabled && !cors.origin.empty()) {
        out << "Access-Control-Allow-Origin: " << cors.origin << "\r\n"
            << "Access-Control-Allow-Headers: Content-Type\r\n"
            << "Vary: Origin\r\n";
    }
    out << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << response.body;
    return out.str();
}

void sendAll(int clientFd, const std::string& payload) {
    std::size_t offset = 0;
    while (offset < payload.size()) {
        const auto sent = ::send(clientFd, payload.data() + offset, payload.size() - offset, MSG_NOSIGNAL);
        if (sent <= 0) {
            LOG_DEBUG("Client went away after " << offset << " of " << payload.size() << " bytes");
            return;
        }
        offset += static_cast<std::size_t>(sent);
    }
}

}  // namespace

HttpServer::HttpServer(Endpoint endpoint, std::size_t threadCount, const Router& router)
    : endpoint_(std::move(endpoint)), threadCount_(threadCount == 0 ? 1 : threadCount), router_(router) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setCorsConfig(CorsConfig config) { corsConfig_ = std::move(config); }

void HttpServer::start() {
    if (running_.load()) {
        return;
    }

    FdGuard listener(::socket(AF_INET, SOCK_STREAM, 0));
    if (listener.get() < 0) {
        throw socketError("Unable to create server socket");
    }

    const int reuse = 1;
    ::setsockopt(listener.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    const auto addr = makeListenAddress(endpoint_);
    if (::bind(listener.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw socketError("Unable to bind " + endpoint_.address + ':' + std::to_string(endpoint_.port));
    }
    if (::listen(listener.get(), SOMAXCONN) < 0) {
        throw socketError("Unable to listen");
    }

    serverFd_ = listener.release();
    running_.store(true);

    LOG_INFO("HTTP server listening on " << (endpoint_.address.empty() ? "0.0.0.0" : endpoint_.address) << ':'
             << endpoint_.port << " workers=" << threadCount_);

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i] { workerLoop(i); });
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Unblocks every worker parked in accept().
    ::shutdown(serverFd_, SHUT_RDWR);
    wait();
    ::close(serverFd_);
    serverFd_ = -1;
    LOG_INFO("HTTP server stopped");
}

void HttpServer::wait() {
    for (auto& worker : threads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    threads_.clear();
}

void HttpServer::workerLoop(std::size_t workerId) {
    LOG_DEBUG("Worker " << workerId << " started");

    while (running_.load()) {
        const int clientFd = ::accept(serverFd_, nullptr, nullptr);
        if (clientFd < 0) {
            if (!running_.load() || errno == EBADF || errno == EINVAL) {
                break;
            }
            if (errno != EINTR) {
                LOG_WARN("accept() failed: " << std::strerror(errno));
            }
            continue;
        }

        timeval readTimeout{};
        readTimeout.tv_sec = static_cast<decltype(readTimeout.tv_sec)>(kClientReadTimeout.count());
        ::setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &readTimeout, sizeof(readTimeout));

        handleClient(clientFd);
    }

    LOG_DEBUG("Worker " << workerId << " finished");
}

void HttpServer::handleClient(int clientFd) {
    FdGuard client(clientFd);

    const auto request = parseRequestLine(readRequestHead(client.get(), kMaxRequestHeadBytes));
    Response response{};
    if (request.method.empty() || request.path.empty()) {
        response = Response{400, "Bad Request", R"({"error":"bad_request"})", "application/json", {}};
    }
    else {
        response = router_.handle(request);
    }
    LOG_DEBUG(request.method << ' ' << request.target << " -> " << response.statusCode);

    sendAll(client.get(), renderResponse(response, corsConfig_));
    ::shutdown(client.get(), SHUT_RDWR);
}

}  // namespace mdc::api
