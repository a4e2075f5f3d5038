#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "api/Router.hpp"

namespace mdc::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

class HttpServer {
public:
    struct CorsConfig {
        bool enabled{false};
        std::string origin;
    };

    HttpServer(Endpoint endpoint, std::size_t threadCount, const Router& router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();
    void stop();
    void wait();

    void setCorsConfig(CorsConfig config);

private:
    // Bounds how long a worker waits on a silent client.
    static constexpr std::chrono::seconds kClientReadTimeout{15};
    static constexpr std::size_t kMaxRequestHeadBytes = 8192;

    void workerLoop(std::size_t workerId);
    void handleClient(int clientFd);

    Endpoint endpoint_;
    std::size_t threadCount_;
    const Router& router_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    int serverFd_ = -1;
    CorsConfig corsConfig_{};
};

}  // namespace mdc::api
