#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace mdc::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint16_t parsePort(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto portValue = std::stoul(value, &consumed);
        if (consumed != value.size() || portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port: " + value);
    }
}

std::size_t parseThreads(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed == 0U) {
            throw std::out_of_range("threads must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid thread count: " + value);
    }
}

std::uint32_t parseTimeoutSec(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("timeout out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::string parseBaseUrl(const std::string& value, const std::string& label) {
    auto url = trim(value);
    const auto lowered = toLower(url);
    if (lowered.rfind("http://", 0) != 0 && lowered.rfind("https://", 0) != 0) {
        throw std::runtime_error("Invalid value for " + label + " (expected http:// or https://): " + value);
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string parseNonEmpty(const std::string& value, const std::string& label) {
    auto trimmed = trim(value);
    if (trimmed.empty()) {
        throw std::runtime_error("Empty value for " + label);
    }
    return trimmed;
}

mdc::log::Level parseLogLevel(const std::string& value, const std::string& label) {
    try {
        return mdc::log::levelFromString(toLower(value));
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value: " + value);
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envPort = std::getenv("PORT")) {
        config.port = parsePort(envPort);
    }
    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = parseLogLevel(envLogLevel, "LOG_LEVEL");
    }
    if (const char* envBaseUrl = std::getenv("COINGECKO_BASE_URL")) {
        if (!trim(envBaseUrl).empty()) {
            config.upstreamBaseUrl = parseBaseUrl(envBaseUrl, "COINGECKO_BASE_URL");
        }
    }
    if (const char* envCoinId = std::getenv("COINGECKO_COIN_ID")) {
        if (!trim(envCoinId).empty()) {
            config.coinId = trim(envCoinId);
        }
    }
    if (const char* envTimeout = std::getenv("UPSTREAM_TIMEOUT_SEC")) {
        config.upstreamTimeoutSec = parseTimeoutSec(envTimeout, "UPSTREAM_TIMEOUT_SEC");
    }

    if (auto portArg = valueFromArgs(argc, argv, "--port"); !portArg.empty()) {
        config.port = parsePort(portArg);
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLogLevel(levelArg, "--log-level");
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--threads"); !threadsArg.empty()) {
        config.threads = parseThreads(threadsArg);
    }
    if (auto baseUrlArg = valueFromArgs(argc, argv, "--upstream-base-url"); !baseUrlArg.empty()) {
        config.upstreamBaseUrl = parseBaseUrl(baseUrlArg, "--upstream-base-url");
    }
    if (auto coinArg = valueFromArgs(argc, argv, "--coin-id"); !coinArg.empty()) {
        config.coinId = parseNonEmpty(coinArg, "--coin-id");
    }
    if (auto pairArg = valueFromArgs(argc, argv, "--pair"); !pairArg.empty()) {
        config.pairLabel = parseNonEmpty(pairArg, "--pair");
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--upstream-timeout-sec"); !timeoutArg.empty()) {
        config.upstreamTimeoutSec = parseTimeoutSec(timeoutArg, "--upstream-timeout-sec");
    }
    if (auto corsEnableArg = valueFromArgs(argc, argv, "--http.cors.enable"); !corsEnableArg.empty()) {
        config.httpCorsEnable = parseBool(corsEnableArg);
    }
    if (auto corsOriginArg = valueFromArgs(argc, argv, "--http.cors.origin"); !corsOriginArg.empty()) {
        config.httpCorsOrigin = trim(corsOriginArg);
    }
    if (auto timeframeArg = valueFromArgs(argc, argv, "--timeframe"); !timeframeArg.empty()) {
        config.timeframe = trim(timeframeArg);
    }

    return config;
}

}  // namespace mdc::common
