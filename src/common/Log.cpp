#include "common/Log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "common/Time.hpp"

namespace mdc::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_outputMutex;
Sink g_sink;

// Warnings and errors go to stderr, everything else to stdout.
std::ostream& defaultStream(Level level) {
    return level >= Level::Warn ? std::cerr : std::cout;
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_outputMutex);
    g_sink = std::move(sink);
}

void log(Level level, const std::string& message) {
    std::ostringstream threadIdStream;
    threadIdStream << std::this_thread::get_id();

    std::ostringstream line;
    line << '[' << common::time::formatLogTimestamp(std::chrono::system_clock::now()) << "] ["
         << levelToString(level) << "] [thread " << threadIdStream.str() << "] " << message;

    std::lock_guard<std::mutex> lock(g_outputMutex);
    if (g_sink) {
        g_sink(level, line.str());
        return;
    }
    defaultStream(level) << line.str() << std::endl;
}

const char* levelToString(Level level) noexcept {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Info:
        break;
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    struct Alias {
        const char* name;
        Level level;
    };
    static constexpr Alias kAliases[] = {
        {"debug", Level::Debug}, {"info", Level::Info},   {"warn", Level::Warn},
        {"warning", Level::Warn}, {"err", Level::Error}, {"error", Level::Error},
    };

    std::string lower;
    lower.reserve(text.size());
    for (const char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    for (const auto& alias : kAliases) {
        if (lower == alias.name) {
            return alias.level;
        }
    }
    throw std::invalid_argument("Unknown log level: " + std::string{text});
}

}  // namespace mdc::log
