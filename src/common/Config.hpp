#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace mdc::common {

inline constexpr char kDefaultUpstreamBaseUrl[] = "https://api.coingecko.com/api/v3";
inline constexpr char kDefaultCoinId[] = "keeta";
inline constexpr char kDefaultPairLabel[] = "KTA/USDT";

struct Config {
    std::uint16_t port = 8080;
    mdc::log::Level logLevel = mdc::log::Level::Info;
    std::size_t threads = 4;

    std::string upstreamBaseUrl = kDefaultUpstreamBaseUrl;
    std::string coinId = kDefaultCoinId;
    std::string pairLabel = kDefaultPairLabel;
    std::uint32_t upstreamTimeoutSec = 10;

    bool httpCorsEnable = true;
    std::string httpCorsOrigin = "*";

    std::string timeframe = "1D";

    static Config fromArgs(int argc, char** argv);
};

}  // namespace mdc::common
