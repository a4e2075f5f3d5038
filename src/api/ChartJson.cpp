#include "api/ChartJson.hpp"

#include <string>
#include <utility>

#include <boost/json/array.hpp>

#include "common/Time.hpp"

namespace mdc::api {

boost::json::object chart_to_json(const domain::ChartResponse& chart) {
    boost::json::array candles;
    candles.reserve(chart.candles.size());
    for (const auto& candle : chart.candles) {
        boost::json::object row;
        row["time"] = candle.time;
        row["open"] = candle.open;
        row["high"] = candle.high;
        row["low"] = candle.low;
        row["close"] = candle.close;
        row["volume"] = candle.volume;
        candles.emplace_back(std::move(row));
    }

    const auto label = domain::timeframeLabel(chart.timeframe);

    boost::json::object payload;
    payload["pair"] = chart.pair;
    payload["timeframe"] = boost::json::string_view{label.data(), label.size()};
    payload["granularitySeconds"] = chart.bucketWidthSeconds;
    payload["updatedAt"] = common::time::formatIso8601Utc(chart.generatedAt);
    payload["source"] = chart.source;
    payload["candles"] = std::move(candles);
    return payload;
}

}  // namespace mdc::api
