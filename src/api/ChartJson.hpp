#pragma once

#include <boost/json/object.hpp>

#include "domain/Models.hpp"

namespace mdc::api {

// {pair, timeframe, granularitySeconds, updatedAt, source, candles: [{time, open, high, low, close, volume}]}
boost::json::object chart_to_json(const domain::ChartResponse& chart);

}  // namespace mdc::api
