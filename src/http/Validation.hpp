#pragma once

#include <optional>
#include <string>

#include "domain/Timeframe.hpp"

namespace mdc::http::validation {

// Absent or empty selects the default timeframe; matching is case-insensitive.
// Throws domain::InvalidTimeframe for any other value.
domain::Timeframe timeframe_from_query(const std::optional<std::string>& raw);

}  // namespace mdc::http::validation
