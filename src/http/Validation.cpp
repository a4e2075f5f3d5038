#include "http/Validation.hpp"

#include "domain/Errors.hpp"

namespace mdc::http::validation {

domain::Timeframe timeframe_from_query(const std::optional<std::string>& raw) {
    if (!raw || raw->empty()) {
        return domain::kDefaultTimeframe;
    }
    return domain::parseTimeframe(*raw);
}

}  // namespace mdc::http::validation
