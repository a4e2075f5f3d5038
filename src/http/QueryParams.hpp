#pragma once

#include <optional>
#include <string>

#include "api/Controllers.hpp"

namespace mdc::http {

std::optional<std::string> opt_string(const mdc::api::Request& request, const char* key);

}  // namespace mdc::http
