#pragma once

#include <functional>
#include <map>
#include <string>

#include "api/Controllers.hpp"

namespace mdc::core {
class ChartService;
}

namespace mdc::api {

class Router {
public:
    explicit Router(core::ChartService& chartService);

    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;

    std::map<std::string, Handler> routes_;
};

}  // namespace mdc::api
