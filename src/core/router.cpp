#include "core/router.hpp"
#include "core/utils.hpp"

#include <format>

namespace satnogsproxy {

RouteDecision Router::route(std::string_view path) {
    const auto segments = utils::split_non_empty(path, '/');

    if (segments.size() < kMinSegments || segments[0] != kApiPrefix) {
        return RouteDecision::invalid(
            "Not Found: Invalid API path structure. Expected /api/network/... or /api/db/...");
    }

    const std::string& type_name = segments[1];
    const auto api_type = parse_api_type(type_name);
    if (!api_type) {
        return RouteDecision::invalid(std::format(
            "Not Found: API type '{}' is not supported. Use 'network' or 'db'.", type_name));
    }

    std::string residual;
    for (size_t i = 2; i < segments.size(); ++i) {
        residual += '/';
        residual += segments[i];
    }
    return RouteDecision::route(*api_type, std::move(residual));
}

} // namespace satnogsproxy
