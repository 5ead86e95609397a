#pragma once

#include "core/types.hpp"

#include <string_view>

namespace satnogsproxy {

/**
 * @brief Maps an inbound path to an upstream API and residual path
 *
 * Pure function of the path. Empty segments are dropped, so repeated and
 * trailing slashes are tolerated:
 *
 *   /api/network/observations   -> NETWORK, "/observations"
 *   //api/db/stations/123/      -> DB, "/stations/123"
 *   /api/network                -> invalid (fewer than 3 segments)
 *   /api/foo/bar                -> invalid (unsupported API type)
 */
class Router {
public:
    [[nodiscard]] static RouteDecision route(std::string_view path);

    static constexpr std::string_view kApiPrefix = "api";
    static constexpr size_t kMinSegments = 3;
};

} // namespace satnogsproxy
