#include "core/proxy_handler.hpp"
#include "core/router.hpp"
#include "core/utils.hpp"
#include "server/http_constants.hpp"

#include <format>
#include <stdexcept>

namespace satnogsproxy {

namespace {

std::string format_query(const QueryParams& query) {
    if (query.empty()) return "{}";
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : query) {
        if (!first) out += ", ";
        first = false;
        out += std::format("{}={}", key, value);
    }
    out += "}";
    return out;
}

} // anonymous namespace

ProxyHandler::ProxyHandler(const ProxyConfig& config, std::shared_ptr<IUpstreamClient> upstream)
    : upstream_(std::move(upstream)),
      translator_(CorsPolicy(config.cors)) {
    if (!upstream_) {
        throw std::invalid_argument("ProxyHandler requires an upstream client");
    }
}

OutboundResponse ProxyHandler::handle(const InboundRequest& request) const {
    // ── Method gate ─────────────────────────────────────────────────────
    if (request.method == http::kMethodOptions) {
        utils::log::debug(std::format("Preflight request for {}", request.path));
        return translator_.preflight();
    }

    if (request.method != http::kMethodGet) {
        utils::log::info(std::format("Unsupported method: {} {}", request.method, request.path));
        return translator_.json_error(405, std::format("Method {} Not Allowed", request.method));
    }

    // ── Routing ─────────────────────────────────────────────────────────
    const auto route = Router::route(request.path);
    if (!route.is_valid()) {
        utils::log::info(std::format("Rejected path {}: {}", request.path, route.error_message));
        return translator_.json_error(404, route.error_message);
    }

    return dispatch(request, route);
}

OutboundResponse ProxyHandler::dispatch(
    const InboundRequest& request, const RouteDecision& route) const {
    const ApiType api_type = *route.api_type;

    try {
        utils::log::debug(std::format("Proxying [{}] request to: {} with params: {}",
            api_type_to_string(api_type),
            upstream_->target_url(api_type, route.residual_path),
            format_query(request.query)));

        const auto outcome = upstream_->get(api_type, route.residual_path, request.query);

        if (const auto* failure = std::get_if<TransportFailure>(&outcome)) {
            utils::log::error(std::format("Upstream request for {} failed ({}): {}",
                request.path, transport_failure_to_string(failure->kind), failure->detail));
        } else {
            const auto& upstream = std::get<UpstreamResponse>(outcome);
            utils::log::debug(std::format("SatNOGS response status: {}, Content-Type: {}",
                upstream.status, upstream.header("content-type").value_or("<none>")));
            if (upstream.status >= 400) {
                utils::log::warn(std::format("SatNOGS returned error status {} for {}",
                    upstream.status, upstream_->target_url(api_type, route.residual_path)));
            }
        }

        return translator_.translate(outcome, api_type, request.path);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Error proxying {}: {}", request.path, e.what()));
        return translator_.from_failure(
            TransportFailure{TransportFailureKind::OTHER, e.what()}, request.path);
    }
}

} // namespace satnogsproxy
