#include "core/response_translator.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace satnogsproxy {

ResponseTranslator::ResponseTranslator(CorsPolicy cors)
    : cors_(std::move(cors)) {}

// ============================================================================
// Helpers
// ============================================================================

std::string ResponseTranslator::upstream_error_message(int status, ApiType api_type) {
    if (status == 404) {
        return std::format("Not Found: The requested resource was not found on the SatNOGS {} API.",
                           api_type_to_string(api_type));
    }
    if (status == 401 || status == 403) {
        return std::format("Unauthorized: Access denied by SatNOGS {} API.",
                           api_type_to_string(api_type));
    }
    return std::format("Error fetching data from SatNOGS. Status: {}.", status);
}

bool ResponseTranslator::is_json_content_type(const std::string& content_type) {
    return utils::to_lower(content_type).find(http::kJsonMediaType) != std::string::npos;
}

OutboundResponse ResponseTranslator::json_error(int status, const std::string& message) const {
    OutboundResponse out;
    out.status = status;
    out.headers = cors_.response_headers();
    out.content_type = http::kJsonContentType;
    out.body = nlohmann::ordered_json{{"message", message}}.dump();
    return out;
}

OutboundResponse ResponseTranslator::preflight() const {
    OutboundResponse out;
    out.status = 204;
    out.headers = cors_.base_headers();
    return out;
}

// ============================================================================
// Translation
// ============================================================================

OutboundResponse ResponseTranslator::translate(
    const UpstreamOutcome& outcome,
    ApiType api_type,
    const std::string& inbound_path) const {
    if (const auto* failure = std::get_if<TransportFailure>(&outcome)) {
        return from_failure(*failure, inbound_path);
    }

    const auto& upstream = std::get<UpstreamResponse>(outcome);
    if (upstream.status >= 400) {
        return from_upstream_error(upstream, api_type);
    }
    return from_upstream_success(upstream);
}

OutboundResponse ResponseTranslator::from_failure(
    const TransportFailure& failure, const std::string& inbound_path) const {
    switch (failure.kind) {
        case TransportFailureKind::TIMEOUT:
            return json_error(504, std::format(
                "Gateway Timeout: No timely response from SatNOGS API for {}.", inbound_path));
        case TransportFailureKind::UNREACHABLE:
            return json_error(502, std::format(
                "Bad Gateway: Error communicating with SatNOGS API for {}.", inbound_path));
        case TransportFailureKind::OTHER:
            break;
    }
    return json_error(500, std::format(
        "Internal Server Error processing the request for {}.", inbound_path));
}

OutboundResponse ResponseTranslator::from_upstream_error(
    const UpstreamResponse& upstream, ApiType api_type) const {
    OutboundResponse out;
    out.status = upstream.status;
    out.headers = cors_.response_headers();
    out.content_type = http::kJsonContentType;
    out.body = nlohmann::ordered_json{
        {"message", upstream_error_message(upstream.status, api_type)},
        {"upstreamStatus", upstream.status}
    }.dump();
    return out;
}

OutboundResponse ResponseTranslator::from_upstream_success(const UpstreamResponse& upstream) const {
    OutboundResponse out;
    out.status = upstream.status;

    const auto link = upstream.header("link");
    if (link) {
        out.headers = cors_.response_headers({http::kLinkHeader});
        out.headers.emplace(http::kLinkHeader, *link);
    } else {
        out.headers = cors_.response_headers();
    }

    const auto content_type = upstream.header("content-type");
    out.content_type = content_type.value_or(http::kOctetStreamContentType);

    if (!content_type || !is_json_content_type(*content_type) || upstream.body.empty()) {
        out.body = upstream.body;
        return out;
    }

    // Re-serialize; ordered_json keeps the upstream key order
    const auto parsed = nlohmann::ordered_json::parse(upstream.body, nullptr, false);
    if (parsed.is_discarded()) {
        utils::log::warn(std::format(
            "Upstream body labelled '{}' is not valid JSON ({} bytes), passing through unchanged",
            *content_type, upstream.body.size()));
        out.body = upstream.body;
        return out;
    }
    out.body = parsed.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    out.content_type = http::kJsonContentType;
    return out;
}

} // namespace satnogsproxy
