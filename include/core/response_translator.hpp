#pragma once

#include "core/cors_policy.hpp"
#include "core/types.hpp"

#include <string>

namespace satnogsproxy {

/**
 * @brief Turns an upstream outcome (or a local decision) into the
 *        browser-facing response
 *
 * All responses carry the CORS headers from CorsPolicy. Error bodies are
 * JSON objects with a "message" field; upstream 4xx/5xx additionally carry
 * "upstreamStatus". Transport failure detail is never put in a body.
 */
class ResponseTranslator {
public:
    explicit ResponseTranslator(CorsPolicy cors);

    [[nodiscard]] OutboundResponse translate(
        const UpstreamOutcome& outcome,
        ApiType api_type,
        const std::string& inbound_path) const;

    [[nodiscard]] OutboundResponse from_failure(
        const TransportFailure& failure, const std::string& inbound_path) const;

    [[nodiscard]] OutboundResponse from_upstream_error(
        const UpstreamResponse& upstream, ApiType api_type) const;

    [[nodiscard]] OutboundResponse from_upstream_success(
        const UpstreamResponse& upstream) const;

    // 204, no body, base CORS headers only
    [[nodiscard]] OutboundResponse preflight() const;

    // {"message": message} with CORS + Content-Type: application/json
    [[nodiscard]] OutboundResponse json_error(int status, const std::string& message) const;

    [[nodiscard]] static std::string upstream_error_message(int status, ApiType api_type);

    [[nodiscard]] static bool is_json_content_type(const std::string& content_type);

    [[nodiscard]] const CorsPolicy& cors() const { return cors_; }

private:
    const CorsPolicy cors_;
};

} // namespace satnogsproxy
