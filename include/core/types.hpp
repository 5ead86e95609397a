#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace satnogsproxy {

// ============================================================================
// Basic Enums
// ============================================================================

enum class ApiType : uint8_t {
    NETWORK,
    DB
};

[[nodiscard]] inline constexpr const char* api_type_to_string(ApiType type) {
    switch (type) {
        case ApiType::NETWORK: return "network";
        case ApiType::DB:      return "db";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<ApiType> parse_api_type(std::string_view name) {
    if (name == "network") return ApiType::NETWORK;
    if (name == "db") return ApiType::DB;
    return std::nullopt;
}

enum class TransportFailureKind : uint8_t {
    TIMEOUT,        // No response within the upstream timeout
    UNREACHABLE,    // Request attempted, no usable response (refused, DNS, TLS, reset)
    OTHER           // Anything unclassified
};

[[nodiscard]] inline constexpr const char* transport_failure_to_string(TransportFailureKind kind) {
    switch (kind) {
        case TransportFailureKind::TIMEOUT:     return "timeout";
        case TransportFailureKind::UNREACHABLE: return "unreachable";
        case TransportFailureKind::OTHER:       return "other";
    }
    return "unknown";
}

enum class DeploymentMode : uint8_t {
    PRODUCTION,
    DEVELOPMENT
};

// Header name -> value. Names keep the spelling they are emitted with.
using HeaderMap = std::map<std::string, std::string>;

// Query parameters. Repeated keys are not supported (first occurrence wins).
using QueryParams = std::map<std::string, std::string>;

// ============================================================================
// Request / Response Records
// ============================================================================

/**
 * @brief Normalized inbound request as delivered by the hosting server
 */
struct InboundRequest {
    std::string method;
    std::string path;
    QueryParams query;
};

/**
 * @brief Result of routing an inbound path
 *
 * Either a route (api_type + residual path) or an invalid path with the
 * 404 message to return.
 */
struct RouteDecision {
    std::optional<ApiType> api_type;  // nullopt = invalid
    std::string residual_path;        // "/observations", "/stations/123"
    std::string error_message;        // Set when invalid

    [[nodiscard]] bool is_valid() const { return api_type.has_value(); }

    static RouteDecision route(ApiType type, std::string residual) {
        RouteDecision d;
        d.api_type = type;
        d.residual_path = std::move(residual);
        return d;
    }

    static RouteDecision invalid(std::string message) {
        RouteDecision d;
        d.error_message = std::move(message);
        return d;
    }
};

/**
 * @brief Upstream returned an HTTP response (any status)
 *
 * Header names are lower-cased on ingestion.
 */
struct UpstreamResponse {
    int status = 0;
    HeaderMap headers;
    std::string body;

    [[nodiscard]] std::optional<std::string> header(std::string_view lower_name) const {
        const auto it = headers.find(std::string(lower_name));
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @brief Upstream could not be reached or did not answer in time
 *
 * detail is diagnostic text for the log, never sent to the caller.
 */
struct TransportFailure {
    TransportFailureKind kind = TransportFailureKind::OTHER;
    std::string detail;
};

using UpstreamOutcome = std::variant<UpstreamResponse, TransportFailure>;

/**
 * @brief Response handed back to the hosting server
 *
 * content_type is kept apart from headers because the server writes it
 * together with the body. Empty content_type = no Content-Type header.
 */
struct OutboundResponse {
    int status = 200;
    HeaderMap headers;
    std::string content_type;
    std::string body;

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const {
        const auto it = headers.find(name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

} // namespace satnogsproxy
