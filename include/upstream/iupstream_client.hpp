#pragma once

#include "core/types.hpp"

#include <string>

namespace satnogsproxy {

/**
 * @brief Abstract upstream dispatcher
 *
 * Issues one GET per call. Every HTTP status is returned as an
 * UpstreamResponse; only transport problems produce a TransportFailure.
 * Implementations must not keep per-request state between calls.
 */
class IUpstreamClient {
public:
    virtual ~IUpstreamClient() = default;

    [[nodiscard]] virtual UpstreamOutcome get(
        ApiType api_type,
        const std::string& residual_path,
        const QueryParams& query) = 0;

    // Full URL the call would target (for logging)
    [[nodiscard]] virtual std::string target_url(
        ApiType api_type, const std::string& residual_path) const = 0;
};

} // namespace satnogsproxy
