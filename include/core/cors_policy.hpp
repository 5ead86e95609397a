#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace satnogsproxy {

/**
 * @brief Computes the CORS headers attached to every response
 *
 * Allow-Origin is "*" in development mode; otherwise the configured origin,
 * or "*" when none is configured.
 */
class CorsPolicy {
public:
    explicit CorsPolicy(const CorsConfig& config);

    [[nodiscard]] const std::string& allowed_origin() const { return allowed_origin_; }

    // Allow-Origin, Allow-Headers, Allow-Methods (preflight responses)
    [[nodiscard]] HeaderMap base_headers() const;

    // base_headers() + Access-Control-Expose-Headers listing the defaults
    // followed by extra_exposed
    [[nodiscard]] HeaderMap response_headers(
        const std::vector<std::string>& extra_exposed = {}) const;

    static constexpr const char* kAllowHeaders = "Content-Type, Accept";
    static constexpr const char* kAllowMethods = "GET, OPTIONS";

    [[nodiscard]] static const std::vector<std::string>& default_exposed_headers();

private:
    const std::string allowed_origin_;
};

} // namespace satnogsproxy
