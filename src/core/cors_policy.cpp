#include "core/cors_policy.hpp"
#include "server/http_constants.hpp"

namespace satnogsproxy {

namespace {

std::string resolve_allowed_origin(const CorsConfig& config) {
    if (config.mode == DeploymentMode::DEVELOPMENT) return "*";
    return config.allowed_origin.empty() ? std::string("*") : config.allowed_origin;
}

} // anonymous namespace

CorsPolicy::CorsPolicy(const CorsConfig& config)
    : allowed_origin_(resolve_allowed_origin(config)) {}

const std::vector<std::string>& CorsPolicy::default_exposed_headers() {
    static const std::vector<std::string> defaults = {"Content-Length", "Content-Type"};
    return defaults;
}

HeaderMap CorsPolicy::base_headers() const {
    return {
        {http::kAllowOriginHeader, allowed_origin_},
        {http::kAllowHeadersHeader, kAllowHeaders},
        {http::kAllowMethodsHeader, kAllowMethods},
    };
}

HeaderMap CorsPolicy::response_headers(const std::vector<std::string>& extra_exposed) const {
    auto headers = base_headers();

    std::string exposed;
    const auto append = [&exposed](const std::string& name) {
        if (!exposed.empty()) exposed += ", ";
        exposed += name;
    };
    for (const auto& name : default_exposed_headers()) append(name);
    for (const auto& name : extra_exposed) append(name);

    headers.emplace(http::kExposeHeadersHeader, std::move(exposed));
    return headers;
}

} // namespace satnogsproxy
