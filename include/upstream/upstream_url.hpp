#pragma once

#include <string>

namespace satnogsproxy {

/**
 * @brief Base URL of an upstream API split for httplib::Client
 *
 * "https://network.satnogs.org/api" ->
 *   scheme_host = "https://network.satnogs.org:443", path_prefix = "/api"
 *
 * The prefix never ends with '/', so prefix + residual ("/observations")
 * reproduces base + residual exactly.
 */
struct UpstreamUrl {
    std::string base_url;       // As configured
    std::string host;
    int port = 443;
    bool use_ssl = true;
    std::string path_prefix;    // "" or "/api"

    [[nodiscard]] std::string scheme_host() const;

    [[nodiscard]] std::string target_path(const std::string& residual) const {
        return path_prefix + residual;
    }

    /**
     * @throws std::invalid_argument if the URL has no http(s) scheme, no host
     *         or an invalid port
     */
    [[nodiscard]] static UpstreamUrl parse(const std::string& url);
};

} // namespace satnogsproxy
