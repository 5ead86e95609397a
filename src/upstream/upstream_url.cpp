#include "upstream/upstream_url.hpp"

#include <charconv>
#include <format>
#include <stdexcept>

namespace satnogsproxy {

std::string UpstreamUrl::scheme_host() const {
    return std::format("{}{}:{}", use_ssl ? "https://" : "http://", host, port);
}

UpstreamUrl UpstreamUrl::parse(const std::string& url) {
    UpstreamUrl result;
    result.base_url = url;

    std::string rest = url;
    if (rest.starts_with("https://")) {
        result.use_ssl = true;
        result.port = 443;
        rest = rest.substr(8);
    } else if (rest.starts_with("http://")) {
        result.use_ssl = false;
        result.port = 80;
        rest = rest.substr(7);
    } else {
        throw std::invalid_argument(std::format("Upstream URL must start with http:// or https://: '{}'", url));
    }

    const auto path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        result.host = rest.substr(0, path_pos);
        result.path_prefix = rest.substr(path_pos);
    } else {
        result.host = rest;
    }

    while (!result.path_prefix.empty() && result.path_prefix.back() == '/') {
        result.path_prefix.pop_back();
    }

    // Check for explicit port
    const auto port_pos = result.host.find(':');
    if (port_pos != std::string::npos) {
        const std::string port_str = result.host.substr(port_pos + 1);
        int port = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port < 1 || port > 65535) {
            throw std::invalid_argument(std::format("Invalid port in upstream URL: '{}'", url));
        }
        result.port = port;
        result.host = result.host.substr(0, port_pos);
    }

    if (result.host.empty()) {
        throw std::invalid_argument(std::format("Upstream URL has no host: '{}'", url));
    }

    return result;
}

} // namespace satnogsproxy
