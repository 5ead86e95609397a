#include "upstream/http_upstream_client.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace satnogsproxy {

// ============================================================================
// Construction
// ============================================================================

HttpUpstreamClient::HttpUpstreamClient(const UpstreamConfig& config)
    : network_url_(UpstreamUrl::parse(config.network_api_url)),
      db_url_(UpstreamUrl::parse(config.db_api_url)),
      timeout_(config.timeout),
      ca_cert_path_(config.ca_cert_path) {}

const UpstreamUrl& HttpUpstreamClient::url_for(ApiType api_type) const {
    return api_type == ApiType::NETWORK ? network_url_ : db_url_;
}

std::string HttpUpstreamClient::target_url(ApiType api_type, const std::string& residual_path) const {
    return url_for(api_type).base_url + residual_path;
}

// ============================================================================
// Failure Classification
// ============================================================================

TransportFailureKind HttpUpstreamClient::classify_failure(
    httplib::Error error,
    std::chrono::milliseconds elapsed,
    std::chrono::milliseconds timeout) {
    // Read/write/overall timeouts surface as plain I/O errors
    if (elapsed >= timeout) {
        return TransportFailureKind::TIMEOUT;
    }

    switch (error) {
        case httplib::Error::ConnectionTimeout:
            return TransportFailureKind::TIMEOUT;

        case httplib::Error::Read:
        case httplib::Error::Write:
        case httplib::Error::Connection:
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLServerVerification:
        case httplib::Error::SSLServerHostnameVerification:
        case httplib::Error::ProxyConnection:
        case httplib::Error::Canceled:
            return TransportFailureKind::UNREACHABLE;

        default:
            return TransportFailureKind::OTHER;
    }
}

// ============================================================================
// Dispatch
// ============================================================================

UpstreamOutcome HttpUpstreamClient::get(
    ApiType api_type,
    const std::string& residual_path,
    const QueryParams& query) {
    const auto& url = url_for(api_type);
    const utils::Timer timer;

    try {
        httplib::Client cli(url.scheme_host());
        cli.set_connection_timeout(timeout_);
        cli.set_read_timeout(timeout_);
        cli.set_write_timeout(timeout_);
        cli.set_max_timeout(timeout_);   // whole call, including a slow body
        cli.set_follow_location(true);
        if (!ca_cert_path_.empty()) {
            cli.set_ca_cert_path(ca_cert_path_.c_str());
        }

        const httplib::Params params(query.begin(), query.end());
        const httplib::Headers headers = {
            {http::kAcceptHeader, http::kJsonContentType}
        };

        auto res = cli.Get(url.target_path(residual_path), params, headers);

        if (!res) {
            const auto err = res.error();
            const auto elapsed = timer.elapsed_ms();
            return TransportFailure{
                classify_failure(err, elapsed, timeout_),
                std::format("{} after {}ms", httplib::to_string(err), elapsed.count())};
        }

        UpstreamResponse response;
        response.status = res->status;
        // Repeated fields (several Link headers) are joined with ", "
        for (const auto& [name, value] : res->headers) {
            const auto [it, inserted] = response.headers.emplace(utils::to_lower(name), value);
            if (!inserted) {
                it->second += ", ";
                it->second += value;
            }
        }
        response.body = std::move(res->body);
        return response;
    } catch (const std::exception& e) {
        return TransportFailure{TransportFailureKind::OTHER, e.what()};
    }
}

} // namespace satnogsproxy
