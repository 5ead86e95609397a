#pragma once

#include "config/config_types.hpp"
#include "upstream/iupstream_client.hpp"
#include "upstream/upstream_url.hpp"

#include <chrono>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
enum class Error;
}

namespace satnogsproxy {

/**
 * @brief Upstream dispatcher backed by cpp-httplib
 *
 * A fresh httplib::Client is created per call, so concurrent requests share
 * nothing but the immutable base URLs and timeout. The timeout bounds the
 * whole call as well as each connect/read/write step. Every request carries
 * "Accept: application/json"; redirects are followed.
 */
class HttpUpstreamClient : public IUpstreamClient {
public:
    /**
     * @throws std::invalid_argument if a base URL cannot be parsed
     */
    explicit HttpUpstreamClient(const UpstreamConfig& config);

    [[nodiscard]] UpstreamOutcome get(
        ApiType api_type,
        const std::string& residual_path,
        const QueryParams& query) override;

    [[nodiscard]] std::string target_url(
        ApiType api_type, const std::string& residual_path) const override;

    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

    /**
     * @brief Map an httplib transport error to the proxy's failure kinds
     *
     * Any error raised once the call has run for the full timeout is a
     * timeout, whatever httplib reports.
     */
    [[nodiscard]] static TransportFailureKind classify_failure(
        httplib::Error error,
        std::chrono::milliseconds elapsed,
        std::chrono::milliseconds timeout);

private:
    [[nodiscard]] const UpstreamUrl& url_for(ApiType api_type) const;

    const UpstreamUrl network_url_;
    const UpstreamUrl db_url_;
    const std::chrono::milliseconds timeout_;
    const std::string ca_cert_path_;
};

} // namespace satnogsproxy
