#pragma once

#include "config/config_types.hpp"
#include "core/response_translator.hpp"
#include "core/types.hpp"
#include "upstream/iupstream_client.hpp"

#include <memory>

namespace satnogsproxy {

/**
 * @brief Per-request decision pipeline
 *
 *   method gate -> router -> upstream dispatch -> response translation
 *
 * Holds only immutable configuration and a stateless upstream client, so
 * handle() may run concurrently on any number of threads. handle() never
 * throws; every branch produces a complete response with CORS headers.
 */
class ProxyHandler {
public:
    ProxyHandler(const ProxyConfig& config, std::shared_ptr<IUpstreamClient> upstream);

    [[nodiscard]] OutboundResponse handle(const InboundRequest& request) const;

    [[nodiscard]] const ResponseTranslator& translator() const { return translator_; }

private:
    [[nodiscard]] OutboundResponse dispatch(
        const InboundRequest& request, const RouteDecision& route) const;

    std::shared_ptr<IUpstreamClient> upstream_;
    const ResponseTranslator translator_;
};

} // namespace satnogsproxy
