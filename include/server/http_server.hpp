#pragma once

#include "config/config_types.hpp"
#include "core/proxy_handler.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace satnogsproxy {

/**
 * @brief HTTP front end for the proxy
 *
 * Every path and every common method is routed to ProxyHandler; the
 * handler decides what is allowed. Responses httplib generates on its own
 * (unroutable methods, malformed requests) are given CORS headers and a
 * JSON message by the error handler.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<const ProxyHandler> handler, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Create the listening socket
     * @return Bound port (server.port = 0 picks an ephemeral port)
     * @throws std::runtime_error if the address cannot be bound
     */
    int bind();

    // Serve until stop(). Requires bind().
    void listen();

    // bind() + listen()
    void start();
    void stop();

    [[nodiscard]] bool is_running() const;
    void wait_until_ready() const;

    // ── Conversions between httplib and proxy records ───────────────────
    [[nodiscard]] static InboundRequest to_inbound(const httplib::Request& req);
    static void write_response(const OutboundResponse& out, httplib::Response& res);

private:
    void register_routes(httplib::Server& svr);
    void handle_request(const httplib::Request& req, httplib::Response& res) const;

    std::shared_ptr<const ProxyHandler> handler_;
    const ServerConfig config_;
    std::unique_ptr<httplib::Server> svr_;
    int bound_port_ = -1;
};

} // namespace satnogsproxy
