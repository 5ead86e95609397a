#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace satnogsproxy {

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<const ProxyHandler> handler, ServerConfig config)
    : handler_(std::move(handler)),
      config_(std::move(config)) {
    if (!handler_) {
        throw std::invalid_argument("HttpServer requires a ProxyHandler");
    }

    if (config_.tls.enabled && !config_.tls.cert_file.empty() && !config_.tls.key_file.empty()) {
        svr_ = std::make_unique<httplib::SSLServer>(
            config_.tls.cert_file.c_str(), config_.tls.key_file.c_str());
        utils::log::info(std::format("TLS enabled: cert={}, key={}",
            config_.tls.cert_file, config_.tls.key_file));
    } else {
        svr_ = std::make_unique<httplib::Server>();
    }

    const size_t pool_size = config_.thread_pool_size;
    svr_->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(*svr_);
}

HttpServer::~HttpServer() = default;

// ============================================================================
// Conversions
// ============================================================================

InboundRequest HttpServer::to_inbound(const httplib::Request& req) {
    InboundRequest inbound;
    inbound.method = req.method;
    inbound.path = req.path;
    // emplace keeps the first value of a repeated key
    for (const auto& [key, value] : req.params) {
        inbound.query.emplace(key, value);
    }
    return inbound;
}

void HttpServer::write_response(const OutboundResponse& out, httplib::Response& res) {
    res.status = out.status;
    for (const auto& [name, value] : out.headers) {
        res.set_header(name, value);
    }
    if (!out.content_type.empty()) {
        res.set_content(out.body, out.content_type);
    } else if (!out.body.empty()) {
        res.body = out.body;
    }
}

// ============================================================================
// Request handling
// ============================================================================

void HttpServer::handle_request(const httplib::Request& req, httplib::Response& res) const {
    const utils::Timer timer;
    const auto out = handler_->handle(to_inbound(req));
    write_response(out, res);
    utils::log::debug(std::format("{} {} -> {} ({}ms)",
        req.method, req.path, out.status, timer.elapsed_ms().count()));
}

void HttpServer::register_routes(httplib::Server& svr) {
    const auto dispatch = [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(req, res);
    };

    // Method gating happens in ProxyHandler, so every method lands there
    static const std::string kAnyPath = ".*";
    svr.Get(kAnyPath, dispatch);
    svr.Options(kAnyPath, dispatch);
    svr.Post(kAnyPath, dispatch);
    svr.Put(kAnyPath, dispatch);
    svr.Patch(kAnyPath, dispatch);
    svr.Delete(kAnyPath, dispatch);

    // httplib-generated errors (no body) still need CORS + a JSON message
    svr.set_error_handler([this](const httplib::Request& /*req*/, httplib::Response& res) {
        if (!res.body.empty()) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        write_response(
            handler_->translator().json_error(res.status, httplib::status_message(res.status)),
            res);
        return httplib::Server::HandlerResponse::Handled;
    });

    svr.set_exception_handler([this](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Unhandled exception serving {}: {}", req.path, e.what()));
        }
        write_response(
            handler_->translator().from_failure(
                TransportFailure{TransportFailureKind::OTHER, "unhandled exception"}, req.path),
            res);
    });
}

// ============================================================================
// Lifecycle
// ============================================================================

int HttpServer::bind() {
    if (config_.port == 0) {
        bound_port_ = svr_->bind_to_any_port(config_.host);
    } else if (svr_->bind_to_port(config_.host, config_.port)) {
        bound_port_ = config_.port;
    } else {
        bound_port_ = -1;
    }

    if (bound_port_ < 0) {
        throw std::runtime_error(std::format("Failed to bind HTTP server to {}:{}",
            config_.host, config_.port));
    }
    return bound_port_;
}

void HttpServer::listen() {
    if (bound_port_ < 0) {
        throw std::runtime_error("HttpServer::listen() called before bind()");
    }

    utils::log::info(std::format("Starting SatNOGS Proxy on {}:{} ({}, {} threads)",
        config_.host, bound_port_, config_.tls.enabled ? "HTTPS" : "HTTP",
        config_.thread_pool_size));

    if (!svr_->listen_after_bind()) {
        throw std::runtime_error("HTTP server stopped with an error");
    }
}

void HttpServer::start() {
    bind();
    listen();
}

void HttpServer::stop() {
    svr_->stop();
    utils::log::info("Server stopped");
}

bool HttpServer::is_running() const {
    return svr_->is_running();
}

void HttpServer::wait_until_ready() const {
    svr_->wait_until_ready();
}

} // namespace satnogsproxy
