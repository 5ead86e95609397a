#include "config/config_loader.hpp"
#include "core/cors_policy.hpp"
#include "core/proxy_handler.hpp"
#include "core/utils.hpp"
#include "server/http_server.hpp"
#include "upstream/http_upstream_client.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <memory>

using namespace satnogsproxy;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("SatNOGS Proxy starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/satnogs_proxy.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));

        ConfigLoader::LoadResult config_result;
        if (std::filesystem::exists(config_file)) {
            config_result = ConfigLoader::load_from_file(config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return 1;
            }
        } else {
            utils::log::warn(std::format("{} not found - using defaults and environment", config_file));
            config_result = ConfigLoader::load_from_env();
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return 1;
            }
        }
        const ProxyConfig config = std::move(config_result.config);

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        const CorsPolicy cors(config.cors);
        utils::log::info(std::format("Deployment mode: {}", deployment_mode_to_string(config.cors.mode)));
        utils::log::info(std::format("Allowed Origin Set To: {}", cors.allowed_origin()));

        utils::log::info("[2/4] Upstream client initializing...");
        auto upstream = std::make_shared<HttpUpstreamClient>(config.upstream);
        utils::log::info(std::format("Using Network API Base: {}", config.upstream.network_api_url));
        utils::log::info(std::format("Using DB API Base: {}", config.upstream.db_api_url));
        utils::log::info(std::format("Upstream timeout: {}ms", upstream->timeout().count()));

        utils::log::info("[3/4] Proxy handler initializing...");
        auto handler = std::make_shared<const ProxyHandler>(config, upstream);

        utils::log::info("[4/4] HTTP server starting...");
        g_server = std::make_shared<HttpServer>(handler, config.server);
        g_server->start();

        utils::log::info("SatNOGS Proxy exited");
        return 0;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }
}
