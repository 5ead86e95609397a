#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace satnogsproxy {

// ============================================================================
// Configuration Types
// ============================================================================

inline constexpr const char* kDefaultNetworkApiUrl = "https://network.satnogs.org/api";
inline constexpr const char* kDefaultDbApiUrl = "https://db.satnogs.org/api";
inline constexpr uint32_t kDefaultUpstreamTimeoutMs = 15000;

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;            // Server certificate (PEM)
    std::string key_file;             // Server private key (PEM)
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    size_t thread_pool_size = 4;
    TlsConfig tls;
};

struct UpstreamConfig {
    std::string network_api_url = kDefaultNetworkApiUrl;
    std::string db_api_url = kDefaultDbApiUrl;
    std::chrono::milliseconds timeout{kDefaultUpstreamTimeoutMs};
    std::string ca_cert_path;         // Empty = system default trust store
};

struct CorsConfig {
    DeploymentMode mode = DeploymentMode::PRODUCTION;
    std::string allowed_origin;       // Empty = "*"
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// ProxyConfig - Complete parsed configuration
// ============================================================================

struct ProxyConfig {
    ServerConfig server;
    UpstreamConfig upstream;
    CorsConfig cors;
    LoggingConfig logging;
};

[[nodiscard]] inline constexpr const char* deployment_mode_to_string(DeploymentMode mode) {
    switch (mode) {
        case DeploymentMode::PRODUCTION:  return "production";
        case DeploymentMode::DEVELOPMENT: return "development";
    }
    return "unknown";
}

} // namespace satnogsproxy
