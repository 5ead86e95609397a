#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace satnogsproxy;

namespace {

void clear_proxy_env() {
    ::unsetenv("SATNOGS_NETWORK_API_URL");
    ::unsetenv("SATNOGS_DB_API_URL");
    ::unsetenv("ALLOWED_ORIGIN_URL");
    ::unsetenv("CONTEXT");
}

} // anonymous namespace

// ============================================================================
// Defaults and TOML sections
// ============================================================================

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    clear_proxy_env();

    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.thread_pool_size == 4);
    CHECK_FALSE(cfg.server.tls.enabled);
    CHECK(cfg.upstream.network_api_url == "https://network.satnogs.org/api");
    CHECK(cfg.upstream.db_api_url == "https://db.satnogs.org/api");
    CHECK(cfg.upstream.timeout.count() == 15000);
    CHECK(cfg.cors.mode == DeploymentMode::PRODUCTION);
    CHECK(cfg.cors.allowed_origin.empty());
    CHECK(cfg.logging.level == "info");
}

TEST_CASE("ConfigLoader: all sections are read", "[config]") {
    clear_proxy_env();

    const std::string toml = R"(
[server]
host = "127.0.0.1"
port = 9090
threads = 8

[server.tls]
enabled = true
cert_file = "/etc/ssl/proxy.pem"
key_file = "/etc/ssl/proxy.key"

[upstream]
network_api_url = "http://localhost:8001/api"
db_api_url = "http://localhost:8002/api"
timeout_ms = 2500
ca_cert_path = "/etc/ssl/certs/ca.pem"

[cors]
deployment_mode = "development"
allowed_origin = "https://dash.example.org"

[logging]
level = "debug"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.thread_pool_size == 8);
    CHECK(cfg.server.tls.enabled);
    CHECK(cfg.server.tls.cert_file == "/etc/ssl/proxy.pem");
    CHECK(cfg.server.tls.key_file == "/etc/ssl/proxy.key");
    CHECK(cfg.upstream.network_api_url == "http://localhost:8001/api");
    CHECK(cfg.upstream.db_api_url == "http://localhost:8002/api");
    CHECK(cfg.upstream.timeout.count() == 2500);
    CHECK(cfg.upstream.ca_cert_path == "/etc/ssl/certs/ca.pem");
    CHECK(cfg.cors.mode == DeploymentMode::DEVELOPMENT);
    CHECK(cfg.cors.allowed_origin == "https://dash.example.org");
    CHECK(cfg.logging.level == "debug");
}

TEST_CASE("ConfigLoader: load_from_file reads a file on disk", "[config]") {
    clear_proxy_env();

    const auto path = std::filesystem::temp_directory_path() / "satnogs_proxy_test_config.toml";
    {
        std::ofstream out(path);
        out << "[server]\nport = 8181\n\n[cors]\nallowed_origin = \"https://a.example\"\n";
    }

    auto result = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(result.success);
    CHECK(result.config.server.port == 8181);
    CHECK(result.config.cors.allowed_origin == "https://a.example");
}

TEST_CASE("ConfigLoader: missing file is an error", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/satnogs_proxy.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML is an error", "[config]") {
    auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

// ============================================================================
// Environment
// ============================================================================

TEST_CASE("ConfigLoader: ${VAR} expansion in string values", "[config][env]") {
    clear_proxy_env();
    ::setenv("TEST_SATNOGS_HOST", "mirror.example.org", 1);

    const std::string toml = R"(
[upstream]
network_api_url = "https://${TEST_SATNOGS_HOST}/api"
db_api_url = "https://db.${TEST_SATNOGS_HOST}/api"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.upstream.network_api_url == "https://mirror.example.org/api");
    CHECK(result.config.upstream.db_api_url == "https://db.mirror.example.org/api");

    ::unsetenv("TEST_SATNOGS_HOST");
}

TEST_CASE("ConfigLoader: ${VAR} expansion reaches nested tables", "[config][env]") {
    clear_proxy_env();
    ::setenv("TEST_SATNOGS_CERT_DIR", "/srv/certs", 1);

    const std::string toml = R"(
[server.tls]
enabled = true
cert_file = "${TEST_SATNOGS_CERT_DIR}/proxy.pem"
key_file = "${TEST_SATNOGS_CERT_DIR}/proxy.key"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.server.tls.cert_file == "/srv/certs/proxy.pem");
    CHECK(result.config.server.tls.key_file == "/srv/certs/proxy.key");

    ::unsetenv("TEST_SATNOGS_CERT_DIR");
}

TEST_CASE("ConfigLoader: unclosed ${ is parse error", "[config][env]") {
    const std::string toml = R"(
[cors]
allowed_origin = "https://${UNCLOSED"
)";

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("ConfigLoader: environment overrides the file", "[config][env]") {
    clear_proxy_env();
    ::setenv("SATNOGS_NETWORK_API_URL", "http://net.local/api", 1);
    ::setenv("SATNOGS_DB_API_URL", "http://db.local/api", 1);
    ::setenv("ALLOWED_ORIGIN_URL", "https://env.example.org", 1);

    const std::string toml = R"(
[upstream]
network_api_url = "https://network.satnogs.org/api"
db_api_url = "https://db.satnogs.org/api"

[cors]
allowed_origin = "https://file.example.org"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.upstream.network_api_url == "http://net.local/api");
    CHECK(result.config.upstream.db_api_url == "http://db.local/api");
    CHECK(result.config.cors.allowed_origin == "https://env.example.org");

    clear_proxy_env();
}

TEST_CASE("ConfigLoader: empty environment values are ignored", "[config][env]") {
    clear_proxy_env();
    ::setenv("SATNOGS_DB_API_URL", "", 1);

    auto result = ConfigLoader::load_from_env();
    REQUIRE(result.success);
    CHECK(result.config.upstream.db_api_url == "https://db.satnogs.org/api");

    clear_proxy_env();
}

TEST_CASE("ConfigLoader: CONTEXT selects the deployment mode", "[config][env]") {
    clear_proxy_env();

    SECTION("development") {
        ::setenv("CONTEXT", "development", 1);
        auto result = ConfigLoader::load_from_env();
        REQUIRE(result.success);
        CHECK(result.config.cors.mode == DeploymentMode::DEVELOPMENT);
    }

    SECTION("any other value is production") {
        ::setenv("CONTEXT", "deploy-preview", 1);
        auto result = ConfigLoader::load_from_string("[cors]\ndeployment_mode = \"development\"\n");
        REQUIRE(result.success);
        CHECK(result.config.cors.mode == DeploymentMode::PRODUCTION);
    }

    SECTION("unset keeps the file value") {
        auto result = ConfigLoader::load_from_string("[cors]\ndeployment_mode = \"development\"\n");
        REQUIRE(result.success);
        CHECK(result.config.cors.mode == DeploymentMode::DEVELOPMENT);
    }

    clear_proxy_env();
}

TEST_CASE("ConfigLoader: parse_deployment_mode", "[config]") {
    CHECK(ConfigLoader::parse_deployment_mode("development") == DeploymentMode::DEVELOPMENT);
    CHECK(ConfigLoader::parse_deployment_mode(" Production ") == DeploymentMode::PRODUCTION);
    CHECK_FALSE(ConfigLoader::parse_deployment_mode("staging").has_value());
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigLoader: unknown deployment_mode is rejected", "[config][validation]") {
    clear_proxy_env();

    auto result = ConfigLoader::load_from_string("[cors]\ndeployment_mode = \"staging\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("cors.deployment_mode") != std::string::npos);
}

TEST_CASE("ConfigLoader: validation collects every error", "[config][validation]") {
    clear_proxy_env();

    const std::string toml = R"(
[server.tls]
enabled = true

[upstream]
network_api_url = "ftp://network.satnogs.org"
db_api_url = "https:///api"
timeout_ms = 0

[logging]
level = "verbose"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;

    CHECK(msg.find("Config validation failed") != std::string::npos);
    CHECK(msg.find("server.tls.cert_file required") != std::string::npos);
    CHECK(msg.find("server.tls.key_file required") != std::string::npos);
    CHECK(msg.find("upstream.network_api_url") != std::string::npos);
    CHECK(msg.find("upstream.db_api_url") != std::string::npos);
    CHECK(msg.find("upstream.timeout_ms must be > 0") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigLoader: validate_config accepts defaults", "[config][validation]") {
    CHECK(ConfigLoader::validate_config(ProxyConfig{}).empty());
}

TEST_CASE("ConfigLoader: out-of-range port and threads are rejected before narrowing", "[config][validation]") {
    clear_proxy_env();

    SECTION("negative threads") {
        auto result = ConfigLoader::load_from_string("[server]\nthreads = -1\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("server.threads must be > 0, got -1") != std::string::npos);
    }

    SECTION("zero threads") {
        auto result = ConfigLoader::load_from_string("[server]\nthreads = 0\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("server.threads must be > 0, got 0") != std::string::npos);
    }

    SECTION("port above 65535") {
        auto result = ConfigLoader::load_from_string("[server]\nport = 70000\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("server.port must be 1-65535, got 70000") != std::string::npos);
    }

    SECTION("port beyond int range") {
        auto result = ConfigLoader::load_from_string("[server]\nport = 4294975592\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("got 4294975592") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: validate_config checks server fields", "[config][validation]") {
    ProxyConfig cfg;
    cfg.server.port = 0;
    cfg.server.thread_pool_size = 0;

    const auto errors = ConfigLoader::validate_config(cfg);
    REQUIRE(errors.size() == 2);
    CHECK(errors[0] == "server.port must be 1-65535, got 0");
    CHECK(errors[1] == "server.threads must be > 0");
}
