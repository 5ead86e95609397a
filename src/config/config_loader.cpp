#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace satnogsproxy {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// The schema has only tables of scalars, so arrays are left untouched
void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// Non-empty environment value, or nullopt
std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

bool has_http_scheme_and_host(const std::string& url) {
    std::string_view rest(url);
    if (rest.starts_with("https://")) {
        rest.remove_prefix(8);
    } else if (rest.starts_with("http://")) {
        rest.remove_prefix(7);
    } else {
        return false;
    }
    return !rest.empty() && rest.front() != '/';
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<DeploymentMode> ConfigLoader::parse_deployment_mode(const std::string& mode_str) {
    const std::string lower = utils::to_lower(utils::trim(mode_str));
    if (lower == "development") return DeploymentMode::DEVELOPMENT;
    if (lower == "production") return DeploymentMode::PRODUCTION;
    return std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    // Range-check before narrowing to int / size_t
    const int64_t port = s["port"].value_or(int64_t{8080});
    if (port < 1 || port > 65535) {
        throw std::runtime_error(std::format("server.port must be 1-65535, got {}", port));
    }
    const int64_t threads = s["threads"].value_or(int64_t{4});
    if (threads < 1) {
        throw std::runtime_error(std::format("server.threads must be > 0, got {}", threads));
    }
    cfg.port = static_cast<int>(port);
    cfg.thread_pool_size = static_cast<size_t>(threads);

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
    }

    return cfg;
}

UpstreamConfig ConfigLoader::extract_upstream(const toml::table& root) {
    UpstreamConfig cfg;
    const auto* upstream = root["upstream"].as_table();
    if (!upstream) return cfg;
    const auto& u = *upstream;

    cfg.network_api_url = u["network_api_url"].value_or(std::string(kDefaultNetworkApiUrl));
    cfg.db_api_url = u["db_api_url"].value_or(std::string(kDefaultDbApiUrl));
    cfg.timeout = std::chrono::milliseconds(
        u["timeout_ms"].value_or(int64_t{kDefaultUpstreamTimeoutMs}));
    cfg.ca_cert_path = u["ca_cert_path"].value_or(""s);
    return cfg;
}

CorsConfig ConfigLoader::extract_cors(const toml::table& root) {
    CorsConfig cfg;
    const auto* cors = root["cors"].as_table();
    if (!cors) return cfg;
    const auto& c = *cors;

    if (const auto mode_str = c["deployment_mode"].value<std::string>()) {
        const auto mode = parse_deployment_mode(*mode_str);
        if (!mode) {
            throw std::runtime_error(std::format(
                "cors.deployment_mode must be 'development' or 'production', got '{}'", *mode_str));
        }
        cfg.mode = *mode;
    }
    cfg.allowed_origin = c["allowed_origin"].value_or(""s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

// ---- Environment -----------------------------------------------------------

void ConfigLoader::apply_env_overrides(ProxyConfig& config) {
    if (auto v = env_value("SATNOGS_NETWORK_API_URL")) {
        config.upstream.network_api_url = std::move(*v);
    }
    if (auto v = env_value("SATNOGS_DB_API_URL")) {
        config.upstream.db_api_url = std::move(*v);
    }
    if (auto v = env_value("ALLOWED_ORIGIN_URL")) {
        config.cors.allowed_origin = std::move(*v);
    }
    // CONTEXT is the deploy context name; only "development" switches mode,
    // any other value (production, deploy-preview, ...) is production.
    if (const auto v = env_value("CONTEXT")) {
        config.cors.mode = parse_deployment_mode(*v).value_or(DeploymentMode::PRODUCTION);
    }
}

// ---- Shared extraction + validation ----------------------------------------

ProxyConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ProxyConfig config;
    config.server = extract_server(tbl);
    config.upstream = extract_upstream(tbl);
    config.cors = extract_cors(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ProxyConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        auto config = extract_all_sections(tbl);
        apply_env_overrides(config);
        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        auto config = extract_all_sections(tbl);
        apply_env_overrides(config);
        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    ProxyConfig config;
    apply_env_overrides(config);
    return validate_and_return(std::move(config));
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ProxyConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }

    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    if (config.server.tls.enabled) {
        if (config.server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (config.server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
    }

    if (!has_http_scheme_and_host(config.upstream.network_api_url)) {
        errors.push_back(std::format(
            "upstream.network_api_url must be an http(s) URL with a host, got '{}'",
            config.upstream.network_api_url));
    }
    if (!has_http_scheme_and_host(config.upstream.db_api_url)) {
        errors.push_back(std::format(
            "upstream.db_api_url must be an http(s) URL with a host, got '{}'",
            config.upstream.db_api_url));
    }

    if (config.upstream.timeout.count() <= 0) {
        errors.push_back("upstream.timeout_ms must be > 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace satnogsproxy
