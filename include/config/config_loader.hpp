#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace satnogsproxy {

// ============================================================================
// ConfigLoader - Extract typed config from TOML + environment
// ============================================================================

/**
 * Sources, in increasing precedence:
 *   1. Built-in defaults (ProxyConfig)
 *   2. TOML file / string, with ${VAR} expansion in string values
 *   3. Process environment (SATNOGS_NETWORK_API_URL, SATNOGS_DB_API_URL,
 *      ALLOWED_ORIGIN_URL, CONTEXT)
 *
 * The result is validated before it is returned.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ProxyConfig config;

        static LoadResult ok(ProxyConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to satnogs_proxy.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Defaults + environment only (no config file)
     */
    [[nodiscard]] static LoadResult load_from_env();

    // Overlay the process environment onto an already-extracted config
    static void apply_env_overrides(ProxyConfig& config);

    [[nodiscard]] static std::vector<std::string> validate_config(const ProxyConfig& config);

    [[nodiscard]] static std::optional<DeploymentMode> parse_deployment_mode(const std::string& mode_str);

private:
    static ServerConfig extract_server(const toml::table& root);
    static UpstreamConfig extract_upstream(const toml::table& root);
    static CorsConfig extract_cors(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static ProxyConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(ProxyConfig config);
};

} // namespace satnogsproxy
