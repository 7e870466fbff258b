#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"

namespace facetmcp::core::config {

struct ToolConfig {
    std::vector<std::string> enabled_tools = {"execute", "apply_lenses",
                                              "validate_schema"};
    std::vector<std::string> allowed_lenses = {
        "trim",      "dedent",    "squeeze_spaces", "normalize_newlines",
        "uppercase", "lowercase", "limit",          "json_minify",
        "strip_markdown"};
    std::uint32_t max_facet_size_kb = 512;
    std::uint32_t max_lens_chain_length = 10;
    std::uint32_t max_template_variables = 50;
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 3000;
    std::uint32_t max_connections = 100;
    std::uint32_t connection_timeout_ms = 30000;  // idle read timeout, 0 = none
    std::uint32_t request_timeout_ms = 60000;     // default client call timeout
    std::uint32_t shutdown_grace_ms = 5000;
    std::uint32_t max_request_size_kb = 1024;
    std::uint32_t max_requests_per_minute = 60;
    bool enable_rate_limiting = true;
    bool enable_request_validation = true;
    std::string log_level = "INFO";
    ToolConfig tools;
};

// Reads an environment variable; injectable so tests need not touch the
// real process environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_env();

// Starts from the defaults and applies every FACETMCP_* variable present.
errors::Result<ServerConfig> load_config_from_env(const EnvLookup& lookup = process_env());

nlohmann::json config_to_json(const ServerConfig& config);

}  // namespace facetmcp::core::config
