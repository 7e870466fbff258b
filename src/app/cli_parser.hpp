#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/service_errors.hpp"

namespace facetmcp::app::cli {

    enum class Command {
        Serve,
        Config,
        Tools
    };

    struct CliRequest {
        Command command = Command::Serve;
        facetmcp::core::config::ServerConfig config;
        bool json_output = false;
    };

    // `base` is the environment-derived configuration; flags override it.
    facetmcp::core::errors::Result<CliRequest> parse_and_validate(
        int argc, char* argv[], const facetmcp::core::config::ServerConfig& base);
}
