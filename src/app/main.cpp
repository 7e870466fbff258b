#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include "app/cli_parser.hpp"
#include "core/config/ids.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/service_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/dispatch_engine.hpp"
#include "session/connection_manager.hpp"
#include "tools/document_engine.hpp"
#include "tools/tool_host.hpp"
#include "tools/tool_registry.hpp"
#include "validation/validator_cache.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

void report(const facetmcp::core::errors::ServiceError& err, const std::string& context) {
    LOG_ERROR(context + " [" + facetmcp::core::errors::error_type_name(err.category) + "/" +
              err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = facetmcp::core::errors;
    using facetmcp::core::logging::Logger;

    // 1. Tag every log line with this server instance
    Logger::get().set_instance_id(facetmcp::core::config::generate_instance_id());

    // 2. Environment first, then command-line overrides
    auto env_config = facetmcp::core::config::load_config_from_env();
    if (errors::is_error(env_config)) {
        report(errors::get_error(env_config), "Configuration error");
        return 2;
    }

    auto parsed = facetmcp::app::cli::parse_and_validate(argc, argv,
                                                         errors::get_value(env_config));
    if (errors::is_error(parsed)) {
        report(errors::get_error(parsed), "Input error");
        return 2;
    }
    const auto& req = errors::get_value(parsed);
    const auto& config = req.config;
    if (auto level = facetmcp::core::logging::parse_log_level(config.log_level)) {
        Logger::get().set_min_level(*level);
    }

    auto registry_result = facetmcp::tools::ToolRegistry::create(config.tools.enabled_tools);
    if (errors::is_error(registry_result)) {
        report(errors::get_error(registry_result), "Tool registry error");
        return 2;
    }
    const auto& registry = errors::get_value(registry_result);

    // 3. One-shot commands
    if (req.command == facetmcp::app::cli::Command::Config) {
        const auto payload = facetmcp::core::config::config_to_json(config);
        std::cout << (req.json_output ? payload.dump() : payload.dump(2)) << std::endl;
        return 0;
    }
    if (req.command == facetmcp::app::cli::Command::Tools) {
        std::cout << registry.list().dump(2) << std::endl;
        return 0;
    }

    // 4. Wire the dispatch core and serve until signalled
    facetmcp::tools::BasicDocumentEngine document_engine;
    facetmcp::validation::ValidatorCache validators;
    facetmcp::tools::ToolHost host(document_engine, validators, config.tools);
    facetmcp::runtime::DispatchOptions options;
    options.validate_parameters = config.enable_request_validation;
    facetmcp::runtime::DispatchEngine engine(registry, host, validators, options);

    facetmcp::session::ConnectionManager server(config, engine);
    auto started = server.start();
    if (errors::is_error(started)) {
        report(errors::get_error(started), "Failed to start server");
        return 3;
    }
    LOG_INFO("facetmcp serving " + std::to_string(registry.size()) + " tools on " + config.host +
             ":" + std::to_string(errors::get_value(started)));

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    while (!g_shutdown_requested.load() && server.running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutdown requested");
    server.stop();
    LOG_INFO("Validator cache: " + std::to_string(validators.size()) + " schemas, " +
             std::to_string(validators.hit_count()) + " hits");
    return 0;
}
