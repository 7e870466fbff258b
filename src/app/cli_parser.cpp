#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>
#include "core/logging/logger.hpp"

namespace facetmcp::app::cli {

    using namespace facetmcp::core::errors;
    using facetmcp::core::config::ServerConfig;

    namespace {

        constexpr const char* kUsage =
            "Usage: facetmcp_server serve [--host H] [--port P] [--log-level L] "
            "[--max-connections N] | config [--json] | tools";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> host;
            std::optional<std::string> port;
            std::optional<std::string> log_level;
            std::optional<std::string> max_connections;
            bool json = false;
        };

        std::optional<std::uint64_t> parse_unsigned(const std::string& text) {
            std::uint64_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (text.empty() || ec != std::errc() || ptr != end) {
                return std::nullopt;
            }
            return value;
        }

    }  // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[], const ServerConfig& base) {
        if (argc < 2) {
            return ServiceError{ErrorCategory::Config, "No command provided.", "missing_command", kUsage};
        }

        CliRequest req;
        req.config = base;

        std::string command = argv[1];
        if (command == "serve") {
            req.command = Command::Serve;
        } else if (command == "config") {
            req.command = Command::Config;
        } else if (command == "tools") {
            req.command = Command::Tools;
        } else {
            return ServiceError{ErrorCategory::Config, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const bool serving = req.command == Command::Serve;
        for (size_t i = 0; i < args.size(); ++i) {
            if (serving && args[i] == "--host") {
                if (i + 1 < args.size()) raw.host = args[++i];
                else return ServiceError{ErrorCategory::Config, "Missing value for --host", "missing_value"};
            } else if (serving && args[i] == "--port") {
                if (i + 1 < args.size()) raw.port = args[++i];
                else return ServiceError{ErrorCategory::Config, "Missing value for --port", "missing_value"};
            } else if (serving && args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return ServiceError{ErrorCategory::Config, "Missing value for --log-level", "missing_value"};
            } else if (serving && args[i] == "--max-connections") {
                if (i + 1 < args.size()) raw.max_connections = args[++i];
                else return ServiceError{ErrorCategory::Config, "Missing value for --max-connections", "missing_value"};
            } else if (req.command == Command::Config && args[i] == "--json") {
                raw.json = true;
            } else {
                return ServiceError{ErrorCategory::Config, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.json_output = raw.json;

        if (raw.host) {
            if (raw.host->empty()) {
                return ServiceError{ErrorCategory::Config, "--host must not be empty", "invalid_host"};
            }
            req.config.host = raw.host.value();
        }

        if (raw.port) {
            const auto port = parse_unsigned(raw.port.value());
            if (!port) {
                return ServiceError{ErrorCategory::Config, "Invalid number for --port", "invalid_integer", "Provide an integer between 0 and 65535."};
            }
            if (*port > 65535) {
                return ServiceError{ErrorCategory::Config, "--port out of bounds", "bounds_error", "Must be between 0 and 65535."};
            }
            req.config.port = static_cast<std::uint16_t>(*port);
        }

        if (raw.max_connections) {
            const auto limit = parse_unsigned(raw.max_connections.value());
            if (!limit) {
                return ServiceError{ErrorCategory::Config, "Invalid number for --max-connections", "invalid_integer", "Provide a positive integer."};
            }
            if (*limit == 0 || *limit > 100000) {
                return ServiceError{ErrorCategory::Config, "--max-connections out of bounds", "bounds_error", "Must be between 1 and 100000."};
            }
            req.config.max_connections = static_cast<std::uint32_t>(*limit);
        }

        if (raw.log_level) {
            req.config.log_level = raw.log_level.value();
        }
        if (!facetmcp::core::logging::parse_log_level(req.config.log_level)) {
            return ServiceError{ErrorCategory::Config, "Unknown log level: " + req.config.log_level, "invalid_log_level", "Use DEBUG, INFO, WARN or ERROR."};
        }

        return req;
    }

} // namespace facetmcp::app::cli
