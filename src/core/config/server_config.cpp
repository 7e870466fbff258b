#include "core/config/server_config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <system_error>

namespace facetmcp::core::config {

using errors::ErrorCategory;
using errors::ServiceError;

namespace {

constexpr const char* kEnvPrefix = "FACETMCP_";

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        const auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        const auto last = item.find_last_not_of(" \t");
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

template <typename T>
std::optional<ServiceError> read_unsigned(const EnvLookup& lookup,
                                          const std::string& name, T& target) {
    const auto raw = lookup(kEnvPrefix + name);
    if (!raw.has_value()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    const char* begin = raw->data();
    const char* end = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || raw->empty()) {
        return ServiceError{ErrorCategory::Config,
                            "Invalid number for " + std::string(kEnvPrefix) + name +
                                ": " + *raw,
                            "invalid_integer", "Provide a non-negative integer."};
    }
    if (value > std::numeric_limits<T>::max()) {
        return ServiceError{ErrorCategory::Config,
                            std::string(kEnvPrefix) + name + " out of bounds",
                            "bounds_error"};
    }
    target = static_cast<T>(value);
    return std::nullopt;
}

std::optional<ServiceError> read_bool(const EnvLookup& lookup,
                                      const std::string& name, bool& target) {
    const auto raw = lookup(kEnvPrefix + name);
    if (!raw.has_value()) {
        return std::nullopt;
    }
    if (*raw == "true" || *raw == "1" || *raw == "TRUE" || *raw == "True") {
        target = true;
        return std::nullopt;
    }
    if (*raw == "false" || *raw == "0" || *raw == "FALSE" || *raw == "False") {
        target = false;
        return std::nullopt;
    }
    return ServiceError{ErrorCategory::Config,
                        "Invalid boolean for " + std::string(kEnvPrefix) + name +
                            ": " + *raw,
                        "invalid_boolean", "Use true or false."};
}

}  // namespace

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

errors::Result<ServerConfig> load_config_from_env(const EnvLookup& lookup) {
    ServerConfig config;

    if (auto host = lookup(std::string(kEnvPrefix) + "HOST")) {
        config.host = *host;
    }
    if (auto level = lookup(std::string(kEnvPrefix) + "LOG_LEVEL")) {
        config.log_level = *level;
    }
    if (auto tools = lookup(std::string(kEnvPrefix) + "ENABLED_TOOLS")) {
        config.tools.enabled_tools = split_list(*tools);
    }
    if (auto lenses = lookup(std::string(kEnvPrefix) + "ALLOWED_LENSES")) {
        config.tools.allowed_lenses = split_list(*lenses);
    }

    const std::optional<ServiceError> failures[] = {
        read_unsigned(lookup, "PORT", config.port),
        read_unsigned(lookup, "MAX_CONNECTIONS", config.max_connections),
        read_unsigned(lookup, "CONNECTION_TIMEOUT_MS", config.connection_timeout_ms),
        read_unsigned(lookup, "REQUEST_TIMEOUT_MS", config.request_timeout_ms),
        read_unsigned(lookup, "SHUTDOWN_GRACE_MS", config.shutdown_grace_ms),
        read_unsigned(lookup, "MAX_REQUEST_SIZE_KB", config.max_request_size_kb),
        read_unsigned(lookup, "MAX_REQUESTS_PER_MINUTE", config.max_requests_per_minute),
        read_bool(lookup, "ENABLE_RATE_LIMITING", config.enable_rate_limiting),
        read_bool(lookup, "ENABLE_REQUEST_VALIDATION", config.enable_request_validation),
        read_unsigned(lookup, "MAX_FACET_SIZE_KB", config.tools.max_facet_size_kb),
        read_unsigned(lookup, "MAX_LENS_CHAIN_LENGTH", config.tools.max_lens_chain_length),
        read_unsigned(lookup, "MAX_TEMPLATE_VARIABLES", config.tools.max_template_variables),
    };
    for (const auto& failure : failures) {
        if (failure.has_value()) {
            return failure.value();
        }
    }

    if (config.max_request_size_kb == 0) {
        return ServiceError{ErrorCategory::Config,
                            "FACETMCP_MAX_REQUEST_SIZE_KB must be greater than zero.",
                            "bounds_error"};
    }

    return config;
}

nlohmann::json config_to_json(const ServerConfig& config) {
    nlohmann::json payload;
    payload["server"] = {
        {"host", config.host},
        {"port", config.port},
        {"max_connections", config.max_connections},
        {"connection_timeout_ms", config.connection_timeout_ms},
        {"request_timeout_ms", config.request_timeout_ms},
        {"shutdown_grace_ms", config.shutdown_grace_ms},
    };
    payload["security"] = {
        {"enable_rate_limiting", config.enable_rate_limiting},
        {"max_requests_per_minute", config.max_requests_per_minute},
        {"enable_request_validation", config.enable_request_validation},
        {"max_request_size_kb", config.max_request_size_kb},
    };
    payload["tools"] = {
        {"enabled_tools", config.tools.enabled_tools},
        {"allowed_lenses", config.tools.allowed_lenses},
        {"max_facet_size_kb", config.tools.max_facet_size_kb},
        {"max_lens_chain_length", config.tools.max_lens_chain_length},
        {"max_template_variables", config.tools.max_template_variables},
    };
    payload["logging"] = {{"level", config.log_level}};
    return payload;
}

}  // namespace facetmcp::core::config
