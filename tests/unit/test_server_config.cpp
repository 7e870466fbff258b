#include <map>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/server_config.hpp"

namespace {

using facetmcp::core::config::config_to_json;
using facetmcp::core::config::EnvLookup;
using facetmcp::core::config::load_config_from_env;
using facetmcp::core::config::ServerConfig;
using facetmcp::core::errors::ErrorCategory;
using facetmcp::core::errors::get_error;
using facetmcp::core::errors::get_value;
using facetmcp::core::errors::is_error;

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

TEST(ServerConfigTest, DefaultsWhenEnvironmentEmpty) {
    auto result = load_config_from_env(fake_env({}));
    ASSERT_FALSE(is_error(result));

    const ServerConfig& config = get_value(result);
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 3000);
    EXPECT_EQ(config.max_connections, 100u);
    EXPECT_EQ(config.max_requests_per_minute, 60u);
    EXPECT_TRUE(config.enable_rate_limiting);
    EXPECT_EQ(config.tools.enabled_tools.size(), 3u);
    EXPECT_EQ(config.tools.allowed_lenses.size(), 9u);
}

TEST(ServerConfigTest, AppliesOverrides) {
    auto result = load_config_from_env(fake_env({
        {"FACETMCP_HOST", "0.0.0.0"},
        {"FACETMCP_PORT", "8080"},
        {"FACETMCP_ENABLE_RATE_LIMITING", "false"},
        {"FACETMCP_ENABLED_TOOLS", "execute, validate_schema"},
        {"FACETMCP_MAX_LENS_CHAIN_LENGTH", "4"},
        {"FACETMCP_LOG_LEVEL", "DEBUG"},
    }));
    ASSERT_FALSE(is_error(result));

    const ServerConfig& config = get_value(result);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_FALSE(config.enable_rate_limiting);
    EXPECT_EQ(config.tools.enabled_tools,
              (std::vector<std::string>{"execute", "validate_schema"}));
    EXPECT_EQ(config.tools.max_lens_chain_length, 4u);
    EXPECT_EQ(config.log_level, "DEBUG");
}

TEST(ServerConfigTest, RejectsMalformedNumbers) {
    auto result = load_config_from_env(fake_env({{"FACETMCP_PORT", "80a"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(ServerConfigTest, RejectsOutOfRangePort) {
    auto result = load_config_from_env(fake_env({{"FACETMCP_PORT", "70000"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(ServerConfigTest, RejectsMalformedBoolean) {
    auto result = load_config_from_env(fake_env({{"FACETMCP_ENABLE_RATE_LIMITING", "maybe"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_boolean");
}

TEST(ServerConfigTest, RejectsZeroRequestSize) {
    auto result = load_config_from_env(fake_env({{"FACETMCP_MAX_REQUEST_SIZE_KB", "0"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(ServerConfigTest, RendersSections) {
    const auto payload = config_to_json(ServerConfig{});
    EXPECT_EQ(payload["server"]["port"], 3000);
    EXPECT_EQ(payload["security"]["max_request_size_kb"], 1024);
    EXPECT_EQ(payload["tools"]["max_template_variables"], 50);
    EXPECT_EQ(payload["logging"]["level"], "INFO");
}

}  // namespace
