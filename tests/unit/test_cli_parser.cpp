#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/server_config.hpp"

namespace {

using facetmcp::app::cli::CliRequest;
using facetmcp::app::cli::Command;
using facetmcp::app::cli::parse_and_validate;
using facetmcp::core::config::ServerConfig;
using facetmcp::core::errors::ErrorCategory;
using facetmcp::core::errors::get_error;
using facetmcp::core::errors::get_value;
using facetmcp::core::errors::is_error;

facetmcp::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens, const ServerConfig& base = ServerConfig{}) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("facetmcp_server");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data(), base);
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(result).code, "missing_command");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ServeKeepsBaseConfigWithoutFlags) {
    ServerConfig base;
    base.host = "10.0.0.5";
    base.port = 4000;
    auto result = parse_tokens({"serve"}, base);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, Command::Serve);
    EXPECT_EQ(get_value(result).config.host, "10.0.0.5");
    EXPECT_EQ(get_value(result).config.port, 4000);
}

TEST(CliParserTest, ServeFlagsOverrideBase) {
    auto result = parse_tokens({"serve", "--host", "0.0.0.0", "--port", "0", "--log-level",
                                "debug", "--max-connections", "7"});
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result).config;
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 0);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.max_connections, 7u);
}

TEST(CliParserTest, FailsWhenPortNotNumeric) {
    auto result = parse_tokens({"serve", "--port", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenPortHasTrailingCharacters) {
    auto result = parse_tokens({"serve", "--port", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenPortOutOfBounds) {
    auto result = parse_tokens({"serve", "--port", "65536"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenMaxConnectionsZero) {
    auto result = parse_tokens({"serve", "--max-connections", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"serve", "--host"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownLogLevel) {
    auto result = parse_tokens({"serve", "--log-level", "chatty"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(CliParserTest, ConfigCommandAcceptsJsonFlag) {
    auto result = parse_tokens({"config", "--json"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, Command::Config);
    EXPECT_TRUE(get_value(result).json_output);
}

TEST(CliParserTest, FlagsAreScopedToTheirCommand) {
    auto serve_json = parse_tokens({"serve", "--json"});
    ASSERT_TRUE(is_error(serve_json));
    EXPECT_EQ(get_error(serve_json).code, "unknown_argument");

    auto tools_port = parse_tokens({"tools", "--port", "1"});
    ASSERT_TRUE(is_error(tools_port));
    EXPECT_EQ(get_error(tools_port).code, "unknown_argument");
}

TEST(CliParserTest, ToolsCommand) {
    auto result = parse_tokens({"tools"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, Command::Tools);
}

}  // namespace
