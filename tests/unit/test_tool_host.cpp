#include <atomic>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "tools/document_engine.hpp"
#include "tools/tool_host.hpp"
#include "validation/validator_cache.hpp"

namespace {

using facetmcp::core::config::ToolConfig;
using facetmcp::core::errors::ErrorCategory;
using facetmcp::core::errors::get_error;
using facetmcp::core::errors::get_value;
using facetmcp::core::errors::is_error;
using facetmcp::tools::BasicDocumentEngine;
using facetmcp::tools::ExecuteRequest;
using facetmcp::tools::LensRequest;
using facetmcp::tools::SchemaRequest;
using facetmcp::tools::ToolHost;
using facetmcp::validation::ValidatorCache;
using nlohmann::json;

// Records the source it was handed and returns it verbatim.
class EchoEngine : public facetmcp::tools::DocumentEngine {
public:
    facetmcp::core::errors::Result<json> execute(const std::string& source) const override {
        last_source = source;
        return json{{"source", source}};
    }

    mutable std::string last_source;
};

class ToolHostTest : public ::testing::Test {
protected:
    BasicDocumentEngine engine;
    ValidatorCache validators;
    ToolHost host{engine, validators};
};

TEST_F(ToolHostTest, ExecuteReturnsDocumentWithMeta) {
    ExecuteRequest request;
    request.facet_source = "@user\n  name: {{name}}\n";
    request.variables = json{{"name", "Alice"}};

    auto result = host.execute(request);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    const json& doc = get_value(result);
    EXPECT_EQ(doc["user"]["name"], "Alice");
    EXPECT_EQ(doc["_meta"]["server"], "facetmcp");
    EXPECT_TRUE(doc["_meta"]["execution_time_ms"].is_number());
}

TEST_F(ToolHostTest, ExecuteWithoutVariablesLeavesPlaceholders) {
    EchoEngine echo;
    ToolHost echo_host(echo, validators);

    ExecuteRequest request;
    request.facet_source = "Hi {{x}}";
    auto result = echo_host.execute(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(echo.last_source, "Hi {{x}}");
}

TEST_F(ToolHostTest, ExecuteSurfacesDocumentErrors) {
    ExecuteRequest request;
    request.facet_source = "no header here";
    auto result = host.execute(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Document);
}

TEST_F(ToolHostTest, ExecuteHonoursCancellation) {
    ExecuteRequest request;
    request.facet_source = "@a\n  k: 1\n";
    request.cancel_token = std::make_shared<std::atomic_bool>(true);
    auto result = host.execute(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Cancelled);
}

TEST_F(ToolHostTest, ExecuteChecksSizeAfterSubstitution) {
    ToolConfig config;
    config.max_facet_size_kb = 1;
    EchoEngine echo;
    ToolHost small_host(echo, validators, config);

    ExecuteRequest request;
    request.facet_source = "{{big}}";
    request.variables = json{{"big", std::string(2048, 'x')}};
    auto result = small_host.execute(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "facet_too_large");
    EXPECT_TRUE(echo.last_source.empty());
}

TEST_F(ToolHostTest, ApplyLensesReturnsString) {
    LensRequest request;
    request.input_string = "  Hello   World  ";
    request.lenses = {"trim", "squeeze_spaces"};
    auto result = host.apply_lenses(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json("Hello World"));
}

TEST_F(ToolHostTest, ApplyLensesReportsUnknownLens) {
    LensRequest request;
    request.input_string = "x";
    request.lenses = {"nope"};
    auto result = host.apply_lenses(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Lens);
    EXPECT_NE(get_error(result).message.find("nope"), std::string::npos);
}

TEST_F(ToolHostTest, ValidateSchemaReportsRequiredProperty) {
    SchemaRequest request{json::object(),
                          json{{"type", "object"}, {"required", json::array({"name"})}}};
    auto result = host.validate_schema(request);
    ASSERT_FALSE(is_error(result));
    const json& payload = get_value(result);
    EXPECT_FALSE(payload["valid"].get<bool>());
    ASSERT_TRUE(payload["errors"].is_array());
    ASSERT_FALSE(payload["errors"].empty());
    EXPECT_NE(payload["errors"][0].get<std::string>().find("name"), std::string::npos);
}

TEST_F(ToolHostTest, ValidateSchemaValidDataHasNullErrors) {
    SchemaRequest request{json{{"name", "x"}}, json{{"type", "object"}}};
    auto result = host.validate_schema(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result)["valid"].get<bool>());
    EXPECT_TRUE(get_value(result)["errors"].is_null());
}

TEST_F(ToolHostTest, ValidateSchemaRejectsInvalidSchema) {
    auto not_object = host.validate_schema(SchemaRequest{json(1), json("string")});
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).category, ErrorCategory::Schema);

    auto bad_type = host.validate_schema(SchemaRequest{json(1), json{{"type", "widget"}}});
    ASSERT_TRUE(is_error(bad_type));
    EXPECT_EQ(get_error(bad_type).category, ErrorCategory::Schema);
}

TEST(ToolRequestReaderTest, ReportsMissingAndMistypedParameters) {
    auto missing = facetmcp::tools::read_execute_request(json::object());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_parameter");

    auto mistyped = facetmcp::tools::read_lens_request(
        json{{"input_string", "x"}, {"lenses", json::array({"trim", 3})}});
    ASSERT_TRUE(is_error(mistyped));
    EXPECT_EQ(get_error(mistyped).code, "invalid_parameter");

    auto schema = facetmcp::tools::read_schema_request(json{{"json_object", 1}});
    ASSERT_TRUE(is_error(schema));
    EXPECT_NE(get_error(schema).message.find("json_schema"), std::string::npos);
}

}  // namespace
