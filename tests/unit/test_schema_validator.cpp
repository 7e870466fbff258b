#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "validation/schema_validator.hpp"

namespace {

using facetmcp::core::errors::ErrorCategory;
using facetmcp::core::errors::get_error;
using facetmcp::core::errors::get_value;
using facetmcp::core::errors::is_error;
using facetmcp::validation::SchemaValidator;
using facetmcp::validation::ValidationOutcome;
using nlohmann::json;

ValidationOutcome check(const json& schema, const json& data) {
    auto compiled = SchemaValidator::compile(schema);
    EXPECT_FALSE(is_error(compiled)) << get_error(compiled).message;
    if (is_error(compiled)) {
        return ValidationOutcome{false, {"compile failed"}};
    }
    return get_value(compiled)->validate(data);
}

bool mentions(const std::vector<std::string>& errors, const std::string& needle) {
    for (const auto& error : errors) {
        if (error.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

TEST(SchemaValidatorTest, MissingRequiredPropertyIsReported) {
    auto outcome = check(json{{"type", "object"}, {"required", json::array({"name"})}}, json::object());
    EXPECT_FALSE(outcome.valid);
    ASSERT_EQ(outcome.errors.size(), 1u);
    EXPECT_EQ(outcome.errors[0], "'name' is a required property at /");
}

TEST(SchemaValidatorTest, AcceptsConformingData) {
    const json schema = json::parse(R"({
        "type": "object",
        "properties": {
            "name": {"type": "string", "minLength": 1},
            "age": {"type": "integer", "minimum": 0},
            "tags": {"type": "array", "items": {"type": "string"}, "maxItems": 3}
        },
        "required": ["name"],
        "additionalProperties": false
    })");
    auto outcome = check(schema, json{{"name", "Alice"}, {"age", 25}, {"tags", json::array({"a", "b"})}});
    EXPECT_TRUE(outcome.valid);
    EXPECT_TRUE(outcome.errors.empty());
}

TEST(SchemaValidatorTest, ReportsNestedPaths) {
    const json schema = json::parse(R"({
        "type": "object",
        "properties": {"items": {"type": "array", "items": {"type": "integer"}}}
    })");
    auto outcome = check(schema, json{{"items", json::array({1, "two", 3})}});
    EXPECT_FALSE(outcome.valid);
    ASSERT_EQ(outcome.errors.size(), 1u);
    EXPECT_EQ(outcome.errors[0], "\"two\" is not of type 'integer' at /items/1");
}

TEST(SchemaValidatorTest, RejectsAdditionalProperties) {
    auto outcome = check(json{{"properties", {{"a", json::object()}}},
                              {"additionalProperties", false}},
                         json{{"a", 1}, {"x", 2}});
    EXPECT_FALSE(outcome.valid);
    ASSERT_EQ(outcome.errors.size(), 1u);
    EXPECT_EQ(outcome.errors[0], "Additional properties are not allowed ('x' was unexpected) at /");
}

TEST(SchemaValidatorTest, CollectsEveryFailure) {
    const json schema = json::parse(R"({
        "type": "object",
        "required": ["a", "b"],
        "properties": {"c": {"type": "string", "maxLength": 2}}
    })");
    auto outcome = check(schema, json{{"c", "long"}});
    EXPECT_FALSE(outcome.valid);
    EXPECT_EQ(outcome.errors.size(), 3u);
    EXPECT_TRUE(mentions(outcome.errors, "'a'"));
    EXPECT_TRUE(mentions(outcome.errors, "'b'"));
    EXPECT_TRUE(mentions(outcome.errors, "is too long at /c"));
}

TEST(SchemaValidatorTest, IntegerAcceptsWholeFloats) {
    EXPECT_TRUE(check(json{{"type", "integer"}}, json(3.0)).valid);
    EXPECT_FALSE(check(json{{"type", "integer"}}, json(3.5)).valid);
    EXPECT_TRUE(check(json{{"type", "number"}}, json(3)).valid);
}

TEST(SchemaValidatorTest, EnumConstAndPattern) {
    EXPECT_TRUE(check(json{{"enum", json::array({"a", "b"})}}, json("a")).valid);
    EXPECT_FALSE(check(json{{"enum", json::array({"a", "b"})}}, json("c")).valid);
    EXPECT_TRUE(check(json{{"const", 5}}, json(5)).valid);
    EXPECT_FALSE(check(json{{"const", 5}}, json(6)).valid);
    EXPECT_TRUE(check(json{{"pattern", "^[a-z]+$"}}, json("abc")).valid);
    EXPECT_FALSE(check(json{{"pattern", "^[a-z]+$"}}, json("ABC")).valid);
    // Keywords for other types do not apply.
    EXPECT_TRUE(check(json{{"pattern", "^[a-z]+$"}}, json(12)).valid);
}

TEST(SchemaValidatorTest, LongStringIsNotRunThroughPattern) {
    const json schema = json{{"type", "string"}, {"pattern", "^(a|b)*$"}};
    EXPECT_TRUE(check(schema, json(std::string(1000, 'a'))).valid);

    auto outcome = check(schema, json(std::string(20000, 'a')));
    EXPECT_FALSE(outcome.valid);
    ASSERT_EQ(outcome.errors.size(), 1u);
    EXPECT_TRUE(mentions(outcome.errors, "20000 bytes is too long to match"));
}

TEST(SchemaValidatorTest, HugeCountBoundsSaturate) {
    EXPECT_TRUE(check(json{{"type", "string"}, {"maxLength", 1e20}}, json("x")).valid);
    EXPECT_FALSE(check(json{{"type", "string"}, {"minLength", 1e20}}, json("x")).valid);
    EXPECT_TRUE(check(json{{"maxItems", 1e300}}, json::array({1, 2})).valid);
    EXPECT_TRUE(
        check(json::parse(R"({"maxLength": 18446744073709551615})"), json("abc")).valid);
}

TEST(SchemaValidatorTest, NumericBounds) {
    const json schema = json{{"minimum", 1}, {"exclusiveMaximum", 10}};
    EXPECT_TRUE(check(schema, json(1)).valid);
    EXPECT_TRUE(check(schema, json(9.5)).valid);
    EXPECT_FALSE(check(schema, json(0)).valid);
    EXPECT_FALSE(check(schema, json(10)).valid);
}

TEST(SchemaValidatorTest, Combinators) {
    const json any_of = json::parse(R"({"anyOf": [{"type": "string"}, {"type": "integer"}]})");
    EXPECT_TRUE(check(any_of, json("x")).valid);
    EXPECT_FALSE(check(any_of, json(true)).valid);

    const json one_of = json::parse(R"({"oneOf": [{"type": "number"}, {"type": "integer"}]})");
    EXPECT_TRUE(check(one_of, json(1.5)).valid);
    EXPECT_FALSE(check(one_of, json(2)).valid);

    const json all_of = json::parse(R"({"allOf": [{"minimum": 0}, {"maximum": 5}]})");
    EXPECT_TRUE(check(all_of, json(3)).valid);
    EXPECT_FALSE(check(all_of, json(7)).valid);

    EXPECT_FALSE(check(json{{"not", {{"type", "null"}}}}, json(nullptr)).valid);
}

TEST(SchemaValidatorTest, BooleanSchemas) {
    EXPECT_TRUE(check(json(true), json{{"anything", 1}}).valid);
    auto outcome = check(json(false), json(1));
    EXPECT_FALSE(outcome.valid);
    EXPECT_TRUE(mentions(outcome.errors, "False schema"));
}

TEST(SchemaValidatorTest, InvalidSchemasAreSchemaErrors) {
    const json bad_schemas[] = {
        json("not a schema"),
        json{{"type", "widget"}},
        json{{"type", 5}},
        json{{"required", "name"}},
        json{{"properties", {{"a", 7}}}},
        json{{"minLength", -1}},
        json{{"pattern", "([a-z"}},
        json{{"pattern", std::string(2000, 'a')}},
        json{{"anyOf", json::array()}},
        json{{"$ref", "#/definitions/x"}},
    };
    for (const auto& schema : bad_schemas) {
        auto compiled = SchemaValidator::compile(schema);
        ASSERT_TRUE(is_error(compiled)) << schema.dump();
        EXPECT_EQ(get_error(compiled).category, ErrorCategory::Schema) << schema.dump();
        EXPECT_EQ(get_error(compiled).code, "invalid_schema") << schema.dump();
    }
}

TEST(SchemaValidatorTest, CompileErrorNamesLocation) {
    auto compiled = SchemaValidator::compile(json{{"properties", {{"a", {{"type", "nope"}}}}}});
    ASSERT_TRUE(is_error(compiled));
    EXPECT_NE(get_error(compiled).message.find("/properties/a"), std::string::npos);
}

}  // namespace
