#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "tools/document_engine.hpp"

namespace {

using facetmcp::core::errors::ErrorCategory;
using facetmcp::core::errors::get_error;
using facetmcp::core::errors::get_value;
using facetmcp::core::errors::is_error;
using facetmcp::tools::BasicDocumentEngine;
using nlohmann::json;

TEST(DocumentEngineTest, ParsesFacetsMembersAndLists) {
    BasicDocumentEngine engine;
    auto result = engine.execute(
        "# greeting document\n"
        "@user(role=\"admin\", level=3)\n"
        "  name: Alice\n"
        "  age: 25\n"
        "  active: true\n"
        "  tags:\n"
        "    - one\n"
        "    - 2\n"
        "\n"
        "@meta\n"
        "  title: 'quoted: text'\n");
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const json& doc = get_value(result);
    ASSERT_TRUE(doc.contains("user"));
    EXPECT_EQ(doc["user"]["_attrs"]["role"], "admin");
    EXPECT_EQ(doc["user"]["_attrs"]["level"], 3);
    EXPECT_EQ(doc["user"]["name"], "Alice");
    EXPECT_EQ(doc["user"]["age"], 25);
    EXPECT_EQ(doc["user"]["active"], true);
    EXPECT_EQ(doc["user"]["tags"], json::array({"one", 2}));
    EXPECT_EQ(doc["meta"]["title"], "quoted: text");
    EXPECT_FALSE(doc["meta"].contains("_attrs"));
}

TEST(DocumentEngineTest, EmptyDocumentFails) {
    BasicDocumentEngine engine;
    auto result = engine.execute("# only a comment\n\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Document);
    EXPECT_EQ(get_error(result).code, "document_empty");
}

TEST(DocumentEngineTest, ReportsLineNumbers) {
    BasicDocumentEngine engine;

    auto stray = engine.execute("  name: x\n");
    ASSERT_TRUE(is_error(stray));
    EXPECT_EQ(get_error(stray).message, "line 1: content before the first facet header");

    auto duplicate = engine.execute("@a\n  k: 1\n@a\n");
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).category, ErrorCategory::Document);
    EXPECT_EQ(get_error(duplicate).message, "line 3: duplicate facet: a");

    auto no_header = engine.execute("@a\nplain text\n");
    ASSERT_TRUE(is_error(no_header));
    EXPECT_EQ(get_error(no_header).code, "document_invalid");
}

TEST(DocumentEngineTest, RejectsListItemWithoutKey) {
    BasicDocumentEngine engine;
    auto result = engine.execute("@a\n  k: 1\n  - orphan\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("line 3"), std::string::npos);
}

TEST(DocumentEngineTest, RejectsBadAttributes) {
    BasicDocumentEngine engine;
    auto missing_eq = engine.execute("@a(flag)\n");
    ASSERT_TRUE(is_error(missing_eq));

    auto unterminated = engine.execute("@a(x=1\n");
    ASSERT_TRUE(is_error(unterminated));
    EXPECT_NE(get_error(unterminated).message.find("unterminated"), std::string::npos);
}

}  // namespace
