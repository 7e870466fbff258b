#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"

namespace facetmcp::validation {

struct ValidationOutcome {
    bool valid = true;
    std::vector<std::string> errors;
};

// One compiled (sub)schema. Built once by SchemaValidator::compile and never
// modified afterwards.
struct SchemaNode {
    bool reject_all = false;
    unsigned type_mask = 0;  // 0 = any type
    std::map<std::string, std::shared_ptr<const SchemaNode>> properties;
    std::vector<std::string> required;
    bool allow_additional = true;
    std::shared_ptr<const SchemaNode> additional_schema;
    std::shared_ptr<const SchemaNode> items;
    std::vector<std::shared_ptr<const SchemaNode>> tuple_items;
    std::optional<nlohmann::json> enum_values;
    std::optional<nlohmann::json> const_value;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<double> exclusive_minimum;
    std::optional<double> exclusive_maximum;
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    std::optional<std::size_t> min_items;
    std::optional<std::size_t> max_items;
    std::optional<std::regex> pattern;
    std::string pattern_text;
    std::vector<std::shared_ptr<const SchemaNode>> all_of;
    std::vector<std::shared_ptr<const SchemaNode>> any_of;
    std::vector<std::shared_ptr<const SchemaNode>> one_of;
    std::shared_ptr<const SchemaNode> not_schema;
};

// Validator for a Draft-7 subset: type, properties, required,
// additionalProperties, items, enum, const, the numeric and length bounds,
// pattern, allOf/anyOf/oneOf/not and boolean schemas. "$ref" is refused at
// compile time; annotation keywords (title, description, format, ...) are
// ignored.
//
// A compiled validator holds no mutable state, so one instance may be used
// from any number of threads.
class SchemaValidator {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // SchemaError when `schema` is not itself a valid schema.
    static core::errors::Result<std::shared_ptr<const SchemaValidator>> compile(
        const nlohmann::json& schema);

    // Reachable only through compile().
    SchemaValidator(PrivateTag, std::shared_ptr<const SchemaNode> root);

    ValidationOutcome validate(const nlohmann::json& data) const;

private:
    std::shared_ptr<const SchemaNode> root_;
};

}  // namespace facetmcp::validation
