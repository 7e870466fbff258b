#include "validation/schema_validator.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace facetmcp::validation {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

enum TypeBit : unsigned {
    kNull = 1u << 0,
    kBoolean = 1u << 1,
    kObject = 1u << 2,
    kArray = 1u << 3,
    kNumber = 1u << 4,
    kString = 1u << 5,
    kInteger = 1u << 6,
};

const std::pair<const char*, unsigned> kTypeNames[] = {
    {"null", kNull},     {"boolean", kBoolean}, {"object", kObject},
    {"array", kArray},   {"number", kNumber},   {"string", kString},
    {"integer", kInteger},
};

// std::regex compiles and matches recursively, so both the pattern and the
// text it is matched against are capped.
constexpr std::size_t kMaxPatternBytes = 1024;
constexpr std::size_t kMaxPatternSubjectBytes = 4096;

using NodePtr = std::shared_ptr<const SchemaNode>;
using CompileResult = core::errors::Result<NodePtr>;

ServiceError schema_error(const std::string& where, const std::string& detail) {
    return ServiceError{ErrorCategory::Schema,
                        "Invalid schema at " + (where.empty() ? std::string("/") : where) +
                            ": " + detail,
                        "invalid_schema"};
}

std::string render(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string at(const std::string& path) {
    return " at " + (path.empty() ? std::string("/") : path);
}

std::string escape_pointer(const std::string& token) {
    std::string out;
    for (const char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

bool is_integral(const json& value) {
    if (value.is_number_integer()) {
        return true;
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
}

bool matches_type(const json& value, const unsigned mask) {
    if (mask == 0) {
        return true;
    }
    if ((mask & kNull) && value.is_null()) return true;
    if ((mask & kBoolean) && value.is_boolean()) return true;
    if ((mask & kObject) && value.is_object()) return true;
    if ((mask & kArray) && value.is_array()) return true;
    if ((mask & kNumber) && value.is_number()) return true;
    if ((mask & kString) && value.is_string()) return true;
    if ((mask & kInteger) && is_integral(value)) return true;
    return false;
}

std::string describe_types(const unsigned mask) {
    std::string out;
    for (const auto& entry : kTypeNames) {
        if ((mask & entry.second) == 0) {
            continue;
        }
        if (!out.empty()) {
            out += ", ";
        }
        out += "'" + std::string(entry.first) + "'";
    }
    return out;
}

// Number of Unicode code points; JSON Schema lengths are not byte counts.
std::size_t utf8_length(const std::string& text) {
    std::size_t count = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

CompileResult compile_node(const json& schema, const std::string& where);

core::errors::Result<std::vector<NodePtr>> compile_list(const json& value,
                                                        const std::string& where,
                                                        const std::string& keyword) {
    if (!value.is_array() || value.empty()) {
        return schema_error(where, "'" + keyword + "' must be a non-empty array of schemas");
    }
    std::vector<NodePtr> nodes;
    for (std::size_t i = 0; i < value.size(); ++i) {
        auto node = compile_node(value[i], where + "/" + keyword + "/" + std::to_string(i));
        if (core::errors::is_error(node)) {
            return core::errors::get_error(node);
        }
        nodes.push_back(core::errors::get_value(node));
    }
    return nodes;
}

std::optional<ServiceError> read_number(const json& schema, const char* keyword,
                                        const std::string& where,
                                        std::optional<double>& target) {
    const auto it = schema.find(keyword);
    if (it == schema.end()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        return schema_error(where, "'" + std::string(keyword) + "' must be a number");
    }
    target = it->get<double>();
    return std::nullopt;
}

std::optional<ServiceError> read_count(const json& schema, const char* keyword,
                                       const std::string& where,
                                       std::optional<std::size_t>& target) {
    const auto it = schema.find(keyword);
    if (it == schema.end()) {
        return std::nullopt;
    }
    if (!is_integral(*it) || it->get<double>() < 0) {
        return schema_error(where,
                            "'" + std::string(keyword) + "' must be a non-negative integer");
    }
    if (it->is_number_unsigned()) {
        target = static_cast<std::size_t>(it->get<std::uint64_t>());
        return std::nullopt;
    }
    // Integral doubles such as 1e20; anything at or past 2^64 saturates.
    const double count = it->get<double>();
    constexpr double kSizeLimit = 18446744073709551616.0;
    target = count >= kSizeLimit ? std::numeric_limits<std::size_t>::max()
                                 : static_cast<std::size_t>(count);
    return std::nullopt;
}

CompileResult compile_node(const json& schema, const std::string& where) {
    auto node = std::make_shared<SchemaNode>();
    if (schema.is_boolean()) {
        node->reject_all = !schema.get<bool>();
        return NodePtr(node);
    }
    if (!schema.is_object()) {
        return schema_error(where, "a schema must be an object or a boolean");
    }
    if (schema.contains("$ref")) {
        return schema_error(where, "'$ref' is not supported");
    }

    if (const auto it = schema.find("type"); it != schema.end()) {
        std::vector<json> names;
        if (it->is_string()) {
            names.push_back(*it);
        } else if (it->is_array() && !it->empty()) {
            names.assign(it->begin(), it->end());
        } else {
            return schema_error(where, "'type' must be a string or a non-empty array");
        }
        for (const auto& name : names) {
            if (!name.is_string()) {
                return schema_error(where, "'type' entries must be strings");
            }
            unsigned bit = 0;
            for (const auto& entry : kTypeNames) {
                if (name.get<std::string>() == entry.first) {
                    bit = entry.second;
                }
            }
            if (bit == 0) {
                return schema_error(where, render(name) + " is not a valid type");
            }
            node->type_mask |= bit;
        }
    }

    if (const auto it = schema.find("properties"); it != schema.end()) {
        if (!it->is_object()) {
            return schema_error(where, "'properties' must be an object");
        }
        for (const auto& item : it->items()) {
            auto child = compile_node(item.value(),
                                      where + "/properties/" + escape_pointer(item.key()));
            if (core::errors::is_error(child)) {
                return core::errors::get_error(child);
            }
            node->properties.emplace(item.key(), core::errors::get_value(child));
        }
    }

    if (const auto it = schema.find("required"); it != schema.end()) {
        if (!it->is_array()) {
            return schema_error(where, "'required' must be an array of strings");
        }
        for (const auto& name : *it) {
            if (!name.is_string()) {
                return schema_error(where, "'required' must be an array of strings");
            }
            node->required.push_back(name.get<std::string>());
        }
    }

    if (const auto it = schema.find("additionalProperties"); it != schema.end()) {
        if (it->is_boolean()) {
            node->allow_additional = it->get<bool>();
        } else {
            auto child = compile_node(*it, where + "/additionalProperties");
            if (core::errors::is_error(child)) {
                return core::errors::get_error(child);
            }
            node->additional_schema = core::errors::get_value(child);
        }
    }

    if (const auto it = schema.find("items"); it != schema.end()) {
        if (it->is_array()) {
            for (std::size_t i = 0; i < it->size(); ++i) {
                auto child = compile_node((*it)[i], where + "/items/" + std::to_string(i));
                if (core::errors::is_error(child)) {
                    return core::errors::get_error(child);
                }
                node->tuple_items.push_back(core::errors::get_value(child));
            }
        } else {
            auto child = compile_node(*it, where + "/items");
            if (core::errors::is_error(child)) {
                return core::errors::get_error(child);
            }
            node->items = core::errors::get_value(child);
        }
    }

    if (const auto it = schema.find("enum"); it != schema.end()) {
        if (!it->is_array()) {
            return schema_error(where, "'enum' must be an array");
        }
        node->enum_values = *it;
    }
    if (const auto it = schema.find("const"); it != schema.end()) {
        node->const_value = *it;
    }

    const std::optional<ServiceError> bound_failures[] = {
        read_number(schema, "minimum", where, node->minimum),
        read_number(schema, "maximum", where, node->maximum),
        read_number(schema, "exclusiveMinimum", where, node->exclusive_minimum),
        read_number(schema, "exclusiveMaximum", where, node->exclusive_maximum),
        read_count(schema, "minLength", where, node->min_length),
        read_count(schema, "maxLength", where, node->max_length),
        read_count(schema, "minItems", where, node->min_items),
        read_count(schema, "maxItems", where, node->max_items),
    };
    for (const auto& failure : bound_failures) {
        if (failure.has_value()) {
            return failure.value();
        }
    }

    if (const auto it = schema.find("pattern"); it != schema.end()) {
        if (!it->is_string()) {
            return schema_error(where, "'pattern' must be a string");
        }
        node->pattern_text = it->get<std::string>();
        if (node->pattern_text.size() > kMaxPatternBytes) {
            return schema_error(where, "'pattern' is longer than " +
                                           std::to_string(kMaxPatternBytes) + " bytes");
        }
        try {
            node->pattern.emplace(node->pattern_text, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return schema_error(where, "'pattern' is not a valid regular expression: " +
                                           std::string(e.what()));
        }
    }

    const std::pair<const char*, std::vector<NodePtr>*> combinators[] = {
        {"allOf", &node->all_of},
        {"anyOf", &node->any_of},
        {"oneOf", &node->one_of},
    };
    for (const auto& combinator : combinators) {
        const auto it = schema.find(combinator.first);
        if (it == schema.end()) {
            continue;
        }
        auto list = compile_list(*it, where, combinator.first);
        if (core::errors::is_error(list)) {
            return core::errors::get_error(list);
        }
        *combinator.second = core::errors::get_value(list);
    }

    if (const auto it = schema.find("not"); it != schema.end()) {
        auto child = compile_node(*it, where + "/not");
        if (core::errors::is_error(child)) {
            return core::errors::get_error(child);
        }
        node->not_schema = core::errors::get_value(child);
    }

    return NodePtr(node);
}

void check(const SchemaNode& node, const json& value, const std::string& path,
           std::vector<std::string>& errors);

bool passes(const SchemaNode& node, const json& value) {
    std::vector<std::string> scratch;
    check(node, value, "", scratch);
    return scratch.empty();
}

void check(const SchemaNode& node, const json& value, const std::string& path,
           std::vector<std::string>& errors) {
    if (node.reject_all) {
        errors.push_back("False schema does not allow " + render(value) + at(path));
        return;
    }

    if (!matches_type(value, node.type_mask)) {
        errors.push_back(render(value) + " is not of type " +
                         describe_types(node.type_mask) + at(path));
        return;
    }

    if (node.enum_values.has_value()) {
        bool found = false;
        for (const auto& candidate : node.enum_values.value()) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            errors.push_back(render(value) + " is not one of " +
                             render(node.enum_values.value()) + at(path));
        }
    }
    if (node.const_value.has_value() && node.const_value.value() != value) {
        errors.push_back(render(node.const_value.value()) + " was expected" + at(path));
    }

    if (value.is_number()) {
        const double number = value.get<double>();
        if (node.minimum && number < *node.minimum) {
            errors.push_back(render(value) + " is less than the minimum of " +
                             render(*node.minimum) + at(path));
        }
        if (node.maximum && number > *node.maximum) {
            errors.push_back(render(value) + " is greater than the maximum of " +
                             render(*node.maximum) + at(path));
        }
        if (node.exclusive_minimum && number <= *node.exclusive_minimum) {
            errors.push_back(render(value) + " is less than or equal to the minimum of " +
                             render(*node.exclusive_minimum) + at(path));
        }
        if (node.exclusive_maximum && number >= *node.exclusive_maximum) {
            errors.push_back(render(value) +
                             " is greater than or equal to the maximum of " +
                             render(*node.exclusive_maximum) + at(path));
        }
    }

    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        const std::size_t length = utf8_length(text);
        if (node.min_length && length < *node.min_length) {
            errors.push_back(render(value) + " is too short" + at(path));
        }
        if (node.max_length && length > *node.max_length) {
            errors.push_back(render(value) + " is too long" + at(path));
        }
        if (node.pattern) {
            if (text.size() > kMaxPatternSubjectBytes) {
                errors.push_back("string of " + std::to_string(text.size()) +
                                 " bytes is too long to match against " +
                                 render(node.pattern_text) + " (limit " +
                                 std::to_string(kMaxPatternSubjectBytes) + " bytes)" +
                                 at(path));
            } else {
                try {
                    if (!std::regex_search(text, *node.pattern)) {
                        errors.push_back(render(value) + " does not match " +
                                         render(node.pattern_text) + at(path));
                    }
                } catch (const std::regex_error& e) {
                    errors.push_back("pattern " + render(node.pattern_text) +
                                     " could not be evaluated: " + std::string(e.what()) +
                                     at(path));
                }
            }
        }
    }

    if (value.is_object()) {
        for (const auto& name : node.required) {
            if (!value.contains(name)) {
                errors.push_back("'" + name + "' is a required property" + at(path));
            }
        }
        std::vector<std::string> unexpected;
        for (const auto& item : value.items()) {
            const std::string child_path = path + "/" + escape_pointer(item.key());
            const auto prop = node.properties.find(item.key());
            if (prop != node.properties.end()) {
                check(*prop->second, item.value(), child_path, errors);
            } else if (node.additional_schema) {
                check(*node.additional_schema, item.value(), child_path, errors);
            } else if (!node.allow_additional) {
                unexpected.push_back(item.key());
            }
        }
        if (!unexpected.empty()) {
            std::string names;
            for (const auto& name : unexpected) {
                names += (names.empty() ? "'" : ", '") + name + "'";
            }
            errors.push_back("Additional properties are not allowed (" + names +
                             (unexpected.size() == 1 ? " was" : " were") +
                             " unexpected)" + at(path));
        }
    }

    if (value.is_array()) {
        if (node.min_items && value.size() < *node.min_items) {
            errors.push_back(render(value) + " is too short" + at(path));
        }
        if (node.max_items && value.size() > *node.max_items) {
            errors.push_back(render(value) + " is too long" + at(path));
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            const std::string child_path = path + "/" + std::to_string(i);
            if (i < node.tuple_items.size()) {
                check(*node.tuple_items[i], value[i], child_path, errors);
            } else if (node.items) {
                check(*node.items, value[i], child_path, errors);
            }
        }
    }

    for (const auto& sub : node.all_of) {
        check(*sub, value, path, errors);
    }
    if (!node.any_of.empty()) {
        bool any = false;
        for (const auto& sub : node.any_of) {
            if (passes(*sub, value)) {
                any = true;
                break;
            }
        }
        if (!any) {
            errors.push_back(render(value) + " is not valid under any of the given schemas" +
                             at(path));
        }
    }
    if (!node.one_of.empty()) {
        std::size_t matched = 0;
        for (const auto& sub : node.one_of) {
            if (passes(*sub, value)) {
                ++matched;
            }
        }
        if (matched == 0) {
            errors.push_back(render(value) + " is not valid under any of the given schemas" +
                             at(path));
        } else if (matched > 1) {
            errors.push_back(render(value) + " is valid under more than one of the given schemas" +
                             at(path));
        }
    }
    if (node.not_schema && passes(*node.not_schema, value)) {
        errors.push_back(render(value) + " should not be valid under the 'not' schema" +
                         at(path));
    }
}

}  // namespace

SchemaValidator::SchemaValidator(PrivateTag, std::shared_ptr<const SchemaNode> root)
    : root_(std::move(root)) {}

core::errors::Result<std::shared_ptr<const SchemaValidator>> SchemaValidator::compile(
    const json& schema) {
    auto root = compile_node(schema, "");
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }
    return std::shared_ptr<const SchemaValidator>(
        std::make_shared<SchemaValidator>(PrivateTag{}, core::errors::get_value(root)));
}

ValidationOutcome SchemaValidator::validate(const json& data) const {
    ValidationOutcome outcome;
    check(*root_, data, "", outcome.errors);
    outcome.valid = outcome.errors.empty();
    return outcome;
}

}  // namespace facetmcp::validation
