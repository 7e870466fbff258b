#include "tools/tool_registry.hpp"

#include <algorithm>
#include <utility>

namespace facetmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

std::vector<ToolDescriptor> make_builtin_tools() {
    std::vector<ToolDescriptor> tools;

    tools.push_back(ToolDescriptor{
        ToolId::Execute,
        "execute",
        "Executes a complete FACET document. Use for multi-step pipelines with "
        "input processing, transformations and output contracts.",
        json::parse(R"({
            "type": "object",
            "properties": {
                "facet_source": {
                    "type": "string",
                    "description": "Complete FACET document text to execute"
                },
                "variables": {
                    "type": "object",
                    "description": "Optional variables for {{name}} template substitution",
                    "additionalProperties": true
                }
            },
            "required": ["facet_source"]
        })")});

    tools.push_back(ToolDescriptor{
        ToolId::ApplyLenses,
        "apply_lenses",
        "Applies one or more FACET lenses to input text, left to right. Use for "
        "atomic text transformations like trimming, dedenting or squeezing spaces.",
        json::parse(R"({
            "type": "object",
            "properties": {
                "input_string": {
                    "type": "string",
                    "description": "Text to process with lenses"
                },
                "lenses": {
                    "type": "array",
                    "items": {"type": "string"},
                    "description": "Lenses to apply, e.g. [\"dedent\", \"trim\", \"limit(100)\"]"
                }
            },
            "required": ["input_string", "lenses"]
        })")});

    tools.push_back(ToolDescriptor{
        ToolId::ValidateSchema,
        "validate_schema",
        "Validates JSON data against a JSON Schema. Use to check data quality "
        "and format before returning results to users.",
        json::parse(R"({
            "type": "object",
            "properties": {
                "json_object": {
                    "description": "JSON value to validate"
                },
                "json_schema": {
                    "type": "object",
                    "description": "JSON Schema to validate against"
                }
            },
            "required": ["json_object", "json_schema"]
        })")});

    return tools;
}

}  // namespace

const std::vector<ToolDescriptor>& ToolRegistry::builtin_tools() {
    static const std::vector<ToolDescriptor> tools = make_builtin_tools();
    return tools;
}

ToolRegistry::ToolRegistry(std::vector<ToolDescriptor> tools)
    : tools_(std::move(tools)) {}

core::errors::Result<ToolRegistry> ToolRegistry::create(
    const std::vector<std::string>& enabled_tools) {
    const auto& builtin = builtin_tools();
    for (const auto& name : enabled_tools) {
        const auto found = std::find_if(builtin.begin(), builtin.end(),
                                        [&name](const ToolDescriptor& tool) {
                                            return tool.name == name;
                                        });
        if (found == builtin.end()) {
            return ServiceError{ErrorCategory::Config, "Unknown tool in enabled set: " + name,
                                "unknown_enabled_tool",
                                "Valid tools: execute, apply_lenses, validate_schema"};
        }
    }

    std::vector<ToolDescriptor> selected;
    for (const auto& tool : builtin) {
        if (std::find(enabled_tools.begin(), enabled_tools.end(), tool.name) !=
            enabled_tools.end()) {
            selected.push_back(tool);
        }
    }
    return ToolRegistry(std::move(selected));
}

json ToolRegistry::list() const {
    json tools = json::array();
    for (const auto& tool : tools_) {
        tools.push_back({{"name", tool.name},
                         {"description", tool.description},
                         {"parameters", tool.parameter_schema}});
    }
    return tools;
}

core::errors::Result<const ToolDescriptor*> ToolRegistry::resolve(
    const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return ServiceError{ErrorCategory::NotFound, "Unknown tool: " + name, "unknown_tool"};
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.push_back(tool.name);
    }
    return out;
}

}  // namespace facetmcp::tools
