#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"

namespace facetmcp::tools {

// Closed set of tools the server knows how to run. DispatchEngine switches
// over this enum; a tool without a handler trips -Wswitch.
enum class ToolId {
    Execute,
    ApplyLenses,
    ValidateSchema
};

struct ToolDescriptor {
    ToolId id;
    std::string name;
    std::string description;
    nlohmann::json parameter_schema;
};

// Immutable after construction; shared by reference across connection
// threads without locking.
class ToolRegistry {
public:
    // All built-in tools, in catalogue order.
    static const std::vector<ToolDescriptor>& builtin_tools();

    // Registry limited to `enabled_tools`. Unknown names are a Config error.
    static core::errors::Result<ToolRegistry> create(
        const std::vector<std::string>& enabled_tools);

    // Metadata only: [{name, description, parameters}].
    nlohmann::json list() const;

    core::errors::Result<const ToolDescriptor*> resolve(const std::string& name) const;

    std::vector<std::string> names() const;

    std::size_t size() const { return tools_.size(); }

private:
    explicit ToolRegistry(std::vector<ToolDescriptor> tools);

    std::vector<ToolDescriptor> tools_;
};

}  // namespace facetmcp::tools
