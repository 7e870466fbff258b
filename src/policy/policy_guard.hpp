#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "core/errors/service_errors.hpp"

namespace facetmcp::policy {

// Enforces the per-tool limits and the lens allow-list from ToolConfig.
class PolicyGuard {
public:
    explicit PolicyGuard(core::config::ToolConfig tool_config = {});

    core::errors::Result<std::string> validate_facet_source(
        const std::string& facet_source) const;

    core::errors::Result<std::size_t> validate_variables(
        const nlohmann::json& variables) const;

    core::errors::Result<std::vector<std::string>> validate_lens_chain(
        const std::vector<std::string>& lenses) const;

    bool is_lens_allowed(const std::string& lens_name) const;

private:
    core::config::ToolConfig tool_config_;
};

}  // namespace facetmcp::policy
