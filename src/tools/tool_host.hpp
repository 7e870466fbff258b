#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "core/errors/service_errors.hpp"
#include "policy/policy_guard.hpp"
#include "tools/document_engine.hpp"
#include "validation/validator_cache.hpp"

namespace facetmcp::tools {

struct ExecuteRequest {
    std::string facet_source;
    nlohmann::json variables = nlohmann::json::object();
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct LensRequest {
    std::string input_string;
    std::vector<std::string> lenses;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct SchemaRequest {
    nlohmann::json json_object;
    nlohmann::json json_schema;
};

// Parameter readers; a missing or mistyped field is a Parameter error.
core::errors::Result<ExecuteRequest> read_execute_request(const nlohmann::json& parameters);
core::errors::Result<LensRequest> read_lens_request(const nlohmann::json& parameters);
core::errors::Result<SchemaRequest> read_schema_request(const nlohmann::json& parameters);

// Runs the three tools against the shared collaborators. Safe to call from
// several connection threads at once.
class ToolHost {
public:
    ToolHost(const DocumentEngine& engine, validation::ValidatorCache& validators,
             core::config::ToolConfig tool_config = {});

    // Document object with a "_meta" member appended.
    core::errors::Result<nlohmann::json> execute(const ExecuteRequest& request) const;

    // The transformed string.
    core::errors::Result<nlohmann::json> apply_lenses(const LensRequest& request) const;

    // {"valid": bool, "errors": [..] | null}
    core::errors::Result<nlohmann::json> validate_schema(const SchemaRequest& request) const;

private:
    const DocumentEngine& engine_;
    validation::ValidatorCache& validators_;
    policy::PolicyGuard policy_guard_;
};

}  // namespace facetmcp::tools
