#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"
#include "protocol/envelope.hpp"
#include "runtime/envelope_handler.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_host.hpp"
#include "tools/tool_registry.hpp"
#include "validation/validator_cache.hpp"

namespace facetmcp::runtime {

struct DispatchOptions {
    // Check tool_call parameters against the tool's parameter schema before
    // the handler runs.
    bool validate_parameters = true;
};

// Turns one inbound envelope into exactly one response envelope:
//
//   tool_call   -> tool_result, or error (unknown tool / no name)
//   list_tools  -> tools_list
//   anything    -> error naming the type
//
// Handler failures are reported inside tool_result with success=false; they
// never become transport errors. The engine holds no per-call state, so
// connection threads share one instance.
class DispatchEngine : public EnvelopeHandler {
public:
    DispatchEngine(const tools::ToolRegistry& registry, const tools::ToolHost& host,
                   validation::ValidatorCache& validators, DispatchOptions options = {});

    protocol::Envelope handle(
        const protocol::Envelope& request,
        const std::shared_ptr<std::atomic_bool>& cancel_token = nullptr) const override;

    // Runs a resolved tool. Exceptions from the handler are converted into a
    // failed ToolResult.
    protocol::ToolResult run_tool(const tools::ToolDescriptor& tool,
                                  const nlohmann::json& parameters,
                                  const std::shared_ptr<std::atomic_bool>& cancel_token) const;

private:
    protocol::Envelope handle_tool_call(
        const protocol::Envelope& request,
        const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    core::errors::Result<nlohmann::json> invoke(
        tools::ToolId id, const nlohmann::json& parameters,
        const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    core::errors::Result<bool> check_parameters(const tools::ToolDescriptor& tool,
                                                const nlohmann::json& parameters) const;

    std::vector<std::string> suggest(const std::string& unknown_name) const;

    const tools::ToolRegistry& registry_;
    const tools::ToolHost& host_;
    validation::ValidatorCache& validators_;
    DispatchOptions options_;
};

}  // namespace facetmcp::runtime
