#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"
#include "protocol/envelope.hpp"
#include "protocol/tool_contract.hpp"

namespace facetmcp::protocol {

// Wire form of one envelope: a JSON object with "type" (string) and "data"
// (object) required, "id" (string) and "timestamp" (number) optional.
core::errors::Result<Envelope> decode(std::string_view raw);

// Compact JSON text without a trailing newline. Invalid UTF-8 in strings is
// replaced rather than thrown, so encoding never fails.
std::string encode(const Envelope& envelope);

// Reads name/id/parameters out of a tool_call envelope.
core::errors::Result<ToolCallRequest> read_tool_call(const Envelope& envelope);

Envelope make_tool_result(const nlohmann::json& tool_call_id, const ToolResult& result);

Envelope make_tools_list(nlohmann::json tools);

Envelope make_error(const std::string& message, const std::string& error_type,
                    const std::vector<std::string>& available_tools = {},
                    const std::vector<std::string>& suggestions = {});

double now_unix_seconds();

}  // namespace facetmcp::protocol
