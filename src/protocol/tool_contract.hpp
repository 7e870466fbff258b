#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"

namespace facetmcp::protocol {

    // Parsed from a tool_call envelope's data. `id` is kept as the raw JSON
    // value so it echoes back byte-for-byte as tool_call_id.
    struct ToolCallRequest {
        nlohmann::json id;
        std::string name;
        nlohmann::json parameters = nlohmann::json::object();
    };

    // Exactly one of payload (success) or error_message/error_type (failure).
    struct ToolResult {
        bool success = false;
        nlohmann::json payload;
        std::string error_message;
        std::string error_type;
        double duration_ms = 0.0;

        static ToolResult ok(nlohmann::json value) {
            ToolResult result;
            result.success = true;
            result.payload = std::move(value);
            return result;
        }

        static ToolResult failed(const core::errors::ServiceError& error) {
            ToolResult result;
            result.success = false;
            result.error_message = error.message;
            result.error_type = core::errors::error_type_name(error.category);
            return result;
        }
    };

} // namespace facetmcp::protocol
