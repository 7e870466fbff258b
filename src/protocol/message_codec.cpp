#include "protocol/message_codec.hpp"

#include <chrono>
#include <utility>
#include "protocol/json_depth.hpp"

namespace facetmcp::protocol {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

ServiceError decode_failure(const std::string& message, const std::string& code) {
    return ServiceError{ErrorCategory::Decode, message, code};
}

}  // namespace

double now_unix_seconds() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

core::errors::Result<Envelope> decode(std::string_view raw) {
    if (exceeds_json_depth(raw)) {
        return decode_failure("JSON nesting exceeds " + std::to_string(kMaxJsonDepth) +
                                  " levels",
                              "nesting_too_deep");
    }
    json parsed = json::parse(raw.begin(), raw.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return decode_failure("Invalid JSON format", "invalid_json");
    }
    if (!parsed.is_object()) {
        return decode_failure("Envelope must be a JSON object", "invalid_envelope");
    }

    const auto type_it = parsed.find("type");
    if (type_it == parsed.end() || !type_it->is_string()) {
        return decode_failure("Envelope is missing a string 'type' field",
                              "missing_type");
    }
    const auto data_it = parsed.find("data");
    if (data_it == parsed.end() || !data_it->is_object()) {
        return decode_failure("Envelope is missing an object 'data' field",
                              "missing_data");
    }

    Envelope envelope;
    envelope.type_name = type_it->get<std::string>();
    envelope.type = parse_message_type(envelope.type_name);
    envelope.data = std::move(*data_it);

    const auto id_it = parsed.find("id");
    if (id_it != parsed.end() && !id_it->is_null()) {
        if (!id_it->is_string()) {
            return decode_failure("Envelope 'id' must be a string", "invalid_id");
        }
        envelope.id = id_it->get<std::string>();
    }

    const auto ts_it = parsed.find("timestamp");
    if (ts_it != parsed.end() && !ts_it->is_null()) {
        if (!ts_it->is_number()) {
            return decode_failure("Envelope 'timestamp' must be numeric",
                                  "invalid_timestamp");
        }
        envelope.timestamp = ts_it->get<double>();
    }

    return envelope;
}

std::string encode(const Envelope& envelope) {
    json out;
    out["type"] = envelope.type_name;
    out["data"] = envelope.data;
    if (envelope.id.has_value()) {
        out["id"] = envelope.id.value();
    }
    if (envelope.timestamp.has_value()) {
        out["timestamp"] = envelope.timestamp.value();
    }
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<ToolCallRequest> read_tool_call(const Envelope& envelope) {
    const json& data = envelope.data;
    if (!data.is_object()) {
        return ServiceError{ErrorCategory::Decode, "tool_call data must be an object",
                            "invalid_envelope"};
    }
    const auto name_it = data.find("name");
    if (name_it == data.end() || !name_it->is_string()) {
        return ServiceError{ErrorCategory::Decode,
                            "tool_call data is missing a string 'name' field",
                            "missing_tool_name"};
    }

    ToolCallRequest request;
    request.name = name_it->get<std::string>();
    const auto id_it = data.find("id");
    if (id_it != data.end()) {
        request.id = *id_it;
    }

    const auto params_it = data.find("parameters");
    if (params_it != data.end() && !params_it->is_null()) {
        if (!params_it->is_object()) {
            return ServiceError{ErrorCategory::Decode,
                                "tool_call 'parameters' must be an object",
                                "invalid_parameters"};
        }
        request.parameters = *params_it;
    }
    return request;
}

Envelope make_tool_result(const json& tool_call_id, const ToolResult& result) {
    json data;
    data["tool_call_id"] = tool_call_id;
    data["success"] = result.success;
    if (result.success) {
        data["result"] = result.payload;
    } else {
        data["result"] = nullptr;
        data["error"] = result.error_message;
        data["error_type"] = result.error_type;
    }
    data["execution_time_ms"] = result.duration_ms;

    Envelope envelope = make_envelope(MessageType::ToolResult, std::move(data));
    envelope.timestamp = now_unix_seconds();
    return envelope;
}

Envelope make_tools_list(json tools) {
    Envelope envelope =
        make_envelope(MessageType::ToolsList, json{{"tools", std::move(tools)}});
    envelope.timestamp = now_unix_seconds();
    return envelope;
}

Envelope make_error(const std::string& message, const std::string& error_type,
                    const std::vector<std::string>& available_tools,
                    const std::vector<std::string>& suggestions) {
    json data;
    data["error"] = message;
    data["error_type"] = error_type;
    if (!available_tools.empty()) {
        data["available_tools"] = available_tools;
    }
    if (!suggestions.empty()) {
        data["suggestions"] = suggestions;
    }

    Envelope envelope = make_envelope(MessageType::Error, std::move(data));
    envelope.timestamp = now_unix_seconds();
    return envelope;
}

}  // namespace facetmcp::protocol
