#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace facetmcp::protocol {

    enum class MessageType {
        ToolCall,
        ToolResult,
        ToolsList,
        ListTools,
        Error,
        Ping,
        Pong,
        Unrecognized   // any other tag; kept so dispatch can name it back
    };

    // The top-level wire message. `type_name` always holds the tag exactly as
    // it appeared on the wire; `type` is its parsed form.
    struct Envelope {
        MessageType type = MessageType::Error;
        std::string type_name = "error";
        nlohmann::json data = nlohmann::json::object();
        std::optional<std::string> id;
        std::optional<double> timestamp;
    };

    inline std::string to_string(const MessageType type) {
        switch (type) {
            case MessageType::ToolCall:
                return "tool_call";
            case MessageType::ToolResult:
                return "tool_result";
            case MessageType::ToolsList:
                return "tools_list";
            case MessageType::ListTools:
                return "list_tools";
            case MessageType::Error:
                return "error";
            case MessageType::Ping:
                return "ping";
            case MessageType::Pong:
                return "pong";
            case MessageType::Unrecognized:
                return "unrecognized";
        }
        return "unrecognized";
    }

    inline MessageType parse_message_type(const std::string& name) {
        if (name == "tool_call") return MessageType::ToolCall;
        if (name == "tool_result") return MessageType::ToolResult;
        if (name == "tools_list") return MessageType::ToolsList;
        if (name == "list_tools") return MessageType::ListTools;
        if (name == "error") return MessageType::Error;
        if (name == "ping") return MessageType::Ping;
        if (name == "pong") return MessageType::Pong;
        return MessageType::Unrecognized;
    }

    inline Envelope make_envelope(const MessageType type, nlohmann::json data) {
        Envelope envelope;
        envelope.type = type;
        envelope.type_name = to_string(type);
        envelope.data = std::move(data);
        return envelope;
    }

} // namespace facetmcp::protocol
