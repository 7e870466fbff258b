#include "net/tool_client.hpp"

#include <chrono>
#include "net/socket_io.hpp"
#include "protocol/message_codec.hpp"

namespace facetmcp::net {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;
using protocol::Envelope;
using protocol::MessageType;

namespace {

ServiceError error_from_envelope(const Envelope& envelope) {
    const std::string message = envelope.data.value("error", std::string("unknown error"));
    const std::string error_type = envelope.data.value("error_type", std::string("unknown"));
    const ErrorCategory category =
        error_type == "NotFoundError" ? ErrorCategory::NotFound : ErrorCategory::Internal;
    return ServiceError{category, message, error_type};
}

}  // namespace

ToolClient::~ToolClient() {
    close();
}

core::errors::Result<bool> ToolClient::connect(const std::string& host, const std::uint16_t port,
                                               const int timeout_ms) {
    close();
    auto fd = connect_tcp(host, port, timeout_ms);
    if (core::errors::is_error(fd)) {
        return core::errors::get_error(fd);
    }
    fd_ = core::errors::get_value(fd);
    reader_ = FrameReader{64 * 1024 * 1024};
    return true;
}

core::errors::Result<bool> ToolClient::ensure_connected() const {
    if (fd_ < 0) {
        return ServiceError{ErrorCategory::Transport, "Client is not connected",
                            "not_connected"};
    }
    return true;
}

core::errors::Result<bool> ToolClient::send_raw(const std::string& line) {
    if (auto ready = ensure_connected(); core::errors::is_error(ready)) {
        return ready;
    }
    return write_all(fd_, line + "\n");
}

core::errors::Result<Envelope> ToolClient::receive(const int timeout_ms) {
    if (auto ready = ensure_connected(); core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (auto frame = reader_.next_frame(); frame.has_value()) {
            if (frame->empty()) {
                continue;
            }
            return protocol::decode(*frame);
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ServiceError{ErrorCategory::Transport,
                                "Timed out after " + std::to_string(timeout_ms) +
                                    " ms waiting for a response",
                                "timeout"};
        }

        switch (read_some(fd_, reader_, static_cast<int>(remaining.count()))) {
            case ReadStatus::Data:
            case ReadStatus::Timeout:
                break;
            case ReadStatus::Closed:
                close();
                return ServiceError{ErrorCategory::Transport, "Connection closed by server",
                                    "connection_closed"};
            case ReadStatus::Failed:
                close();
                return ServiceError{ErrorCategory::Transport, "Read from server failed",
                                    "read_failed"};
        }
    }
}

core::errors::Result<Envelope> ToolClient::send(const Envelope& envelope, const int timeout_ms) {
    if (auto sent = send_raw(protocol::encode(envelope)); core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    return receive(timeout_ms);
}

core::errors::Result<json> ToolClient::call_tool(const std::string& name,
                                                 const json& parameters, const int timeout_ms) {
    const std::string call_id = "call-" + std::to_string(next_call_id_++);
    Envelope request = protocol::make_envelope(
        MessageType::ToolCall, json{{"id", call_id}, {"name", name}, {"parameters", parameters}});
    request.id = call_id;

    auto response = send(request, timeout_ms);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    const Envelope& envelope = core::errors::get_value(response);
    if (envelope.type == MessageType::ToolResult) {
        return envelope.data;
    }
    if (envelope.type == MessageType::Error) {
        return error_from_envelope(envelope);
    }
    return ServiceError{ErrorCategory::Transport,
                        "Unexpected response type '" + envelope.type_name + "' to tool_call",
                        "unexpected_response"};
}

core::errors::Result<json> ToolClient::list_tools(const int timeout_ms) {
    auto response = send(protocol::make_envelope(MessageType::ListTools, json::object()),
                         timeout_ms);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    const Envelope& envelope = core::errors::get_value(response);
    if (envelope.type == MessageType::Error) {
        return error_from_envelope(envelope);
    }
    if (envelope.type != MessageType::ToolsList || !envelope.data.contains("tools")) {
        return ServiceError{ErrorCategory::Transport,
                            "Unexpected response type '" + envelope.type_name + "' to list_tools",
                            "unexpected_response"};
    }
    return envelope.data.at("tools");
}

void ToolClient::close() {
    close_fd(fd_);
    fd_ = -1;
}

}  // namespace facetmcp::net
