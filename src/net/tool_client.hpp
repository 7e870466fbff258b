#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"
#include "net/frame_reader.hpp"
#include "protocol/envelope.hpp"

namespace facetmcp::net {

// Blocking client for the newline-delimited envelope protocol. Each call
// waits for the next response frame on the connection; responses arrive in
// request order, so no correlation table is needed.
class ToolClient {
public:
    ToolClient() = default;
    ~ToolClient();

    ToolClient(const ToolClient&) = delete;
    ToolClient& operator=(const ToolClient&) = delete;

    core::errors::Result<bool> connect(const std::string& host, std::uint16_t port,
                                       int timeout_ms = 5000);

    // Sends one envelope and returns the next envelope received.
    core::errors::Result<protocol::Envelope> send(const protocol::Envelope& envelope,
                                                  int timeout_ms);

    // Writes a raw line (a trailing newline is added). Exposed for protocol
    // tests that need to send malformed frames.
    core::errors::Result<bool> send_raw(const std::string& line);

    core::errors::Result<protocol::Envelope> receive(int timeout_ms);

    // Returns the tool_result data object. An error envelope from the server
    // becomes a ServiceError carrying its error_type as the code.
    core::errors::Result<nlohmann::json> call_tool(const std::string& name,
                                                   const nlohmann::json& parameters,
                                                   int timeout_ms);

    // Returns the "tools" array of the tools_list response.
    core::errors::Result<nlohmann::json> list_tools(int timeout_ms);

    void close();
    bool connected() const { return fd_ >= 0; }

private:
    core::errors::Result<bool> ensure_connected() const;

    int fd_ = -1;
    FrameReader reader_{64 * 1024 * 1024};
    std::uint64_t next_call_id_ = 1;
};

}  // namespace facetmcp::net
