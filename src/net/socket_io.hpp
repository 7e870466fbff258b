#pragma once

#include <cstdint>
#include <string>
#include "core/errors/service_errors.hpp"
#include "net/frame_reader.hpp"

namespace facetmcp::net {

enum class ReadStatus {
    Data,
    Timeout,
    Closed,
    Failed
};

// Bound, listening TCP socket for host:port (port 0 picks a free port).
core::errors::Result<int> listen_tcp(const std::string& host, std::uint16_t port,
                                     int backlog);

core::errors::Result<std::uint16_t> local_port(int fd);

core::errors::Result<int> connect_tcp(const std::string& host, std::uint16_t port,
                                      int timeout_ms);

// True once `fd` is readable, false when the timeout passes first.
bool wait_readable(int fd, int timeout_ms);

// One recv() into `reader` after waiting up to timeout_ms (-1 = forever).
ReadStatus read_some(int fd, FrameReader& reader, int timeout_ms);

// Writes the whole buffer. Never raises SIGPIPE.
core::errors::Result<bool> write_all(int fd, const std::string& data);

void set_send_timeout(int fd, int timeout_ms);

void close_fd(int fd);

}  // namespace facetmcp::net
