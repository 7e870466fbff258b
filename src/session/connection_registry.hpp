#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/service_errors.hpp"

namespace facetmcp::session {

enum class ConnectionState {
    Open,
    Receiving,
    Dispatching,
    Closed
};

std::string to_string(ConnectionState state);

struct ConnectionRecord {
    std::string connection_id;
    int fd = -1;
    std::string peer;
    ConnectionState state = ConnectionState::Open;
    std::chrono::steady_clock::time_point opened_at;
    std::size_t requests_handled = 0;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Live connections keyed by id. A connection is removed once it is closed,
// so count() is the number of sockets the server currently owns.
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(std::size_t max_connections);

    core::errors::Result<std::string> open_connection(int fd, const std::string& peer);

    // Open -> Receiving <-> Dispatching; any state -> Closed.
    core::errors::Result<ConnectionState> transition(const std::string& connection_id,
                                                     ConnectionState next_state);

    // Drops the record. The caller closes the socket afterwards.
    core::errors::Result<ConnectionState> close_connection(const std::string& connection_id);

    core::errors::Result<ConnectionState> get_state(const std::string& connection_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& connection_id) const;

    void record_request(const std::string& connection_id);

    // Sets every cancel token.
    void cancel_all();

    // Shuts down both directions of every registered socket so blocked
    // reads return. The fds stay owned by their connection threads.
    void shutdown_all();

    std::size_t count() const;
    std::size_t dispatching_count() const;

private:
    static bool is_allowed(ConnectionState from, ConnectionState to);

    const std::size_t max_connections_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConnectionRecord> connections_;
};

}  // namespace facetmcp::session
