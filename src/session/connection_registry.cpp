#include "session/connection_registry.hpp"

#include <algorithm>
#include <sys/socket.h>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace facetmcp::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

std::string to_string(const ConnectionState state) {
    switch (state) {
        case ConnectionState::Open:
            return "open";
        case ConnectionState::Receiving:
            return "receiving";
        case ConnectionState::Dispatching:
            return "dispatching";
        case ConnectionState::Closed:
            return "closed";
    }
    return "unknown";
}

ConnectionRegistry::ConnectionRegistry(const std::size_t max_connections)
    : max_connections_(max_connections) {}

bool ConnectionRegistry::is_allowed(const ConnectionState from, const ConnectionState to) {
    if (to == ConnectionState::Closed) {
        return from != ConnectionState::Closed;
    }
    switch (from) {
        case ConnectionState::Open:
            return to == ConnectionState::Receiving;
        case ConnectionState::Receiving:
            return to == ConnectionState::Dispatching;
        case ConnectionState::Dispatching:
            return to == ConnectionState::Receiving;
        case ConnectionState::Closed:
            return false;
    }
    return false;
}

core::errors::Result<std::string> ConnectionRegistry::open_connection(
    const int fd, const std::string& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connections_.size() >= max_connections_) {
        return ServiceError{ErrorCategory::Limit,
                            "Connection limit reached (" + std::to_string(max_connections_) +
                                ")",
                            "too_many_connections"};
    }

    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        std::string connection_id = core::config::generate_connection_id();
        if (connections_.find(connection_id) != connections_.end()) {
            continue;
        }

        ConnectionRecord record;
        record.connection_id = connection_id;
        record.fd = fd;
        record.peer = peer;
        record.opened_at = std::chrono::steady_clock::now();
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        connections_.emplace(connection_id, std::move(record));
        LOG_INFO("ConnectionRegistry: " + connection_id + " opened from " + peer + " (" +
                 std::to_string(connections_.size()) + " active)");
        return connection_id;
    }

    return ServiceError{ErrorCategory::Internal, "Unable to allocate unique connection ID.",
                        "connection_id_generation_failed"};
}

core::errors::Result<ConnectionState> ConnectionRegistry::transition(
    const std::string& connection_id, const ConnectionState next_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return ServiceError{ErrorCategory::NotFound, "Connection not found: " + connection_id,
                            "connection_not_found"};
    }

    const ConnectionState prev = it->second.state;
    if (!is_allowed(prev, next_state)) {
        return ServiceError{ErrorCategory::Internal,
                            "Invalid connection transition " + to_string(prev) + " -> " +
                                to_string(next_state),
                            "invalid_state_transition"};
    }

    it->second.state = next_state;
    LOG_DEBUG("ConnectionRegistry: " + connection_id + " transition " + to_string(prev) +
              " -> " + to_string(next_state));
    return next_state;
}

core::errors::Result<ConnectionState> ConnectionRegistry::close_connection(
    const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return ServiceError{ErrorCategory::NotFound, "Connection not found: " + connection_id,
                            "connection_not_found"};
    }

    it->second.cancel_token->store(true);
    const auto lifetime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - it->second.opened_at);
    LOG_INFO("ConnectionRegistry: " + connection_id + " closed after " +
             std::to_string(it->second.requests_handled) + " requests, " +
             std::to_string(lifetime.count()) + " ms");
    connections_.erase(it);
    return ConnectionState::Closed;
}

core::errors::Result<ConnectionState> ConnectionRegistry::get_state(
    const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return ServiceError{ErrorCategory::NotFound, "Connection not found: " + connection_id,
                            "connection_not_found"};
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> ConnectionRegistry::get_cancel_token(
    const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return ServiceError{ErrorCategory::NotFound, "Connection not found: " + connection_id,
                            "connection_not_found"};
    }
    return it->second.cancel_token;
}

void ConnectionRegistry::record_request(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it != connections_.end()) {
        ++it->second.requests_handled;
    }
}

void ConnectionRegistry::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, record] : connections_) {
        record.cancel_token->store(true);
    }
}

void ConnectionRegistry::shutdown_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, record] : connections_) {
        if (record.fd >= 0) {
            static_cast<void>(::shutdown(record.fd, SHUT_RDWR));
        }
    }
}

std::size_t ConnectionRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

std::size_t ConnectionRegistry::dispatching_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(connections_.begin(), connections_.end(), [](const auto& entry) {
            return entry.second.state == ConnectionState::Dispatching;
        }));
}

}  // namespace facetmcp::session
