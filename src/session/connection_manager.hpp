#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "core/config/server_config.hpp"
#include "core/errors/service_errors.hpp"
#include "net/frame_reader.hpp"
#include "protocol/envelope.hpp"
#include "runtime/envelope_handler.hpp"
#include "session/connection_registry.hpp"
#include "session/rate_limiter.hpp"

namespace facetmcp::session {

// TCP server. One accept thread plus one thread per connection; each
// connection reads newline-delimited envelopes and answers them strictly in
// order through the shared handler. An exception escaping the handler is
// answered with an error envelope and the connection keeps reading.
class ConnectionManager {
public:
    ConnectionManager(core::config::ServerConfig config, const runtime::EnvelopeHandler& handler);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Binds and starts accepting. Returns the bound port, which differs from
    // the configured one when that was 0.
    core::errors::Result<std::uint16_t> start();

    // Stops accepting, lets dispatches finish within the grace period, then
    // cancels and closes every connection. Idempotent.
    void stop();

    bool running() const { return running_.load(); }
    std::uint16_t port() const { return port_; }
    std::size_t connection_count() const { return registry_.count(); }

private:
    void accept_loop();
    void serve_connection(const std::string& connection_id, int fd);
    protocol::Envelope process_frame(const std::string& connection_id, const std::string& frame,
                                     RateLimiter& limiter);
    bool send_envelope(const std::string& connection_id, int fd,
                       const protocol::Envelope& envelope);
    void reap_finished_workers();
    void join_all_workers();

    core::config::ServerConfig config_;
    const runtime::EnvelopeHandler& handler_;
    ConnectionRegistry registry_;

    int listen_fd_ = -1;
    std::uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::thread accept_thread_;

    std::mutex workers_mutex_;
    std::unordered_map<std::string, std::thread> workers_;
    std::vector<std::string> finished_workers_;
};

}  // namespace facetmcp::session
