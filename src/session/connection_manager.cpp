#include "session/connection_manager.hpp"

#include <arpa/inet.h>
#include <chrono>
#include <exception>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <utility>
#include "core/errors/exception_name.hpp"
#include "core/logging/logger.hpp"
#include "net/socket_io.hpp"
#include "protocol/message_codec.hpp"

namespace facetmcp::session {

using core::errors::error_type_name;
using core::errors::ErrorCategory;
using protocol::Envelope;

namespace {

constexpr int kPollIntervalMs = 100;
constexpr int kListenBacklog = 128;

bool is_blank(const std::string& frame) {
    return frame.find_first_not_of(" \t\r") == std::string::npos;
}

std::string describe_peer(const sockaddr_in& addr) {
    char buffer[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) == nullptr) {
        return "unknown";
    }
    return std::string(buffer) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

ConnectionManager::ConnectionManager(core::config::ServerConfig config,
                                     const runtime::EnvelopeHandler& handler)
    : config_(std::move(config)), handler_(handler), registry_(config_.max_connections) {}

ConnectionManager::~ConnectionManager() {
    stop();
}

core::errors::Result<std::uint16_t> ConnectionManager::start() {
    if (running_.load()) {
        return core::errors::ServiceError{ErrorCategory::Internal, "Server is already running",
                                          "already_running"};
    }

    auto listener = net::listen_tcp(config_.host, config_.port, kListenBacklog);
    if (core::errors::is_error(listener)) {
        return core::errors::get_error(listener);
    }
    listen_fd_ = core::errors::get_value(listener);

    auto bound = net::local_port(listen_fd_);
    if (core::errors::is_error(bound)) {
        net::close_fd(listen_fd_);
        listen_fd_ = -1;
        return core::errors::get_error(bound);
    }
    port_ = core::errors::get_value(bound);

    stopping_ = false;
    running_ = true;
    accept_thread_ = std::thread(&ConnectionManager::accept_loop, this);

    LOG_INFO("ConnectionManager: listening on " + config_.host + ":" + std::to_string(port_) +
             " (max_connections=" + std::to_string(config_.max_connections) + ")");
    return port_;
}

void ConnectionManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_INFO("ConnectionManager: shutting down");
    stopping_ = true;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    net::close_fd(listen_fd_);
    listen_fd_ = -1;

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.shutdown_grace_ms);
    while (registry_.dispatching_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    const std::size_t still_dispatching = registry_.dispatching_count();
    if (still_dispatching > 0) {
        LOG_WARN("ConnectionManager: grace period expired with " +
                 std::to_string(still_dispatching) + " dispatches in flight, cancelling");
    }

    registry_.cancel_all();
    registry_.shutdown_all();
    join_all_workers();

    LOG_INFO("ConnectionManager: stopped");
}

void ConnectionManager::accept_loop() {
    while (!stopping_.load()) {
        reap_finished_workers();
        if (!net::wait_readable(listen_fd_, kPollIntervalMs)) {
            continue;
        }

        sockaddr_in peer_addr{};
        socklen_t peer_len = sizeof(peer_addr);
        const int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer_addr), &peer_len);
        if (fd < 0) {
            if (!stopping_.load()) {
                LOG_WARN("ConnectionManager: accept() failed");
            }
            continue;
        }

        const std::string peer = describe_peer(peer_addr);
        auto opened = registry_.open_connection(fd, peer);
        if (core::errors::is_error(opened)) {
            LOG_WARN("ConnectionManager: refusing " + peer + ": " +
                     core::errors::get_error(opened).message);
            net::close_fd(fd);
            continue;
        }

        int nodelay = 1;
        static_cast<void>(setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)));
        net::set_send_timeout(fd, static_cast<int>(config_.request_timeout_ms));

        const std::string connection_id = core::errors::get_value(opened);
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.emplace(connection_id, std::thread(&ConnectionManager::serve_connection, this,
                                                    connection_id, fd));
    }
}

void ConnectionManager::serve_connection(const std::string& connection_id, const int fd) {
    static_cast<void>(registry_.transition(connection_id, ConnectionState::Receiving));

    const std::size_t max_frame_bytes =
        static_cast<std::size_t>(config_.max_request_size_kb) * 1024;
    net::FrameReader reader(max_frame_bytes);
    RateLimiter limiter(config_.enable_rate_limiting ? config_.max_requests_per_minute : 0);
    auto last_activity = std::chrono::steady_clock::now();
    const auto idle_limit = std::chrono::milliseconds(config_.connection_timeout_ms);
    bool open = true;

    while (open && !stopping_.load()) {
        while (open && !stopping_.load()) {
            auto frame = reader.next_frame();
            if (!frame.has_value()) {
                break;
            }
            if (is_blank(*frame)) {
                continue;
            }
            const Envelope response = process_frame(connection_id, *frame, limiter);
            open = send_envelope(connection_id, fd, response);
        }
        if (!open || stopping_.load()) {
            break;
        }

        if (reader.overflowed()) {
            LOG_WARN("ConnectionManager: " + connection_id + " sent a frame over " +
                     std::to_string(config_.max_request_size_kb) + " KB, closing");
            static_cast<void>(send_envelope(
                connection_id, fd,
                protocol::make_error("Frame exceeds maximum request size of " +
                                         std::to_string(config_.max_request_size_kb) + " KB",
                                     error_type_name(ErrorCategory::Transport))));
            break;
        }

        switch (net::read_some(fd, reader, kPollIntervalMs)) {
            case net::ReadStatus::Data:
                last_activity = std::chrono::steady_clock::now();
                break;
            case net::ReadStatus::Timeout:
                if (config_.connection_timeout_ms > 0 &&
                    std::chrono::steady_clock::now() - last_activity >= idle_limit) {
                    LOG_INFO("ConnectionManager: " + connection_id + " idle for " +
                             std::to_string(config_.connection_timeout_ms) + " ms, closing");
                    open = false;
                }
                break;
            case net::ReadStatus::Closed:
                LOG_DEBUG("ConnectionManager: " + connection_id + " closed by peer");
                open = false;
                break;
            case net::ReadStatus::Failed:
                LOG_WARN("ConnectionManager: " + connection_id + " read failed, closing");
                open = false;
                break;
        }
    }

    // Deregister before closing so shutdown_all() never touches a reused fd.
    static_cast<void>(registry_.close_connection(connection_id));
    net::close_fd(fd);

    std::lock_guard<std::mutex> lock(workers_mutex_);
    finished_workers_.push_back(connection_id);
}

Envelope ConnectionManager::process_frame(const std::string& connection_id,
                                          const std::string& frame, RateLimiter& limiter) {
    auto decoded = protocol::decode(frame);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        LOG_WARN("ConnectionManager: " + connection_id + " sent an undecodable frame: " +
                 err.message);
        return protocol::make_error(err.message, error_type_name(err.category));
    }
    const Envelope& request = core::errors::get_value(decoded);

    if (!limiter.allow()) {
        LOG_WARN("ConnectionManager: " + connection_id + " exceeded " +
                 std::to_string(config_.max_requests_per_minute) + " requests per minute");
        Envelope limited = protocol::make_error(
            "Rate limit exceeded: " + std::to_string(config_.max_requests_per_minute) +
                " requests per minute",
            "rate_limited");
        limited.id = request.id;
        return limited;
    }

    std::shared_ptr<std::atomic_bool> cancel_token;
    if (auto token = registry_.get_cancel_token(connection_id); !core::errors::is_error(token)) {
        cancel_token = core::errors::get_value(token);
    }

    registry_.record_request(connection_id);
    static_cast<void>(registry_.transition(connection_id, ConnectionState::Dispatching));
    Envelope response;
    try {
        response = handler_.handle(request, cancel_token);
    } catch (const std::exception& e) {
        const std::string type_name = core::errors::exception_type_name(e);
        LOG_ERROR("ConnectionManager: " + connection_id + " dispatch raised " + type_name +
                  ": " + e.what());
        response = protocol::make_error("Internal server error: " + std::string(e.what()),
                                        type_name);
        response.id = request.id;
    }
    static_cast<void>(registry_.transition(connection_id, ConnectionState::Receiving));
    return response;
}

bool ConnectionManager::send_envelope(const std::string& connection_id, const int fd,
                                      const Envelope& envelope) {
    auto written = net::write_all(fd, protocol::encode(envelope) + "\n");
    if (core::errors::is_error(written)) {
        LOG_WARN("ConnectionManager: " + connection_id + " write failed: " +
                 core::errors::get_error(written).message);
        return false;
    }
    return true;
}

void ConnectionManager::reap_finished_workers() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (const auto& connection_id : finished_workers_) {
            auto it = workers_.find(connection_id);
            if (it != workers_.end()) {
                done.push_back(std::move(it->second));
                workers_.erase(it);
            }
        }
        finished_workers_.clear();
    }
    for (auto& worker : done) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ConnectionManager::join_all_workers() {
    std::unordered_map<std::string, std::thread> remaining;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        remaining.swap(workers_);
        finished_workers_.clear();
    }
    for (auto& [connection_id, worker] : remaining) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

}  // namespace facetmcp::session
