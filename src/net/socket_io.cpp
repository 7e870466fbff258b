#include "net/socket_io.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace facetmcp::net {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

namespace {

ServiceError transport_error(const std::string& what, const std::string& code) {
    return ServiceError{ErrorCategory::Transport, what + ": " + std::strerror(errno), code};
}

core::errors::Result<sockaddr_in> resolve_ipv4(const std::string& host,
                                               const std::uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* found = nullptr;
    const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || found == nullptr) {
        return ServiceError{ErrorCategory::Transport,
                            "Unable to resolve host '" + host + "': " + gai_strerror(rc),
                            "resolve_failed"};
    }

    sockaddr_in addr{};
    std::memcpy(&addr, found->ai_addr, sizeof(addr));
    addr.sin_port = htons(port);
    freeaddrinfo(found);
    return addr;
}

}  // namespace

core::errors::Result<int> listen_tcp(const std::string& host, const std::uint16_t port,
                                     const int backlog) {
    auto resolved = resolve_ipv4(host, port);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const sockaddr_in addr = core::errors::get_value(resolved);

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return transport_error("socket() failed", "socket_failed");
    }

    int reuse = 1;
    static_cast<void>(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto err = transport_error("bind() failed on " + host + ":" + std::to_string(port),
                                   "bind_failed");
        ::close(fd);
        return err;
    }
    if (::listen(fd, backlog) < 0) {
        auto err = transport_error("listen() failed", "listen_failed");
        ::close(fd);
        return err;
    }
    return fd;
}

core::errors::Result<std::uint16_t> local_port(const int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return transport_error("getsockname() failed", "getsockname_failed");
    }
    return static_cast<std::uint16_t>(ntohs(addr.sin_port));
}

core::errors::Result<int> connect_tcp(const std::string& host, const std::uint16_t port,
                                      const int timeout_ms) {
    auto resolved = resolve_ipv4(host, port);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const sockaddr_in addr = core::errors::get_value(resolved);

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return transport_error("socket() failed", "socket_failed");
    }

    // Non-blocking connect so the timeout is honoured, then back to blocking.
    const int flags = fcntl(fd, F_GETFL, 0);
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));

    int rc = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        auto err = transport_error("connect() failed", "connect_failed");
        ::close(fd);
        return err;
    }
    if (rc < 0) {
        pollfd pfd{fd, POLLOUT, 0};
        rc = ::poll(&pfd, 1, timeout_ms);
        if (rc <= 0) {
            ::close(fd);
            return ServiceError{ErrorCategory::Transport,
                                "connect() timed out after " + std::to_string(timeout_ms) +
                                    " ms",
                                "connect_timeout"};
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        static_cast<void>(getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len));
        if (so_error != 0) {
            ::close(fd);
            return ServiceError{ErrorCategory::Transport,
                                std::string("connect() failed: ") + std::strerror(so_error),
                                "connect_failed"};
        }
    }

    static_cast<void>(fcntl(fd, F_SETFL, flags));
    int nodelay = 1;
    static_cast<void>(setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)));
    return fd;
}

bool wait_readable(const int fd, const int timeout_ms) {
    pollfd pfd{fd, POLLIN, 0};
    while (true) {
        const int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        return rc > 0;
    }
}

ReadStatus read_some(const int fd, FrameReader& reader, const int timeout_ms) {
    pollfd pfd{fd, POLLIN, 0};
    int rc = 0;
    do {
        rc = ::poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        return ReadStatus::Failed;
    }
    if (rc == 0) {
        return ReadStatus::Timeout;
    }
    if ((pfd.revents & POLLNVAL) != 0) {
        return ReadStatus::Failed;
    }

    char buffer[4096];
    ssize_t n = 0;
    do {
        n = ::recv(fd, buffer, sizeof(buffer), 0);
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        reader.append(buffer, static_cast<std::size_t>(n));
        return ReadStatus::Data;
    }
    if (n == 0) {
        return ReadStatus::Closed;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return ReadStatus::Timeout;
    }
    if (errno == ECONNRESET) {
        return ReadStatus::Closed;
    }
    return ReadStatus::Failed;
}

core::errors::Result<bool> write_all(const int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return ServiceError{ErrorCategory::Transport, "send() timed out",
                                "send_timeout"};
        }
        return transport_error("send() failed", "send_failed");
    }
    return true;
}

void set_send_timeout(const int fd, const int timeout_ms) {
    if (timeout_ms <= 0) {
        return;
    }
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    static_cast<void>(setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)));
}

void close_fd(const int fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
    }
}

}  // namespace facetmcp::net
