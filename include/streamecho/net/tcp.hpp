#pragma once

/// @file tcp.hpp
/// @brief Blocking IPv4 TCP sockets
///
/// Failures come back as errno values in std::expected. Nothing here throws.

#include <streamecho/log/macros.hpp>

#include <fmt/format.h>

#include <sys/socket.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace streamecho::net {

/// Socket settings applied by tcp_listener and tcp_connect
struct tcp_options {
    bool reuse_addr = true;
    bool no_delay = true;       ///< TCP_NODELAY
    bool keep_alive = false;
    int backlog = 128;
};

/// Host-order port plus network-order IPv4 address
struct ipv4_address {
    in_addr_t host = htonl(INADDR_ANY);
    uint16_t port = 0;

    ipv4_address() = default;

    /// Any interface on the given port
    explicit ipv4_address(uint16_t p) : port(p) {}

    ipv4_address(const sockaddr_in& sa)
        : host(sa.sin_addr.s_addr), port(ntohs(sa.sin_port)) {}

    /// Dotted quad or host name; an empty host means any interface.
    /// Lookup failures are reported as EHOSTUNREACH.
    static std::expected<ipv4_address, int> resolve(std::string_view name, uint16_t port) {
        ipv4_address out(port);
        if (name.empty()) {
            return out;
        }
        std::string host(name);
        if (::inet_pton(AF_INET, host.c_str(), &out.host) == 1) {
            return out;
        }

        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* found = nullptr;
        if (int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &found); rc != 0 || !found) {
            STREAMECHO_LOG_ERROR("Cannot resolve {}: {}", host, ::gai_strerror(rc));
            return std::unexpected(EHOSTUNREACH);
        }
        out.host = reinterpret_cast<const sockaddr_in*>(found->ai_addr)->sin_addr.s_addr;
        ::freeaddrinfo(found);
        return out;
    }

    sockaddr_in to_sockaddr() const {
        sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_port = htons(port);
        sa.sin_addr.s_addr = host;
        return sa;
    }

    std::string to_string() const {
        char text[INET_ADDRSTRLEN] = {};
        in_addr in{host};
        ::inet_ntop(AF_INET, &in, text, sizeof(text));
        return fmt::format("{}:{}", text, port);
    }
};

/// Decimal port number; EINVAL for anything else, including values above 65535
inline std::expected<uint16_t, int> parse_port(std::string_view text) {
    unsigned value = 0;
    const char* end = text.data() + text.size();
    auto [stop, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || stop != end || value > UINT16_MAX) {
        return std::unexpected(EINVAL);
    }
    return static_cast<uint16_t>(value);
}

namespace detail {

/// Sole owner of a socket descriptor
class socket_fd {
public:
    socket_fd() noexcept = default;
    explicit socket_fd(int fd) noexcept : fd_(fd) {}

    socket_fd(socket_fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    socket_fd& operator=(socket_fd&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    ~socket_fd() { reset(); }

    socket_fd(const socket_fd&) = delete;
    socket_fd& operator=(const socket_fd&) = delete;

    int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    int release() noexcept { return std::exchange(fd_, -1); }

private:
    int fd_ = -1;
};

inline bool set_option(int fd, int level, int name, int value) noexcept {
    return ::setsockopt(fd, level, name, &value, sizeof(value)) == 0;
}

inline std::expected<socket_fd, int> open_tcp_socket() {
    socket_fd sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock) {
        return std::unexpected(errno);
    }
    return sock;
}

inline void apply_stream_options(int fd, const tcp_options& opts) {
    if (opts.no_delay && !set_option(fd, IPPROTO_TCP, TCP_NODELAY, 1)) {
        STREAMECHO_LOG_WARNING("TCP_NODELAY not applied: errno {}", errno);
    }
    if (opts.keep_alive && !set_option(fd, SOL_SOCKET, SO_KEEPALIVE, 1)) {
        STREAMECHO_LOG_WARNING("SO_KEEPALIVE not applied: errno {}", errno);
    }
}

} // namespace detail

/// Connected TCP socket with blocking, whole-buffer I/O.
///
/// One thread may read while another writes. shutdown() may be called from
/// any thread to unblock a pending read.
class tcp_stream {
public:
    explicit tcp_stream(int fd, ipv4_address peer = {}) : sock_(fd), peer_(peer) {}

    bool is_valid() const noexcept { return static_cast<bool>(sock_); }

    int fd() const noexcept { return sock_.get(); }

    const ipv4_address& peer_address() const noexcept { return peer_; }

    /// Fill buffer with exactly length bytes.
    /// @return Bytes read; fewer than length only when the peer closed
    std::expected<size_t, int> read_exact(void* buffer, size_t length) {
        auto* at = static_cast<char*>(buffer);
        size_t got = 0;
        while (got < length) {
            ssize_t n = ::recv(sock_.get(), at + got, length - got, 0);
            if (n > 0) {
                got += static_cast<size_t>(n);
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                return std::unexpected(errno);
            }
        }
        return got;
    }

    std::expected<void, int> write_all(const void* buffer, size_t length) {
        iovec one{const_cast<void*>(buffer), length};
        return writev_all(&one, 1);
    }

    /// Send every iovec in order; entries are advanced in place as they drain
    std::expected<void, int> writev_all(iovec* iov, int count) {
        while (count > 0) {
            msghdr msg{};
            msg.msg_iov = iov;
            msg.msg_iovlen = static_cast<size_t>(count);
            ssize_t n = ::sendmsg(sock_.get(), &msg, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(errno);
            }
            consume_iov(iov, count, static_cast<size_t>(n));
        }
        return {};
    }

    /// writev_all that never blocks for longer than wait at a time.
    ///
    /// While the socket has no room, keep_going() is asked before each wait.
    /// The write stops with ECANCELED once it answers false, and with
    /// ETIMEDOUT when no byte has gone out for stall_timeout. sent counts the
    /// bytes written, so a stopped write can be told apart from a torn one.
    template<typename KeepGoing>
    std::expected<void, int> writev_bounded(iovec* iov, int count,
                                            std::chrono::milliseconds wait,
                                            std::chrono::milliseconds stall_timeout,
                                            KeepGoing&& keep_going,
                                            size_t& sent) {
        using clock = std::chrono::steady_clock;
        sent = 0;
        auto last_progress = clock::now();
        while (count > 0) {
            msghdr msg{};
            msg.msg_iov = iov;
            msg.msg_iovlen = static_cast<size_t>(count);
            ssize_t n = ::sendmsg(sock_.get(), &msg, MSG_NOSIGNAL | MSG_DONTWAIT);
            if (n >= 0) {
                sent += static_cast<size_t>(n);
                last_progress = clock::now();
                consume_iov(iov, count, static_cast<size_t>(n));
                continue;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                return std::unexpected(errno);
            }
            if (!keep_going()) {
                return std::unexpected(ECANCELED);
            }
            if (clock::now() - last_progress >= stall_timeout) {
                return std::unexpected(ETIMEDOUT);
            }
            pollfd pfd{sock_.get(), POLLOUT, 0};
            if (::poll(&pfd, 1, static_cast<int>(wait.count())) < 0 && errno != EINTR) {
                return std::unexpected(errno);
            }
        }
        return {};
    }

    /// Disable both directions; wakes a thread blocked in read_exact()
    void shutdown() noexcept {
        if (sock_) {
            ::shutdown(sock_.get(), SHUT_RDWR);
        }
    }

    void close() noexcept { sock_.reset(); }

private:
    static void consume_iov(iovec*& iov, int& count, size_t n) {
        while (count > 0 && (n > 0 || iov->iov_len == 0)) {
            size_t step = std::min(n, iov->iov_len);
            iov->iov_base = static_cast<char*>(iov->iov_base) + step;
            iov->iov_len -= step;
            n -= step;
            if (iov->iov_len == 0) {
                ++iov;
                --count;
            }
        }
    }

    detail::socket_fd sock_;
    ipv4_address peer_;
};

/// Listening socket. accept() polls so the caller can re-check a stop flag.
class tcp_listener {
public:
    /// Bind and listen. Port 0 picks an ephemeral port, reported by
    /// local_address().
    static std::expected<tcp_listener, int> bind(const ipv4_address& addr,
                                                 const tcp_options& opts = {}) {
        auto sock = detail::open_tcp_socket();
        if (!sock) {
            return std::unexpected(sock.error());
        }
        if (opts.reuse_addr) {
            detail::set_option(sock->get(), SOL_SOCKET, SO_REUSEADDR, 1);
        }

        auto sa = addr.to_sockaddr();
        if (::bind(sock->get(), reinterpret_cast<const sockaddr*>(&sa), sizeof(sa)) < 0 ||
            ::listen(sock->get(), opts.backlog) < 0) {
            return std::unexpected(errno);
        }

        sockaddr_in local{};
        socklen_t len = sizeof(local);
        ipv4_address bound = addr;
        if (::getsockname(sock->get(), reinterpret_cast<sockaddr*>(&local), &len) == 0) {
            bound = ipv4_address(local);
        }
        STREAMECHO_LOG_INFO("Listening on {}", bound.to_string());
        return tcp_listener(std::move(*sock), bound, opts);
    }

    const ipv4_address& local_address() const noexcept { return local_; }

    /// @return A connection, ETIMEDOUT when none arrived within timeout, or
    ///         the accept error
    std::expected<tcp_stream, int> accept(std::chrono::milliseconds timeout) {
        pollfd pfd{sock_.get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready == 0 || (ready < 0 && errno == EINTR)) {
            return std::unexpected(ETIMEDOUT);
        }
        if (ready < 0) {
            return std::unexpected(errno);
        }

        sockaddr_in peer{};
        socklen_t len = sizeof(peer);
        int fd = ::accept4(sock_.get(), reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
        if (fd < 0) {
            return std::unexpected(errno);
        }
        detail::apply_stream_options(fd, opts_);
        return tcp_stream(fd, ipv4_address(peer));
    }

    void close() noexcept {
        if (sock_) {
            sock_.reset();
            STREAMECHO_LOG_INFO("Listener on {} closed", local_.to_string());
        }
    }

private:
    tcp_listener(detail::socket_fd sock, const ipv4_address& local, const tcp_options& opts)
        : sock_(std::move(sock)), local_(local), opts_(opts) {}

    detail::socket_fd sock_;
    ipv4_address local_;
    tcp_options opts_;
};

/// Blocking connect
inline std::expected<tcp_stream, int> tcp_connect(const ipv4_address& addr,
                                                  const tcp_options& opts = {}) {
    auto sock = detail::open_tcp_socket();
    if (!sock) {
        return std::unexpected(sock.error());
    }
    detail::apply_stream_options(sock->get(), opts);

    auto sa = addr.to_sockaddr();
    int rc;
    do {
        rc = ::connect(sock->get(), reinterpret_cast<const sockaddr*>(&sa), sizeof(sa));
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
        return std::unexpected(errno);
    }

    STREAMECHO_LOG_DEBUG("Connected to {}", addr.to_string());
    return tcp_stream(sock->release(), addr);
}

} // namespace streamecho::net
