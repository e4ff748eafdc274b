// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <devbridge/transport.hpp>

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
// MSG_NOSIGNAL doesn't exist on macOS - use SO_NOSIGPIPE socket option instead
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace devbridge
{

// =============================================================================
// TCP Transport
// =============================================================================

/// Transport that communicates over a TCP socket
class TcpTransport : public ITransport
{
  public:
    using Socket = int;
    static constexpr Socket kInvalidSocket = -1;

    /// Construct an unconnected transport
    TcpTransport() : socket_(kInvalidSocket), open_(false) {}

    /// Construct from an existing connected socket (takes ownership)
    explicit TcpTransport(Socket socket) : socket_(socket), open_(socket != kInvalidSocket) {}

    ~TcpTransport() override
    {
        close();
    }

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // Movable
    TcpTransport(TcpTransport&& other) noexcept : socket_(other.socket_), open_(other.open_.load())
    {
        other.socket_ = kInvalidSocket;
        other.open_ = false;
    }

    TcpTransport& operator=(TcpTransport&& other) noexcept
    {
        if (this != &other)
        {
            close();
            socket_ = other.socket_;
            open_ = other.open_.load();
            other.socket_ = kInvalidSocket;
            other.open_ = false;
        }
        return *this;
    }

    /// Connect to a host:port
    /// @param host Hostname or IP address
    /// @param port Port number
    /// @param timeout Connection timeout (0 = no timeout)
    /// @throws TimeoutError if the connection did not complete in time
    /// @throws TransportError on any other connection failure
    void connect(const std::string& host, int port, std::chrono::milliseconds timeout);

    /// Connect to the first reachable entry of a resolved address list
    ///
    /// When every entry fails, the error reflects the last entry tried.
    /// @param addresses Address list, as returned by getaddrinfo()
    /// @param label Name used in error messages
    /// @param timeout Per-address connection timeout (0 = no timeout)
    /// @throws TimeoutError if the last entry did not connect in time
    /// @throws TransportError on any other connection failure
    void connect(
        const struct addrinfo* addresses, const std::string& label, std::chrono::milliseconds timeout
    );

    /// Bound blocking reads and writes (0 = unbounded)
    /// @throws TransportError if the socket option cannot be set
    void set_timeouts(std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout);

    /// Open a second handle on the same connection
    ///
    /// Socket options (timeouts, TCP_NODELAY) are shared with this transport.
    /// @throws TransportError if the transport is closed or dup() fails
    std::unique_ptr<TcpTransport> duplicate() const;

    /// Shut the connection down in both directions without releasing the
    /// handle; a read blocked on another thread returns EOF
    void shutdown() override;

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;
    void close() override;
    bool is_open() const override
    {
        return open_;
    }

    Socket socket() const
    {
        return socket_;
    }

  private:
    Socket socket_;
    std::atomic<bool> open_;
    std::chrono::milliseconds read_timeout_{0};
    std::chrono::milliseconds write_timeout_{0};

    static std::string get_socket_error(int err = errno)
    {
        return std::strerror(err);
    }

    static void set_socket_blocking(Socket sock, bool blocking);
    static void set_socket_timeout(Socket sock, int option, std::chrono::milliseconds timeout);
};

// =============================================================================
// Implementation
// =============================================================================

inline void TcpTransport::set_socket_blocking(Socket sock, bool blocking)
{
    int flags = fcntl(sock, F_GETFL, 0);
    if (blocking)
        fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
    else
        fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

inline void
TcpTransport::set_socket_timeout(Socket sock, int option, std::chrono::milliseconds timeout)
{
    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(sock, SOL_SOCKET, option, &tv, sizeof(tv)) != 0)
        throw TransportError("setsockopt failed: " + get_socket_error());
}

inline void TcpTransport::connect(const std::string& host, int port, std::chrono::milliseconds timeout)
{
    // Close any existing connection
    close();

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    std::string addr = host + ":" + port_str;

    int status = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (status != 0)
        throw TransportError("Invalid address " + addr + ": " + gai_strerror(status));

    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addresses(result, &freeaddrinfo);
    connect(addresses.get(), addr, timeout);
}

inline void TcpTransport::connect(
    const struct addrinfo* addresses, const std::string& label, std::chrono::milliseconds timeout
)
{
    close();

    const int timeout_ms = static_cast<int>(timeout.count());
    bool timed_out = false;
    int last_error = 0;

    // Try each address until we connect
    Socket sock = kInvalidSocket;
    for (auto* rp = addresses; rp != nullptr; rp = rp->ai_next)
    {
        timed_out = false;
        sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (sock == kInvalidSocket)
        {
            last_error = errno;
            continue;
        }
        // Keep the socket out of spawned backends
        fcntl(sock, F_SETFD, FD_CLOEXEC);

        // Set non-blocking for timeout support
        if (timeout_ms > 0)
            set_socket_blocking(sock, false);

        if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
            break;
        last_error = errno;

        if (last_error == EINPROGRESS && timeout_ms > 0)
        {
            struct pollfd pfd{};
            pfd.fd = sock;
            pfd.events = POLLOUT;

            int poll_result;
            do
            {
                poll_result = ::poll(&pfd, 1, timeout_ms);
            } while (poll_result < 0 && errno == EINTR);

            if (poll_result > 0)
            {
                int error = 0;
                socklen_t len = sizeof(error);
                getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len);
                if (error == 0)
                    break;
                last_error = error;
            }
            else if (poll_result == 0)
            {
                timed_out = true;
            }
            else
            {
                last_error = errno;
            }
        }

        // Connection failed, try next address
        ::close(sock);
        sock = kInvalidSocket;
    }

    if (sock == kInvalidSocket)
    {
        if (timed_out)
            throw TimeoutError(
                "Connection to " + label + " timed out after " + std::to_string(timeout_ms) + " ms"
            );
        throw TransportError("Failed to connect to " + label + ": " + get_socket_error(last_error));
    }

    // Restore blocking mode
    socket_ = sock;
    set_socket_blocking(socket_, true);

    // Disable Nagle's algorithm for lower latency
    int flag = 1;
    setsockopt(socket_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

#if defined(__APPLE__)
    // On macOS, use SO_NOSIGPIPE to prevent SIGPIPE on send to closed socket
    setsockopt(socket_, SOL_SOCKET, SO_NOSIGPIPE, &flag, sizeof(flag));
#endif

    open_ = true;
}

inline void
TcpTransport::set_timeouts(std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout)
{
    if (!open_)
        throw ConnectionClosedError();
    set_socket_timeout(socket_, SO_RCVTIMEO, read_timeout);
    set_socket_timeout(socket_, SO_SNDTIMEO, write_timeout);
    read_timeout_ = read_timeout;
    write_timeout_ = write_timeout;
}

inline std::unique_ptr<TcpTransport> TcpTransport::duplicate() const
{
    if (!open_)
        throw ConnectionClosedError();

    Socket copy = ::fcntl(socket_, F_DUPFD_CLOEXEC, 0);
    if (copy == kInvalidSocket)
        throw TransportError("Failed to duplicate socket: " + get_socket_error());

    auto transport = std::make_unique<TcpTransport>(copy);
    transport->read_timeout_ = read_timeout_;
    transport->write_timeout_ = write_timeout_;
    return transport;
}

inline void TcpTransport::shutdown()
{
    if (open_ && socket_ != kInvalidSocket)
        ::shutdown(socket_, SHUT_RDWR);
}

inline size_t TcpTransport::read(char* buffer, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    ssize_t bytes_read;
    do
    {
        bytes_read = recv(socket_, buffer, size, 0);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            throw TimeoutError(
                "No response from backend within " + std::to_string(read_timeout_.count()) + " ms"
            );
        }
        if (errno == ECONNRESET || errno == EPIPE)
        {
            open_ = false;
            return 0;
        }
        throw TransportError("recv failed: " + get_socket_error());
    }

    if (bytes_read == 0)
        open_ = false;
    return static_cast<size_t>(bytes_read);
}

inline void TcpTransport::write(const char* data, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    size_t total_sent = 0;
    while (total_sent < size)
    {
        ssize_t bytes_sent = send(socket_, data + total_sent, size - total_sent, MSG_NOSIGNAL);
        if (bytes_sent < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                throw TimeoutError(
                    "Write to backend timed out after " + std::to_string(write_timeout_.count()) +
                    " ms"
                );
            }
            throw TransportError("send failed: " + get_socket_error());
        }
        total_sent += static_cast<size_t>(bytes_sent);
    }
}

inline void TcpTransport::close()
{
    if (!open_.exchange(false) && socket_ == kInvalidSocket)
        return;

    if (socket_ != kInvalidSocket)
    {
        ::shutdown(socket_, SHUT_RDWR);
        ::close(socket_);
        socket_ = kInvalidSocket;
    }
}

} // namespace devbridge
