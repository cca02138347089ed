#pragma once

// ============================================================
// socket.hpp -- Owning IPv4 TCP socket
//
// Move-only. Every failure is a NetworkError carrying errno text;
// a clean EOF is reported by read_exact() returning false.
// ============================================================

#include "platform.hpp"
#include <string>

class TcpSocket {
public:
    TcpSocket() = default;
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Listening socket on ip:port; port 0 picks a free one
    static TcpSocket listen_on(const std::string& ip, u16 port, int backlog = 1);

    // Connected socket; host may be a dotted quad or a resolvable name
    static TcpSocket connect_to(const std::string& host, u16 port);

    // Blocks until a peer arrives; pair with wait_readable() to poll
    TcpSocket accept_one();

    bool wait_readable(int timeout_ms) const;

    void write_all(const void* buf, size_t len);
    bool read_exact(void* buf, size_t len);

    // Unblocks reader/writer threads without releasing the fd
    void shutdown_both();
    void close();

    bool valid() const { return fd_ != INVALID_SOCKET_VAL; }
    std::string remote_endpoint() const;
    u16 bound_port() const;

private:
    explicit TcpSocket(socket_t fd) : fd_(fd) {}
    static TcpSocket open_stream();
    void set_stream_opts();

    socket_t fd_{INVALID_SOCKET_VAL};
};
