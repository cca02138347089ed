// ============================================================
// socket.cpp -- TcpSocket
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>
#include <utility>

#include <poll.h>

namespace {

// Kernel buffers for one bulk stream
constexpr int STREAM_BUF_BYTES = 1 << 20;

[[noreturn]] void raise_errno(const std::string& what) {
    throw NetworkError(what + ": " + socket_error_str(last_socket_error()));
}

sockaddr_in resolve_v4(const std::string& host, u16 port) {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &sa.sin_addr) == 1) return sa;

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || !found) {
        throw NetworkError("cannot resolve " + host + ": " + gai_strerror(rc));
    }
    sa.sin_addr = reinterpret_cast<sockaddr_in*>(found->ai_addr)->sin_addr;
    freeaddrinfo(found);
    return sa;
}

} // namespace

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(std::exchange(o.fd_, INVALID_SOCKET_VAL)) {}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = std::exchange(o.fd_, INVALID_SOCKET_VAL);
    }
    return *this;
}

TcpSocket TcpSocket::open_stream() {
    socket_t fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd == INVALID_SOCKET_VAL) raise_errno("socket()");
    return TcpSocket(fd);
}

void TcpSocket::set_stream_opts() {
    // Best effort: a refused option only costs throughput
    int one = 1;
    int buf = STREAM_BUF_BYTES;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &one, sizeof(one));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &one, sizeof(one));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &buf, sizeof(buf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &buf, sizeof(buf));
}

TcpSocket TcpSocket::listen_on(const std::string& ip, u16 port, int backlog) {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        sa.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1) {
        throw InvalidInputError("invalid bind address: " + ip);
    }

    TcpSocket s = open_stream();
    int one = 1;
    setsockopt(s.fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(s.fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == SOCKET_ERROR_VAL) {
        raise_errno("bind(" + ip + ":" + std::to_string(port) + ")");
    }
    if (::listen(s.fd_, backlog) == SOCKET_ERROR_VAL) raise_errno("listen()");
    return s;
}

TcpSocket TcpSocket::connect_to(const std::string& host, u16 port) {
    sockaddr_in sa = resolve_v4(host, port);
    TcpSocket s = open_stream();
    if (::connect(s.fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == SOCKET_ERROR_VAL) {
        raise_errno("connect(" + host + ":" + std::to_string(port) + ")");
    }
    s.set_stream_opts();
    return s;
}

TcpSocket TcpSocket::accept_one() {
    socket_t fd;
    do {
        fd = ::accept(fd_, nullptr, nullptr);
    } while (fd == INVALID_SOCKET_VAL && errno == EINTR);
    if (fd == INVALID_SOCKET_VAL) raise_errno("accept()");
    TcpSocket s(fd);
    s.set_stream_opts();
    return s;
}

bool TcpSocket::wait_readable(int timeout_ms) const {
    pollfd pfd{fd_, POLLIN, 0};
    int rc;
    while ((rc = ::poll(&pfd, 1, timeout_ms)) < 0) {
        if (errno != EINTR) raise_errno("poll()");
    }
    return rc > 0;
}

void TcpSocket::write_all(const void* buf, size_t len) {
    auto* p = static_cast<const char*>(buf);
    while (len > 0) {
        ssize_t n = ::send(fd_, p, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            raise_errno("send()");
        }
        if (n == 0) throw NetworkError("connection closed during send");
        p   += n;
        len -= static_cast<size_t>(n);
    }
}

bool TcpSocket::read_exact(void* buf, size_t len) {
    auto* p = static_cast<char*>(buf);
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(fd_, p + got, len - got, 0);
        if (n == 0) {
            if (got == 0) return false;
            throw NetworkError("connection closed after " + std::to_string(got) + " of " +
                               std::to_string(len) + " bytes");
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            raise_errno("recv()");
        }
        got += static_cast<size_t>(n);
    }
    return true;
}

void TcpSocket::shutdown_both() {
    if (valid()) ::shutdown(fd_, SHUT_RDWR);
}

void TcpSocket::close() {
    if (valid()) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::remote_endpoint() const {
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    char text[INET_ADDRSTRLEN] = {0};
    if (getpeername(fd_, reinterpret_cast<sockaddr*>(&sa), &len) != 0 ||
        !inet_ntop(AF_INET, &sa.sin_addr, text, sizeof(text))) {
        return "?";
    }
    return std::string(text) + ":" + std::to_string(ntohs(sa.sin_port));
}

u16 TcpSocket::bound_port() const {
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&sa), &len) != 0) raise_errno("getsockname()");
    return ntohs(sa.sin_port);
}
