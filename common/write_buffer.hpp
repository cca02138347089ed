#pragma once

// ============================================================
// write_buffer.hpp -- Frame coalescing for the TCP writer
//
// Small encoded frames (AUTH_*, short DATA, FIN) are gathered and
// handed to the socket in one write. The TcpChannel writer thread
// owns one instance and flushes it when its queue runs dry.
// Not thread-safe.
// ============================================================

#include "socket.hpp"
#include <vector>

class TcpWriteBuffer {
public:
    static constexpr size_t DEFAULT_THRESHOLD = 256 * 1024;

    explicit TcpWriteBuffer(TcpSocket& sock, size_t threshold = DEFAULT_THRESHOLD)
        : sock_(sock), limit_(threshold) {}

    TcpWriteBuffer(const TcpWriteBuffer&) = delete;
    TcpWriteBuffer& operator=(const TcpWriteBuffer&) = delete;

    // Frames at or above the threshold go straight out, after
    // whatever is already gathered so order is kept
    void append(const std::vector<u8>& wire) {
        if (wire.size() >= limit_) {
            flush();
            sock_.write_all(wire.data(), wire.size());
        } else {
            gathered_.insert(gathered_.end(), wire.begin(), wire.end());
            if (gathered_.size() >= limit_) flush();
        }
    }

    void flush() {
        if (gathered_.empty()) return;
        sock_.write_all(gathered_.data(), gathered_.size());
        gathered_.clear();
    }

private:
    TcpSocket&      sock_;
    size_t          limit_;
    std::vector<u8> gathered_;
};
