#pragma once

// ============================================================
// platform.hpp -- POSIX socket/OS shims and portable types
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <netdb.h>

using socket_t = int;
#define INVALID_SOCKET_VAL (-1)
#define SOCKET_ERROR_VAL   (-1)
#define CLOSE_SOCKET(s)    ::close(s)

inline int last_socket_error() { return errno; }
inline std::string socket_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

// ---- Fixed-width aliases ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

namespace platform {

// stdin/stdout/stderr attached to a terminal?
inline bool fd_is_tty(int fd) {
    return ::isatty(fd) != 0;
}

// Write all bytes to a raw descriptor, retrying on EINTR / short writes.
// Returns false on error (errno preserved).
inline bool write_fd_all(int fd, const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t n = ::write(fd, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p   += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace platform
