// ============================================================
// file_source.cpp -- File and stdin sources
// ============================================================

#include "file_source.hpp"
#include "../common/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

#include <unistd.h>

FileSource::FileSource(const std::string& path)
    : file_(std::make_unique<file_io::MappedFile>(path))
    , name_(fs::path(path).filename().string())
{}

size_t FileSource::read(u8* buf, size_t cap) {
    auto r = file_->range(pos_, cap);
    if (r.len == 0) return 0;
    std::memcpy(buf, r.data, r.len);
    pos_ += r.len;
    return r.len;
}

size_t StreamSource::read(u8* buf, size_t cap) {
    for (;;) {
        ssize_t n = ::read(fd_, buf, cap);
        if (n >= 0) return (size_t)n;
        if (errno == EINTR) continue;
        throw IoError("read failed on " + name_ + ": " + std::strerror(errno));
    }
}
