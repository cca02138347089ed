// ============================================================
// file_io.cpp -- MappedFile, OutputFile, path helpers
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <string>
#include <utility>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <time.h>

using namespace file_io;

namespace {

std::string errno_str() { return std::strerror(errno); }

// True if `p` equals `root` or lies below it (both already canonical)
bool is_within(const fs::path& root, const fs::path& p) {
    auto r = root.begin();
    auto q = p.begin();
    for (; r != root.end(); ++r, ++q) {
        if (r->empty() && std::next(r) == root.end()) return true;  // trailing '/'
        if (q == p.end() || *r != *q) return false;
    }
    return true;
}

} // namespace

// ---- MappedFile ----

MappedFile::MappedFile(const std::string& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) throw IoError("cannot open " + path + ": " + errno_str());

    struct stat st{};
    std::string why;
    if (::fstat(fd_, &st) != 0) why = errno_str();
    else if (!S_ISREG(st.st_mode)) why = "not a regular file";
    if (!why.empty()) {
        ::close(fd_);
        throw IoError("cannot read " + path + ": " + why);
    }
    size_ = (u64)st.st_size;
    if (size_ == 0) return;

    void* p = ::mmap(nullptr, (size_t)size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (p == MAP_FAILED) {
        std::string why = errno_str();
        ::close(fd_);
        throw IoError("cannot map " + path + ": " + why);
    }
    ::madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    base_ = static_cast<const u8*>(p);
}

MappedFile::~MappedFile() {
    if (base_) ::munmap(const_cast<u8*>(base_), (size_t)size_);
    if (fd_ >= 0) ::close(fd_);
}

MappedFile::Range MappedFile::range(u64 offset, size_t max_len) const {
    if (offset >= size_) return {nullptr, 0};
    u64 left = size_ - offset;
    return {base_ + offset, (size_t)std::min<u64>(left, max_len)};
}

// ---- OutputFile ----

OutputFile::~OutputFile() {
    if (fd_ >= 0) ::close(fd_);
}

void OutputFile::create(const std::string& path, OnExisting policy, u32 perm) {
    if (fd_ >= 0) throw IoError("output already open: " + path_);
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC |
                (policy == OnExisting::Fail ? O_EXCL : O_TRUNC);
    int fd = ::open(path.c_str(), flags, (mode_t)perm);
    if (fd < 0) {
        if (errno == EEXIST) throw FileExistsError(path);
        throw IoError("cannot create " + path + ": " + errno_str());
    }
    fd_    = fd;
    path_  = path;
    bytes_ = 0;
}

void OutputFile::append(const void* data, size_t len) {
    if (fd_ < 0) throw IoError("write to closed file: " + path_);
    auto* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t n = ::write(fd_, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("write failed: " + path_ + ": " + errno_str());
        }
        p      += n;
        len    -= (size_t)n;
        bytes_ += (u64)n;
    }
}

void OutputFile::finish() {
    if (fd_ < 0) return;
    int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) throw IoError("close failed: " + path_ + ": " + errno_str());
}

// ---- Metadata ----

void file_io::apply_mtime(const std::string& path, u64 mtime_ns) {
    timespec times[2];
    times[0].tv_sec  = (time_t)(mtime_ns / 1000000000ULL);
    times[0].tv_nsec = (long)(mtime_ns % 1000000000ULL);
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        throw IoError("cannot set mtime on " + path + ": " + errno_str());
    }
}

void file_io::apply_mode(const std::string& path, u32 mode) {
    if (::chmod(path.c_str(), (mode_t)(mode & 07777)) != 0) {
        throw IoError("cannot chmod " + path + ": " + errno_str());
    }
}

void file_io::make_parent_dirs(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) throw IoError("cannot create " + parent.string() + ": " + ec.message());
}

u64 file_io::mtime_ns_of(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    return (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;
}

// ---- Entry names ----

std::vector<std::string> file_io::normalize_entry(const std::string& name) {
    std::vector<std::string> out;
    std::string seg;
    auto flush = [&] {
        if (seg.empty() || seg == ".") {
            // skip
        } else if (seg == "..") {
            if (!out.empty()) out.pop_back();
        } else {
            out.push_back(seg);
        }
        seg.clear();
    };
    for (char c : name) {
        if (c == '/' || c == '\\') flush();
        else seg += c;
    }
    flush();
    return out;
}

fs::path file_io::resolve_under_root(const fs::path& root, const std::string& name) {
    auto segs = normalize_entry(name);
    if (segs.empty()) throw UnsafePathError(name);

    fs::path full = root;
    for (const auto& s : segs) full /= s;

    // Symlinked directories inside root could still lead elsewhere
    std::error_code ec;
    fs::path canon_root = fs::weakly_canonical(root, ec);
    if (ec) throw IoError("cannot resolve " + root.string() + ": " + ec.message());
    fs::path canon_full = fs::weakly_canonical(full, ec);
    if (ec) throw IoError("cannot resolve " + full.string() + ": " + ec.message());

    if (canon_full == canon_root || !is_within(canon_root, canon_full)) {
        throw UnsafePathError(name);
    }
    return full;
}
