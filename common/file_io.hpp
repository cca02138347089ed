#pragma once

// ============================================================
// file_io.hpp -- Files on disk: mapped sources, descriptor-backed
//                outputs, metadata, and entry names kept inside
//                an extraction root
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// A read-only view of one regular file. The size is fixed when the
// file is mapped; a file that grows later is not seen to grow.
class MappedFile {
public:
    explicit MappedFile(const std::string& path);
    ~MappedFile();

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    u64 size() const { return size_; }

    struct Range {
        const u8* data;
        size_t    len;
    };

    // Up to max_len bytes starting at offset; empty past the end
    Range range(u64 offset, size_t max_len) const;

private:
    const u8*   base_{nullptr};
    u64         size_{0};
    int         fd_{-1};
    std::string path_;
};

// Sequential writer for one output file
class OutputFile {
public:
    enum class OnExisting {
        Fail,      // FileExistsError
        Replace,   // truncate
    };

    OutputFile() = default;
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    void create(const std::string& path, OnExisting policy, u32 perm = 0644);
    void append(const void* data, size_t len);
    void finish();

    bool active() const { return fd_ >= 0; }
    u64 bytes() const { return bytes_; }
    const std::string& path() const { return path_; }

private:
    int         fd_{-1};
    u64         bytes_{0};
    std::string path_;
};

void apply_mode(const std::string& path, u32 mode);
void apply_mtime(const std::string& path, u64 mtime_ns);
void make_parent_dirs(const std::string& path);

// 0 when the file cannot be stat'ed
u64 mtime_ns_of(const std::string& path);

// Split an archive entry name into safe segments: empty and "."
// segments are dropped, ".." pops the last kept segment, backslashes
// count as separators. Never returns ".." segments.
std::vector<std::string> normalize_entry(const std::string& name);

// root / normalize_entry(name). Throws UnsafePathError when nothing
// is left, or when the result (after following existing symlinks)
// would sit outside root.
fs::path resolve_under_root(const fs::path& root, const std::string& name);

} // namespace file_io
