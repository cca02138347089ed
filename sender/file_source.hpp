#pragma once

// ============================================================
// file_source.hpp -- ByteSources for a single file and for stdin
// ============================================================

#include "../common/byte_stream.hpp"
#include "../common/file_io.hpp"
#include <memory>

// A regular file, mapped read-only
class FileSource : public ByteSource {
public:
    explicit FileSource(const std::string& path);

    size_t read(u8* buf, size_t cap) override;
    std::optional<u64> size() const override { return file_->size(); }
    std::string name() const override { return name_; }

private:
    std::unique_ptr<file_io::MappedFile> file_;
    std::string name_;
    u64         pos_{0};
};

// A descriptor with no knowable length (stdin, a pipe). The size is
// whatever the user declared with --size, if anything.
class StreamSource : public ByteSource {
public:
    StreamSource(int fd, std::string name, std::optional<u64> declared_size)
        : fd_(fd), name_(std::move(name)), size_(declared_size) {}

    size_t read(u8* buf, size_t cap) override;
    std::optional<u64> size() const override { return size_; }
    std::string name() const override { return name_; }

private:
    int                fd_;
    std::string        name_;
    std::optional<u64> size_;
};
