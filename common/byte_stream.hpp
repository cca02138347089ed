#pragma once

// ============================================================
// byte_stream.hpp -- Source/sink abstractions for payload bytes
// ============================================================

#include "platform.hpp"
#include <algorithm>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Pull side: files, stdin, the archive packer
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Up to `cap` bytes into buf; 0 means end of stream. Throws on error.
    virtual size_t read(u8* buf, size_t cap) = 0;

    // Exact length when known up front
    virtual std::optional<u64> size() const = 0;

    // Display / MetaHeader name hint
    virtual std::string name() const = 0;
};

// Metadata the receiving pipeline learns before (or between) chunks
struct SinkInfo {
    std::optional<u64>         total_bytes;
    std::optional<std::string> name;
};

// Push side: called from a single writer thread
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual void info(const SinkInfo& info) = 0;
    virtual void write(const u8* data, size_t len) = 0;

    // Finish the output. Safe to call more than once.
    virtual void close() = 0;

    // Payload bytes accepted so far
    virtual u64 written() const = 0;
};

// ---- In-memory implementations (loopback runs and tests) ----

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<u8> data, std::string name = "memory.bin",
                          bool sized = true)
        : data_(std::move(data)), name_(std::move(name)), sized_(sized) {}

    size_t read(u8* buf, size_t cap) override {
        size_t n = std::min(cap, data_.size() - pos_);
        if (n) std::memcpy(buf, data_.data() + pos_, n);
        pos_ += n;
        return n;
    }

    std::optional<u64> size() const override {
        if (!sized_) return std::nullopt;
        return (u64)data_.size();
    }

    std::string name() const override { return name_; }

private:
    std::vector<u8> data_;
    std::string     name_;
    bool            sized_;
    size_t          pos_{0};
};

class MemorySink : public ByteSink {
public:
    void info(const SinkInfo& i) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (i.total_bytes) total_ = i.total_bytes;
        if (i.name) name_ = i.name;
    }

    void write(const u8* data, size_t len) override {
        std::lock_guard<std::mutex> lk(mutex_);
        data_.insert(data_.end(), data, data + len);
    }

    void close() override {
        std::lock_guard<std::mutex> lk(mutex_);
        ++closes_;
    }

    u64 written() const override {
        std::lock_guard<std::mutex> lk(mutex_);
        return data_.size();
    }

    std::vector<u8> data() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return data_;
    }
    std::optional<u64> total() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return total_;
    }
    std::optional<std::string> name() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return name_;
    }
    int closes() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return closes_;
    }

private:
    mutable std::mutex         mutex_;
    std::vector<u8>            data_;
    std::optional<u64>         total_;
    std::optional<std::string> name_;
    int                        closes_{0};
};
