#pragma once

// ============================================================
// archive_packer.hpp -- On-the-fly ustar stream from many paths
//
// scan() enumerates every regular file up front so the exact
// archive length is known before INIT goes out. read() then pulls
// from a producer thread that emits headers, content and padding
// through a bounded chunk queue.
//
// Entry names: a file input is its basename; a directory input d
// yields basename(d)/<rel>. Names that do not fit the ustar
// name/prefix fields get a PAX 'x' header carrying `path`.
// ============================================================

#include "../common/byte_stream.hpp"
#include "../common/config.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

struct ArchiveEntry {
    std::string abs_path;
    std::string name;        // archive path, '/' separated
    u64         size = 0;
    u32         mode = 0644;
    u64         mtime_ns = 0;
    u64         pax_len = 0; // bytes of the PAX record, 0 if none
};

class ArchivePacker : public ByteSource {
public:
    ArchivePacker(std::vector<std::string> paths,
                  std::vector<std::string> excludes,
                  u32 chunk_size = DEFAULT_CHUNK_SIZE);
    ~ArchivePacker() override;

    ArchivePacker(const ArchivePacker&) = delete;
    ArchivePacker& operator=(const ArchivePacker&) = delete;

    // Phase 1. Throws IoError (missing input, unreadable directory) or
    // InvalidInputError (two inputs produce the same entry name).
    void scan();

    const std::vector<ArchiveEntry>& entries() const { return entries_; }
    u64 total_size() const { return total_size_; }

    // Phase 2; the producer starts on the first call
    size_t read(u8* buf, size_t cap) override;
    std::optional<u64> size() const override;
    std::string name() const override { return "archive.tar"; }

    // Stop the producer (also done by the destructor)
    void stop();

    // Split `name` into ustar prefix (<=155) and name (<=100) fields;
    // false if no split fits
    static bool split_ustar_name(const std::string& name, std::string& prefix, std::string& base);

    // "<len> path=<value>\n" where <len> counts the whole record
    static std::string pax_record(const std::string& key, const std::string& value);

    // Bytes one entry occupies in the stream
    static u64 entry_span(const ArchiveEntry& e);

    // Leaf name a directory input contributes ("dir/" -> "dir", "." -> cwd name)
    static std::string input_base_name(const std::string& path);

private:
    void add_entry(const std::string& abs_path, const std::string& name);
    void produce();
    void emit(const u8* data, size_t len);
    void emit_zeros(size_t len);
    void flush_staging();
    void emit_entry(const ArchiveEntry& e);

    std::vector<std::string> paths_;
    std::vector<std::string> excludes_;
    u32                      chunk_size_;

    std::vector<ArchiveEntry> entries_;
    u64                       total_size_{0};
    bool                      scanned_{false};

    // producer -> consumer
    static constexpr size_t QUEUE_LIMIT = 8;
    std::mutex                  mutex_;
    std::condition_variable     cv_;
    std::deque<std::vector<u8>> chunks_;
    bool                        done_{false};
    bool                        stop_{false};
    std::exception_ptr          error_;
    std::thread                 producer_;

    std::vector<u8> staging_;   // producer side
    std::vector<u8> current_;   // consumer side
    size_t          current_pos_{0};
};
