#pragma once

// ============================================================
// sniffing_sink.hpp -- Receiving-side destination chooser
//
// Holds the first 512 bytes (or everything, at close) and decides
// once:
//
//   destination       ustar magic            no magic
//   directory         extract under it       one file, MetaHeader name
//   concrete file     raw bytes to the file  raw bytes to the file
//   "-" (stdout)      InvalidInputError      raw bytes to stdout
//
// A directory is an existing directory, a path ending in '/', or
// an empty destination (current directory).
// ============================================================

#include "archive_extractor.hpp"
#include "../common/byte_stream.hpp"
#include <memory>
#include <mutex>

class SniffingSink : public ByteSink {
public:
    struct Options {
        std::string destination;    // "-", a directory, a file, or ""
        bool        overwrite = false;
        std::string session_id;     // for the fallback file name
    };

    enum class Decision { Pending, Stdout, RawFile, Extract };

    struct Stats {
        bool               started = false;   // any payload byte seen
        std::optional<u64> announced;
        u64                written = 0;
        std::string        desired_name;      // from the MetaHeader
        std::string        resolved_path;     // "-", a file, or the extraction root
    };

    explicit SniffingSink(Options opts);
    ~SniffingSink() override;

    void info(const SinkInfo& info) override;
    void write(const u8* data, size_t len) override;
    void close() override;
    u64 written() const override;

    Stats    stats() const;
    Decision decision() const;

    // "name.ext" -> "name-1.ext", "name-2.ext", ... first one not present
    static fs::path unique_path(const fs::path& dir, const std::string& name);

private:
    enum class DestKind { Stdout, Directory, File };

    void decide();
    void forward(const u8* data, size_t len);
    void open_collision_safe(const fs::path& dir, const std::string& name);

    Options  opts_;
    DestKind dest_kind_;

    mutable std::mutex mutex_;
    Decision           decision_{Decision::Pending};
    Stats              stats_;
    std::vector<u8>    head_;
    bool               closed_{false};

    file_io::OutputFile               file_;
    std::unique_ptr<ArchiveExtractor> extractor_;
};
