#pragma once

// ============================================================
// archive_extractor.hpp -- Streaming ustar / PAX / GNU-longname
//                          extraction under a root directory
//
// Regular files and directories are materialised with mode and
// mtime; links, devices and FIFOs are skipped. Entries that would
// land outside the root are skipped with a warning.
// ============================================================

#include "../common/file_io.hpp"
#include "../common/tar_format.hpp"
#include <optional>
#include <string>

class ArchiveExtractor {
public:
    ArchiveExtractor(fs::path root, bool overwrite);

    ArchiveExtractor(const ArchiveExtractor&) = delete;
    ArchiveExtractor& operator=(const ArchiveExtractor&) = delete;

    // Any split of the stream is fine. Throws ProtocolError (bad
    // header), FileExistsError, IoError.
    void feed(const u8* data, size_t len);

    // End of stream; ProtocolError if it stopped inside an entry
    void finish();

    size_t files_extracted() const { return files_; }
    size_t dirs_created() const { return dirs_; }
    size_t entries_skipped() const { return skipped_; }
    bool   ended() const { return state_ == State::End; }

private:
    enum class State {
        Header,
        FileBody,
        MetaBody,    // PAX 'x' or GNU 'L' payload
        SkipBody,
        Padding,
        End,
    };

    void process_header();
    void begin_file(const std::string& name, u32 mode, u64 mtime_s, u64 size);
    void finish_file();
    void make_dir(const std::string& name, u32 mode);
    void finish_meta();
    void parse_pax(const std::string& records);
    void enter_body(State body, u64 size);

    fs::path root_;
    bool     overwrite_;

    State  state_{State::Header};
    u8     hdr_[tar::BLOCK];
    size_t hdr_fill_{0};
    int    zero_blocks_{0};

    u64  remaining_{0};
    u64  padding_{0};

    // Metadata for the next real entry
    char                       meta_type_{0};
    std::string                meta_buf_;
    std::optional<std::string> next_path_;
    std::optional<u64>         next_size_;

    // Current output file
    file_io::OutputFile out_;
    std::string         out_path_;
    u32                 out_mode_{0644};
    u64                 out_mtime_s_{0};

    size_t files_{0};
    size_t dirs_{0};
    size_t skipped_{0};
};
