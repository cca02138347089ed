// ============================================================
// archive_extractor.cpp -- Streaming tar extraction
// ============================================================

#include "archive_extractor.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <cstring>

namespace {

constexpr size_t MAX_META_LEN = 1024 * 1024;

} // namespace

ArchiveExtractor::ArchiveExtractor(fs::path root, bool overwrite)
    : root_(std::move(root))
    , overwrite_(overwrite)
{
    std::memset(hdr_, 0, sizeof(hdr_));
}

void ArchiveExtractor::feed(const u8* data, size_t len) {
    while (len > 0) {
        size_t n = 0;
        switch (state_) {
            case State::Header:
                n = std::min(tar::BLOCK - hdr_fill_, len);
                std::memcpy(hdr_ + hdr_fill_, data, n);
                hdr_fill_ += n;
                if (hdr_fill_ == tar::BLOCK) {
                    hdr_fill_ = 0;
                    process_header();
                }
                break;

            case State::FileBody:
                n = (size_t)std::min<u64>(remaining_, len);
                out_.append(data, n);
                remaining_ -= n;
                if (remaining_ == 0) {
                    finish_file();
                    state_ = padding_ ? State::Padding : State::Header;
                }
                break;

            case State::MetaBody:
                n = (size_t)std::min<u64>(remaining_, len);
                meta_buf_.append(reinterpret_cast<const char*>(data), n);
                remaining_ -= n;
                if (remaining_ == 0) {
                    finish_meta();
                    state_ = padding_ ? State::Padding : State::Header;
                }
                break;

            case State::SkipBody:
                n = (size_t)std::min<u64>(remaining_, len);
                remaining_ -= n;
                if (remaining_ == 0) state_ = padding_ ? State::Padding : State::Header;
                break;

            case State::Padding:
                n = (size_t)std::min<u64>(padding_, len);
                padding_ -= n;
                if (padding_ == 0) state_ = State::Header;
                break;

            case State::End:
                // Trailing record blocking after the end marker
                return;
        }
        data += n;
        len  -= n;
    }
}

void ArchiveExtractor::enter_body(State body, u64 size) {
    remaining_ = size;
    padding_   = tar::round_up(size) - size;
    if (size > 0) {
        state_ = body;
        return;
    }
    if (body == State::FileBody) finish_file();
    if (body == State::MetaBody) finish_meta();
    state_ = State::Header;
}

void ArchiveExtractor::process_header() {
    if (tar::is_zero_block(hdr_)) {
        if (++zero_blocks_ >= 2) state_ = State::End;
        return;
    }
    zero_blocks_ = 0;

    auto stored = tar::get_number(hdr_ + tar::OFF_CHKSUM, tar::LEN_CHKSUM);
    if (!stored || *stored != tar::checksum(hdr_)) {
        throw ProtocolError("tar header checksum mismatch");
    }
    auto size_field = tar::get_number(hdr_ + tar::OFF_SIZE, tar::LEN_SIZE);
    if (!size_field) throw ProtocolError("tar header has a malformed size field");
    u64 size = *size_field;

    char type = (char)hdr_[tar::OFF_TYPE];

    if (type == tar::TYPE_PAX || type == tar::TYPE_GNU_LONG) {
        if (size > MAX_META_LEN) {
            throw ProtocolError("tar extended header too large: " + std::to_string(size) + " bytes");
        }
        meta_type_ = type;
        meta_buf_.clear();
        enter_body(State::MetaBody, size);
        return;
    }
    if (type == tar::TYPE_PAX_GLOBAL) {
        enter_body(State::SkipBody, size);
        return;
    }

    std::string name;
    if (next_path_) {
        name = *next_path_;
    } else {
        name = tar::get_string(hdr_ + tar::OFF_NAME, tar::LEN_NAME);
        // POSIX ustar only; old GNU headers reuse the prefix bytes
        bool posix = tar::has_magic(hdr_) && hdr_[tar::OFF_MAGIC + 5] == 0;
        std::string prefix = posix ? tar::get_string(hdr_ + tar::OFF_PREFIX, tar::LEN_PREFIX)
                                   : std::string();
        if (!prefix.empty()) name = prefix + "/" + name;
    }
    if (next_size_) size = *next_size_;
    next_path_.reset();
    next_size_.reset();

    u32 mode    = (u32)tar::get_number(hdr_ + tar::OFF_MODE,  tar::LEN_MODE).value_or(0644);
    u64 mtime_s = tar::get_number(hdr_ + tar::OFF_MTIME, tar::LEN_MTIME).value_or(0);

    bool trailing_slash = !name.empty() && name.back() == '/';
    switch (type) {
        case tar::TYPE_FILE_OLD:
            if (trailing_slash) {
                make_dir(name, mode);
                enter_body(State::SkipBody, size);
                break;
            }
            begin_file(name, mode, mtime_s, size);
            break;
        case tar::TYPE_FILE:
        case '7':   // contiguous file
            begin_file(name, mode, mtime_s, size);
            break;
        case tar::TYPE_DIR:
            make_dir(name, mode);
            enter_body(State::SkipBody, size);
            break;
        default:
            LOG_DEBUG("tar: skipping entry type '" + std::string(1, type) + "': " + name);
            ++skipped_;
            enter_body(State::SkipBody, size);
            break;
    }
}

void ArchiveExtractor::begin_file(const std::string& name, u32 mode, u64 mtime_s, u64 size) {
    fs::path path;
    try {
        path = file_io::resolve_under_root(root_, name);
    } catch (const UnsafePathError& e) {
        LOG_WARN(std::string(e.what()) + " (skipped)");
        ++skipped_;
        enter_body(State::SkipBody, size);
        return;
    }

    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    if (fs::exists(st)) {
        if (!overwrite_) throw FileExistsError(path.string());
        if (fs::is_directory(st)) throw IoError("cannot overwrite directory " + path.string());
        // Replace, never write through an existing link
        fs::remove(path, ec);
        if (ec) throw IoError("cannot replace " + path.string() + ": " + ec.message());
    }

    file_io::make_parent_dirs(path.string());
    out_.create(path.string(), file_io::OutputFile::OnExisting::Fail, 0600);
    out_path_    = path.string();
    out_mode_    = mode;
    out_mtime_s_ = mtime_s;
    enter_body(State::FileBody, size);
}

void ArchiveExtractor::finish_file() {
    out_.finish();
    file_io::apply_mode(out_path_, out_mode_);
    file_io::apply_mtime(out_path_, out_mtime_s_ * 1000000000ULL);
    ++files_;
    LOG_DEBUG("extracted " + out_path_);
}

void ArchiveExtractor::make_dir(const std::string& name, u32 mode) {
    if (file_io::normalize_entry(name).empty()) return;   // "./"

    fs::path path;
    try {
        path = file_io::resolve_under_root(root_, name);
    } catch (const UnsafePathError& e) {
        LOG_WARN(std::string(e.what()) + " (skipped)");
        ++skipped_;
        return;
    }

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec || !fs::is_directory(path)) {
        throw IoError("cannot create directory " + path.string() +
                      (ec ? ": " + ec.message() : std::string()));
    }
    // Keep it writable for the entries that follow
    file_io::apply_mode(path.string(), (mode & 07777) | 0700);
    ++dirs_;
}

void ArchiveExtractor::finish_meta() {
    if (meta_type_ == tar::TYPE_GNU_LONG) {
        std::string n = meta_buf_.substr(0, meta_buf_.find('\0'));
        if (!n.empty()) next_path_ = n;
    } else {
        parse_pax(meta_buf_);
    }
    meta_buf_.clear();
}

void ArchiveExtractor::parse_pax(const std::string& records) {
    size_t pos = 0;
    while (pos < records.size()) {
        if (records[pos] == '\0') break;   // NUL padding
        size_t sp = records.find(' ', pos);
        if (sp == std::string::npos) throw ProtocolError("malformed PAX record");
        auto len = utils::parse_u64(records.substr(pos, sp - pos));
        if (!len || *len < (sp - pos) + 3 || pos + *len > records.size()) {
            throw ProtocolError("malformed PAX record length");
        }
        std::string rec = records.substr(sp + 1, (size_t)*len - (sp - pos) - 2);  // drop "\n"
        size_t eq = rec.find('=');
        if (eq == std::string::npos) throw ProtocolError("malformed PAX record");
        std::string key = rec.substr(0, eq);
        std::string val = rec.substr(eq + 1);

        if (key == "path") {
            next_path_ = val;
        } else if (key == "size") {
            auto v = utils::parse_u64(val);
            if (!v) throw ProtocolError("malformed PAX size: " + val);
            next_size_ = *v;
        }
        pos += (size_t)*len;
    }
}

void ArchiveExtractor::finish() {
    if (state_ == State::End) return;
    if (state_ == State::Header && hdr_fill_ == 0) {
        if (next_path_ || next_size_) throw ProtocolError("archive ends after an extended header");
        LOG_DEBUG("tar: stream ended without end-of-archive marker");
        return;
    }
    if (out_.active()) out_.finish();
    throw ProtocolError("archive truncated");
}
