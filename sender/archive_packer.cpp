// ============================================================
// archive_packer.cpp -- On-the-fly ustar stream
// ============================================================

#include "archive_packer.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/tar_format.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

// Unwinds the producer when the consumer went away
struct ProducerStopped {};

void fill_header(u8* h, const std::string& name, u32 mode, u64 size, u64 mtime_s, char type) {
    std::memset(h, 0, tar::BLOCK);

    std::string prefix, base;
    if (!ArchivePacker::split_ustar_name(name, prefix, base)) {
        // The PAX record carries the real path; keep the tail for old readers
        base = name.size() > tar::LEN_NAME ? name.substr(name.size() - tar::LEN_NAME) : name;
        prefix.clear();
    }
    std::memcpy(h + tar::OFF_NAME, base.data(), std::min(base.size(), tar::LEN_NAME));
    std::memcpy(h + tar::OFF_PREFIX, prefix.data(), std::min(prefix.size(), tar::LEN_PREFIX));

    tar::put_number(h + tar::OFF_MODE,  tar::LEN_MODE,  mode & 07777);
    tar::put_number(h + tar::OFF_UID,   tar::LEN_UID,   0);
    tar::put_number(h + tar::OFF_GID,   tar::LEN_GID,   0);
    tar::put_number(h + tar::OFF_SIZE,  tar::LEN_SIZE,  size);
    tar::put_number(h + tar::OFF_MTIME, tar::LEN_MTIME, mtime_s);
    h[tar::OFF_TYPE] = (u8)type;
    std::memcpy(h + tar::OFF_MAGIC, "ustar", 6);   // includes the NUL
    std::memcpy(h + tar::OFF_VERSION, "00", 2);
    tar::seal(h);
}

size_t decimal_digits(size_t n) {
    size_t d = 1;
    while (n >= 10) { n /= 10; ++d; }
    return d;
}

} // namespace

ArchivePacker::ArchivePacker(std::vector<std::string> paths,
                             std::vector<std::string> excludes,
                             u32 chunk_size)
    : paths_(std::move(paths))
    , excludes_(std::move(excludes))
    , chunk_size_(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE)
{}

ArchivePacker::~ArchivePacker() {
    stop();
}

void ArchivePacker::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (producer_.joinable()) producer_.join();
}

// ---- naming helpers ----

bool ArchivePacker::split_ustar_name(const std::string& name, std::string& prefix, std::string& base) {
    if (name.size() <= tar::LEN_NAME) {
        prefix.clear();
        base = name;
        return true;
    }
    if (name.size() > tar::LEN_PREFIX + 1 + tar::LEN_NAME) return false;
    for (size_t i = 0; i < name.size() && i <= tar::LEN_PREFIX; ++i) {
        if (name[i] != '/') continue;
        size_t rest = name.size() - i - 1;
        if (rest > 0 && rest <= tar::LEN_NAME) {
            prefix = name.substr(0, i);
            base   = name.substr(i + 1);
            return true;
        }
    }
    return false;
}

std::string ArchivePacker::pax_record(const std::string& key, const std::string& value) {
    std::string body = " " + key + "=" + value + "\n";
    size_t d = decimal_digits(body.size());
    while (decimal_digits(body.size() + d) != d) ++d;
    return std::to_string(body.size() + d) + body;
}

std::string ArchivePacker::input_base_name(const std::string& p) {
    fs::path path(p);
    fs::path norm = path.lexically_normal();
    std::string base = norm.filename().string();
    if (base.empty()) base = norm.parent_path().filename().string();
    if (base.empty() || base == "." || base == "..") {
        std::error_code ec;
        base = fs::weakly_canonical(path, ec).filename().string();
    }
    if (base.empty()) base = "root";
    return base;
}

u64 ArchivePacker::entry_span(const ArchiveEntry& e) {
    u64 span = tar::BLOCK + tar::round_up(e.size);
    if (e.pax_len) span += tar::BLOCK + tar::round_up(e.pax_len);
    return span;
}

// ---- phase 1 ----

void ArchivePacker::add_entry(const std::string& abs_path, const std::string& name) {
    std::error_code ec;
    ArchiveEntry e;
    e.abs_path = abs_path;
    e.name     = name;
    e.size     = (u64)fs::file_size(abs_path, ec);
    if (ec) throw IoError("cannot stat " + abs_path + ": " + ec.message());
    auto st = fs::status(abs_path, ec);
    if (!ec) e.mode = (u32)st.permissions() & 07777;
    e.mtime_ns = file_io::mtime_ns_of(abs_path);

    std::string prefix, base;
    if (!split_ustar_name(e.name, prefix, base)) {
        e.pax_len = pax_record("path", e.name).size();
    }
    entries_.push_back(std::move(e));
}

void ArchivePacker::scan() {
    entries_.clear();

    for (const auto& p : paths_) {
        fs::path path(p);
        std::error_code ec;
        auto st = fs::status(path, ec);
        if (ec || !fs::exists(st)) {
            throw IoError("cannot access " + p + (ec ? ": " + ec.message() : std::string()));
        }

        if (fs::is_directory(st)) {
            std::string base = input_base_name(p);
            fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
            if (ec) throw IoError("cannot read directory " + p + ": " + ec.message());

            for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (ec) throw IoError("cannot read directory " + p + ": " + ec.message());
                std::error_code ec2;
                std::string rel = it->path().lexically_relative(path).generic_string();
                if (utils::glob_match_any(excludes_, rel)) {
                    if (it->is_directory(ec2)) it.disable_recursion_pending();
                    LOG_DEBUG("excluded: " + rel);
                    continue;
                }
                // Regular files only; symlinks inside a tree are not followed
                if (!fs::is_regular_file(it->symlink_status(ec2))) continue;
                add_entry(it->path().string(), base + "/" + rel);
            }
            if (ec) throw IoError("cannot read directory " + p + ": " + ec.message());
        } else if (fs::is_regular_file(st)) {
            std::string name = path.filename().string();
            if (utils::glob_match_any(excludes_, name)) {
                LOG_DEBUG("excluded: " + name);
                continue;
            }
            add_entry(path.string(), name);
        } else {
            LOG_WARN("skipping " + p + ": not a regular file or directory");
        }
    }

    std::sort(entries_.begin(), entries_.end(),
              [](const ArchiveEntry& a, const ArchiveEntry& b) { return a.name < b.name; });
    for (size_t i = 1; i < entries_.size(); ++i) {
        if (entries_[i].name == entries_[i - 1].name) {
            throw InvalidInputError("two inputs map to the same archive entry: " + entries_[i].name);
        }
    }

    total_size_ = 2 * tar::BLOCK;
    for (const auto& e : entries_) total_size_ += entry_span(e);
    scanned_ = true;

    if (entries_.empty()) LOG_WARN("archive contains no files");
    LOG_DEBUG("archive: " + std::to_string(entries_.size()) + " files, " +
              std::to_string(total_size_) + " bytes");
}

std::optional<u64> ArchivePacker::size() const {
    if (!scanned_) return std::nullopt;
    return total_size_;
}

// ---- phase 2: producer ----

void ArchivePacker::flush_staging() {
    if (staging_.empty()) return;
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this] { return stop_ || chunks_.size() < QUEUE_LIMIT; });
    if (stop_) throw ProducerStopped();
    chunks_.push_back(std::move(staging_));
    staging_.clear();
    staging_.reserve(chunk_size_);
    cv_.notify_all();
}

void ArchivePacker::emit(const u8* data, size_t len) {
    while (len > 0) {
        size_t room = chunk_size_ - staging_.size();
        size_t n = std::min(room, len);
        staging_.insert(staging_.end(), data, data + n);
        data += n;
        len  -= n;
        if (staging_.size() >= chunk_size_) flush_staging();
    }
}

void ArchivePacker::emit_zeros(size_t len) {
    static const u8 zeros[tar::BLOCK] = {0};
    while (len > 0) {
        size_t n = std::min(len, sizeof(zeros));
        emit(zeros, n);
        len -= n;
    }
}

void ArchivePacker::emit_entry(const ArchiveEntry& e) {
    u64 mtime_s = e.mtime_ns / 1000000000ULL;
    u8 h[tar::BLOCK];

    if (e.pax_len) {
        std::string record = pax_record("path", e.name);
        std::string leaf = fs::path(e.name).filename().string();
        std::string pax_name = utils::truncate_utf8("PaxHeaders/" + leaf, tar::LEN_NAME);
        fill_header(h, pax_name, 0644, record.size(), mtime_s, tar::TYPE_PAX);
        emit(h, sizeof(h));
        emit(reinterpret_cast<const u8*>(record.data()), record.size());
        emit_zeros((size_t)(tar::round_up(record.size()) - record.size()));
    }

    fill_header(h, e.name, e.mode, e.size, mtime_s, tar::TYPE_FILE);
    emit(h, sizeof(h));

    if (e.size > 0) {
        file_io::MappedFile file(e.abs_path);
        if (file.size() != e.size) {
            throw IoError(e.abs_path + " changed size since it was scanned (" +
                          std::to_string(e.size) + " -> " + std::to_string(file.size()) + " bytes)");
        }
        for (u64 off = 0; off < e.size;) {
            auto r = file.range(off, chunk_size_);
            emit(r.data, r.len);
            off += r.len;
        }
    }
    emit_zeros((size_t)(tar::round_up(e.size) - e.size));
}

void ArchivePacker::produce() {
    try {
        staging_.reserve(chunk_size_);
        for (const auto& e : entries_) emit_entry(e);
        emit_zeros(2 * tar::BLOCK);
        flush_staging();
    } catch (const ProducerStopped&) {
        return;
    } catch (const TransferError&) {
        std::lock_guard<std::mutex> lk(mutex_);
        error_ = std::current_exception();
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lk(mutex_);
        error_ = std::make_exception_ptr(IoError(std::string("archive read failed: ") + e.what()));
    }

    std::lock_guard<std::mutex> lk(mutex_);
    done_ = true;
    cv_.notify_all();
}

size_t ArchivePacker::read(u8* buf, size_t cap) {
    if (!scanned_) throw std::logic_error("ArchivePacker::read before scan()");
    if (!producer_.joinable()) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!done_ && !stop_) producer_ = std::thread([this] { produce(); });
    }

    size_t out = 0;
    while (out < cap) {
        if (current_pos_ < current_.size()) {
            size_t n = std::min(cap - out, current_.size() - current_pos_);
            std::memcpy(buf + out, current_.data() + current_pos_, n);
            current_pos_ += n;
            out += n;
            continue;
        }
        if (out > 0) break;

        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait(lk, [this] { return error_ || done_ || stop_ || !chunks_.empty(); });
        if (error_) std::rethrow_exception(error_);
        if (chunks_.empty()) return 0;
        current_ = std::move(chunks_.front());
        chunks_.pop_front();
        current_pos_ = 0;
        cv_.notify_all();
    }
    return out;
}
