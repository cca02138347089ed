// ============================================================
// sniffing_sink.cpp -- Receiving-side destination chooser
// ============================================================

#include "sniffing_sink.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/platform.hpp"
#include "../common/utils.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

namespace {

constexpr int MAX_COLLISION_SUFFIX = 10000;

// "a.txt", 2 -> "a-2.txt"; a leading dot is not an extension
std::string suffixed(const std::string& name, int n) {
    if (n == 0) return name;
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return name + "-" + std::to_string(n);
    return name.substr(0, dot) + "-" + std::to_string(n) + name.substr(dot);
}

} // namespace

SniffingSink::SniffingSink(Options opts)
    : opts_(std::move(opts))
{
    const std::string& d = opts_.destination;
    std::error_code ec;
    if (d == "-") {
        dest_kind_ = DestKind::Stdout;
    } else if (d.empty() || d.back() == '/' || fs::is_directory(d, ec)) {
        dest_kind_ = DestKind::Directory;
    } else {
        dest_kind_ = DestKind::File;
    }
}

SniffingSink::~SniffingSink() = default;

fs::path SniffingSink::unique_path(const fs::path& dir, const std::string& name) {
    for (int i = 0; i < MAX_COLLISION_SUFFIX; ++i) {
        fs::path p = dir / suffixed(name, i);
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(p, ec))) return p;
    }
    throw IoError("no free file name for " + (dir / name).string());
}

void SniffingSink::info(const SinkInfo& info) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (info.total_bytes) stats_.announced = info.total_bytes;
    if (info.name) stats_.desired_name = *info.name;
}

void SniffingSink::open_collision_safe(const fs::path& dir, const std::string& name) {
    if (opts_.overwrite) {
        file_.create((dir / name).string(), file_io::OutputFile::OnExisting::Replace);
        return;
    }
    for (int i = 0; i < MAX_COLLISION_SUFFIX; ++i) {
        try {
            file_.create((dir / suffixed(name, i)).string(), file_io::OutputFile::OnExisting::Fail);
            return;
        } catch (const FileExistsError&) {
            continue;
        }
    }
    throw IoError("no free file name for " + (dir / name).string());
}

void SniffingSink::decide() {
    bool is_tar = head_.size() >= tar::BLOCK && tar::has_magic(head_.data());

    switch (dest_kind_) {
        case DestKind::Stdout:
            if (is_tar) {
                throw InvalidInputError("incoming payload is an archive and cannot be written to "
                                        "stdout; give a directory instead");
            }
            decision_ = Decision::Stdout;
            stats_.resolved_path = "-";
            break;

        case DestKind::File: {
            file_io::make_parent_dirs(opts_.destination);
            file_.create(opts_.destination, opts_.overwrite ? file_io::OutputFile::OnExisting::Replace
                                                            : file_io::OutputFile::OnExisting::Fail);
            decision_ = Decision::RawFile;
            stats_.resolved_path = opts_.destination;
            break;
        }

        case DestKind::Directory: {
            fs::path dir = opts_.destination.empty() ? fs::path(".") : fs::path(opts_.destination);
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) throw IoError("cannot create " + dir.string() + ": " + ec.message());

            if (is_tar) {
                extractor_ = std::make_unique<ArchiveExtractor>(dir, opts_.overwrite);
                decision_ = Decision::Extract;
                stats_.resolved_path = dir.string();
            } else {
                std::string fallback = "sascp-" + opts_.session_id + ".bin";
                std::string name = stats_.desired_name.empty()
                                       ? fallback
                                       : utils::sanitize_filename(stats_.desired_name, fallback);
                open_collision_safe(dir, name);
                decision_ = Decision::RawFile;
                stats_.resolved_path = file_.path();
            }
            break;
        }
    }

    LOG_DEBUG(std::string("sink: ") + (is_tar ? "archive" : "raw") + " -> " + stats_.resolved_path);

    std::vector<u8> head;
    head.swap(head_);
    if (!head.empty()) forward(head.data(), head.size());
}

void SniffingSink::forward(const u8* data, size_t len) {
    switch (decision_) {
        case Decision::Stdout:
            if (!platform::write_fd_all(STDOUT_FILENO, data, len)) {
                throw IoError(std::string("write to stdout failed: ") + std::strerror(errno));
            }
            break;
        case Decision::RawFile:
            file_.append(data, len);
            break;
        case Decision::Extract:
            extractor_->feed(data, len);
            break;
        case Decision::Pending:
            throw std::logic_error("SniffingSink::forward before decision");
    }
    stats_.written += len;
}

void SniffingSink::write(const u8* data, size_t len) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) throw IoError("write after close");
    if (len == 0) return;
    stats_.started = true;

    if (decision_ != Decision::Pending) {
        forward(data, len);
        return;
    }
    head_.insert(head_.end(), data, data + len);
    if (head_.size() >= tar::BLOCK) decide();
}

void SniffingSink::close() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) return;
    closed_ = true;

    if (decision_ == Decision::Pending) decide();

    switch (decision_) {
        case Decision::RawFile:
            file_.finish();
            break;
        case Decision::Extract:
            extractor_->finish();
            LOG_INFO("extracted " + std::to_string(extractor_->files_extracted()) + " files into " +
                     stats_.resolved_path +
                     (extractor_->entries_skipped()
                          ? " (" + std::to_string(extractor_->entries_skipped()) + " entries skipped)"
                          : std::string()));
            break;
        case Decision::Stdout:
        case Decision::Pending:
            break;
    }
}

u64 SniffingSink::written() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return stats_.written;
}

SniffingSink::Stats SniffingSink::stats() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return stats_;
}

SniffingSink::Decision SniffingSink::decision() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return decision_;
}
