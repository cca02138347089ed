// ============================================================
// send_app.cpp -- sascp sender: listen, authenticate, send
// ============================================================

#include "send_app.hpp"
#include "archive_packer.hpp"
#include "file_source.hpp"
#include "../common/crypto.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/sas_prompt.hpp"
#include "../common/tcp_channel.hpp"
#include "../common/tui.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <iostream>

#include <unistd.h>

namespace fs = std::filesystem;

SendApp::SendApp(SendConfig config)
    : config_(std::move(config))
{
    if (config_.session_id.empty()) config_.session_id = crypto::new_session_id();
}

SendApp::~SendApp() {
    stop();
}

void SendApp::stop() {
    stop_.store(true);
    cancel_.cancel();
}

// ---------------------------------------------------------------
// prepare
// ---------------------------------------------------------------

void SendApp::prepare() {
    const auto& paths = config_.paths;
    if (paths.empty()) throw InvalidInputError("nothing to send: no paths given");

    bool has_stdin = false;
    for (const auto& p : paths) {
        if (p == "-") has_stdin = true;
    }

    if (has_stdin) {
        if (paths.size() != 1) throw InvalidInputError("'-' cannot be combined with other paths");
        if (!config_.size) throw InvalidInputError("--size is required when sending stdin");
        source_    = std::make_unique<StreamSource>(STDIN_FILENO, config_.stdin_name, config_.size);
        total_     = *config_.size;
        meta_name_ = config_.name.empty() ? config_.stdin_name : config_.name;
        LOG_INFO("sending stdin as " + *meta_name_ + " (" + utils::format_bytes(total_) + ")");
        return;
    }
    if (config_.size) LOG_WARN("--size only applies to stdin; ignored");

    if (paths.size() == 1) {
        std::error_code ec;
        auto st = fs::status(paths[0], ec);
        if (!ec && fs::is_regular_file(st) && fs::file_size(paths[0], ec) > 0 && !ec) {
            auto src   = std::make_unique<FileSource>(paths[0]);
            total_     = *src->size();
            meta_name_ = config_.name.empty() ? src->name() : config_.name;
            source_    = std::move(src);
            LOG_INFO("sending file " + *meta_name_ + " (" + utils::format_bytes(total_) + ")");
            return;
        }
    }

    // Directories, several paths, or a single empty file
    auto packer = std::make_unique<ArchivePacker>(paths, config_.excludes, config_.transfer.chunk_size);
    packer->scan();
    total_ = packer->total_size();

    if (!config_.name.empty()) {
        meta_name_ = config_.name;
    } else if (paths.size() == 1 && fs::is_directory(paths[0])) {
        meta_name_ = ArchivePacker::input_base_name(paths[0]) + ".tar";
    } else {
        meta_name_ = packer->name();
    }
    LOG_INFO("sending archive " + *meta_name_ + ": " + std::to_string(packer->entries().size()) +
             " files, " + utils::format_bytes(total_));
    source_ = std::move(packer);
}

// ---------------------------------------------------------------
// accept_peer
// ---------------------------------------------------------------

TcpSocket SendApp::accept_peer() {
    while (!stop_.load()) {
        if (!listen_sock_.wait_readable(200)) continue;
        return listen_sock_.accept_one();
    }
    throw CancelledError();
}

// ---------------------------------------------------------------
// run
// ---------------------------------------------------------------

int SendApp::run() {
    prepare();

    listen_sock_ = TcpSocket::listen_on(config_.bind_ip, config_.port);
    u16 port = listen_sock_.bound_port();

    // The receiver needs both lines; everything else goes to stderr
    std::cout << "session " << config_.session_id << " listening on "
              << config_.bind_ip << ":" << port << "\n"
              << "receive with: sascp_recv <dest> --connect <this-host>:" << port
              << " --code " << config_.session_id << std::endl;

    TcpSocket peer = accept_peer();
    listen_sock_.close();
    std::string peer_addr = peer.remote_endpoint();
    LOG_INFO("receiver connected from " + peer_addr);

    // Plain TCP has no channel fingerprint to wait for
    TransferConfig cfg = config_.transfer;
    cfg.fingerprint_wait_ms = 0;
    if (!config_.pq) {
        LOG_INFO("direct profile over plain TCP: no channel binding, the SAS is the only check");
    }

    auto channel = std::make_shared<TcpChannel>(std::move(peer), "send:" + peer_addr);
    TransferEngine engine(channel, config_.session_id, Role::Sender, cfg, &keys_);
    auto registration = cancel_.attach(engine);
    channel->start();

    ProgressLine line("Sent", meta_name_.value_or(source_->name()));
    // The line starts with the first DATA chunk, after the SAS prompt
    ProgressFn progress = [&line](u64 done, u64 total) { line.update(done, total); };

    HandshakeProfile profile = config_.pq ? HandshakeProfile::PostQuantum : HandshakeProfile::Direct;
    TransferReport report;
    try {
        report = engine.send(*source_, total_, meta_name_, profile,
                             sas_prompt::make(config_.auto_accept), progress);
    } catch (const TransferError&) {
        line.finish();
        throw;
    }
    line.finish();

    LOG_INFO("transfer complete: " + utils::format_bytes(report.bytes) + " sent (" +
             profile_name(report.handshake.profile) + ", SAS " + report.handshake.sas +
             (report.handshake.fingerprint_bound ? ", channel-bound" : "") + ")");
    return EXIT_OK;
}
