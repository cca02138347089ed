// ============================================================
// recv_app.cpp -- sascp receiver: connect, authenticate, receive
// ============================================================

#include "recv_app.hpp"
#include "mismatch_policy.hpp"
#include "sniffing_sink.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/sas_prompt.hpp"
#include "../common/tcp_channel.hpp"
#include "../common/tui.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

RecvApp::RecvApp(RecvConfig config)
    : config_(std::move(config))
{
    LOG_DEBUG("RecvApp: dest=" + (config_.destination.empty() ? std::string(".") : config_.destination) +
              " sender=" + config_.host + ":" + std::to_string(config_.port) +
              " session=" + config_.session_id);
}

RecvApp::~RecvApp() {
    stop();
}

void RecvApp::stop() {
    stop_.store(true);
    cancel_.cancel();
}

// ---------------------------------------------------------------
// connect_with_retry
// ---------------------------------------------------------------

TcpSocket RecvApp::connect_with_retry() {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() +
                    std::chrono::seconds(config_.retry_secs > 0 ? config_.retry_secs : 0);

    int delay_ms = 500;
    const int max_delay_ms = 8000;

    while (!stop_.load()) {
        try {
            return TcpSocket::connect_to(config_.host, config_.port);
        } catch (const NetworkError& e) {
            if (clock::now() >= deadline) {
                throw NetworkError("cannot reach sender at " + config_.host + ":" +
                                   std::to_string(config_.port) + " (" + e.what() + ")");
            }
            LOG_INFO("sender not ready, retry in " + std::to_string(delay_ms) + " ms");
        }
        // Sleep in short steps so stop() is prompt
        auto wake = clock::now() + std::chrono::milliseconds(delay_ms);
        while (!stop_.load() && clock::now() < wake) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        delay_ms = std::min(delay_ms * 2, max_delay_ms);
    }
    throw CancelledError();
}

// ---------------------------------------------------------------
// run
// ---------------------------------------------------------------

int RecvApp::run() {
    LOG_INFO("connecting to " + config_.host + ":" + std::to_string(config_.port) + " ...");
    TcpSocket sock = connect_with_retry();
    std::string peer_addr = sock.remote_endpoint();
    LOG_INFO("connected to sender " + peer_addr);

    // Plain TCP has no channel fingerprint to wait for
    TransferConfig cfg = config_.transfer;
    cfg.fingerprint_wait_ms = 0;
    LOG_DEBUG("plain TCP: no channel binding, a direct-profile sender is checked by SAS only");

    SniffingSink::Options sink_opts;
    sink_opts.destination = config_.destination;
    sink_opts.overwrite   = config_.overwrite;
    sink_opts.session_id  = config_.session_id;
    SniffingSink sink(sink_opts);

    // Everything that taps the channel exists before the reader starts
    auto channel = std::make_shared<TcpChannel>(std::move(sock), "recv:" + peer_addr);
    InitFinTracker tracker(channel, config_.session_id);
    TransferEngine engine(channel, config_.session_id, Role::Receiver, cfg, &keys_);
    auto registration = cancel_.attach(engine);
    channel->start();

    ProgressLine line("Recv");
    bool named = false;
    ProgressFn progress = [&line, &sink, &named](u64 done, u64 total) {
        if (!named) {
            line.set_name(sink.stats().desired_name);
            named = true;
        }
        line.update(done, total);
    };

    MismatchPolicy policy(cfg.tolerate_count_mismatch);
    TransferReport report;
    try {
        report = engine.receive(sink, sas_prompt::make(config_.auto_accept), progress);
    } catch (const SizeMismatchError& e) {
        line.finish();
        if (!policy.should_tolerate(e, sink.stats(), tracker, engine.stripped_bytes())) throw;
        sink.close();
        report.bytes = sink.written();
    } catch (const TransferError&) {
        line.finish();
        throw;
    }
    line.finish();

    auto stats = sink.stats();
    std::string where = stats.resolved_path == "-" ? std::string("stdout") : stats.resolved_path;
    LOG_INFO("transfer complete: " + utils::format_bytes(stats.written) + " -> " + where +
             (report.handshake.sas.empty() ? std::string() : " (SAS " + report.handshake.sas + ")"));
    return EXIT_OK;
}
