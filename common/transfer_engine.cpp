// ============================================================
// transfer_engine.cpp -- Session orchestration
// ============================================================

#include "transfer_engine.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "replay_channel.hpp"

TransferEngine::TransferEngine(std::shared_ptr<Channel> raw, std::string session_id, Role role,
                               const TransferConfig& cfg, KeyProvider* keys,
                               BulkTransfer* bulk)
    : raw_(std::move(raw))
    , session_id_(std::move(session_id))
    , role_(role)
    , cfg_(cfg)
    , keys_(keys)
    , own_bulk_(bulk ? nullptr : std::make_unique<FramedBulkTransfer>(cfg))
    , pq_(bulk ? *bulk : *own_bulk_)
    , peer_closed_(std::make_shared<Inbox>())
{
    handshake_view_ = ReplaySafeChannel::wrap(raw_, session_id_, raw_->label() + "/handshake");
    if (role_ == Role::Receiver) {
        // INIT may land while we are still waiting for the sender's confirm
        stream_view_ = ReplaySafeChannel::wrap(raw_, session_id_, raw_->label() + "/stream",
                                               ReplayPolicy::stream(cfg_.early_frame_limit));
    }
    std::shared_ptr<Inbox> closed = peer_closed_;
    close_sub_ = raw_->on_close([closed] { closed->close(); });
}

TransferEngine::~TransferEngine() {
    close_sub_.reset();
    raw_->close();
}

void TransferEngine::cancel() {
    cancelled_ = true;
    raw_->close();
}

void TransferEngine::teardown() {
    if (!raw_->flush(cfg_.flush_timeout_ms)) {
        LOG_WARN("outbound frames still queued after " + std::to_string(cfg_.flush_timeout_ms) + " ms");
    }
    if (role_ == Role::Sender) {
        // Let the receiver close first so its last frames are not cut off
        Frame unused;
        if (peer_closed_->pop(unused, cfg_.peer_close_wait_ms) == Inbox::PopResult::Timeout) {
            LOG_DEBUG("peer still connected after " + std::to_string(cfg_.peer_close_wait_ms) +
                      " ms; closing");
        }
    }
    raw_->close();
}

TransferReport TransferEngine::send(ByteSource& source, u64 total_bytes,
                                    const std::optional<std::string>& meta_name,
                                    HandshakeProfile profile,
                                    const ConfirmFn& confirm, const ProgressFn& progress) {
    if (role_ != Role::Sender) throw std::logic_error("TransferEngine::send on a receiver");
    if (total_bytes == 0) {
        throw InvalidInputError("nothing to send: total size must be positive");
    }

    TransferReport report;
    try {
        HandshakeCoordinator hs(handshake_view_, session_id_, cfg_, keys_);
        report.handshake = hs.run_sender(profile, confirm);

        if (profile == HandshakeProfile::Direct) {
            StreamSender sender(raw_, session_id_, cfg_);
            report.bytes = sender.send(source, total_bytes, meta_name, progress);
        } else {
            report.bytes = pq_.send(raw_, session_id_, source, total_bytes, meta_name, progress);
        }
        teardown();
    } catch (const TransferError&) {
        if (cancelled_) throw CancelledError();
        throw;
    }
    return report;
}

TransferReport TransferEngine::receive(ByteSink& sink, const ConfirmFn& confirm,
                                       const ProgressFn& progress) {
    if (role_ != Role::Receiver) throw std::logic_error("TransferEngine::receive on a sender");

    TransferReport report;
    try {
        HandshakeCoordinator hs(handshake_view_, session_id_, cfg_, keys_);
        report.handshake = hs.run_receiver(confirm);

        if (report.handshake.profile == HandshakeProfile::Direct) {
            StreamReceiver receiver(stream_view_, session_id_, cfg_, true);
            report.bytes = receiver.receive(sink, progress);
        } else {
            report.bytes = pq_.receive(stream_view_, session_id_, sink, progress);
            report.stripped_bytes = pq_.stripped_bytes();
        }
        teardown();
    } catch (const TransferError&) {
        if (cancelled_) throw CancelledError();
        throw;
    }
    return report;
}

// ---- CancelSlot ----

CancelSlot::Registration CancelSlot::attach(TransferEngine& engine) {
    std::lock_guard<std::mutex> lk(mutex_);
    engine_ = &engine;
    if (cancelled_) engine.cancel();
    return Registration(*this);
}

void CancelSlot::detach() {
    std::lock_guard<std::mutex> lk(mutex_);
    engine_ = nullptr;
}

void CancelSlot::cancel() {
    std::lock_guard<std::mutex> lk(mutex_);
    cancelled_ = true;
    if (engine_) engine_->cancel();
}

bool CancelSlot::cancelled() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return cancelled_;
}
