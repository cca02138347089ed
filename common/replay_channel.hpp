#pragma once

// ============================================================
// replay_channel.hpp -- Early-frame buffering channel view
//
// Taps the raw channel from the moment of wrapping. Until the first
// on_message() subscriber appears, frames whose kind is allowed by
// the policy (and whose session id matches or is empty) are held in a
// bounded FIFO; overflow drops the oldest. The first subscriber gets
// the held frames synchronously, in arrival order, then the view is
// pass-through for good. send() is never intercepted.
// ============================================================

#include "channel.hpp"
#include <deque>
#include <set>

struct ReplayPolicy {
    std::set<FrameKind> kinds;
    size_t              capacity = 32;

    // AUTH_COMMIT / OFFER / REVEAL / CONFIRM, 32 frames
    static ReplayPolicy handshake();

    // INIT / DATA / FIN, for the stream consumer that attaches only
    // after the handshake has finished
    static ReplayPolicy stream(size_t capacity);
};

class ReplaySafeChannel : public Channel {
public:
    // Wrapping an already-wrapped channel returns it unchanged
    static std::shared_ptr<Channel> wrap(std::shared_ptr<Channel> raw,
                                         const std::string& session_id,
                                         const std::string& label,
                                         ReplayPolicy policy = ReplayPolicy::handshake());

    ~ReplaySafeChannel() override;

    void send(const Frame& frame) override { raw_->send(frame); }
    Subscription on_message(MessageHandler handler) override;
    Subscription on_close(CloseHandler handler) override { return raw_->on_close(std::move(handler)); }
    bool flush(int timeout_ms) override { return raw_->flush(timeout_ms); }
    void close() override { raw_->close(); }
    bool is_open() const override { return raw_->is_open(); }

    std::optional<Fingerprint> local_fingerprint() const override  { return raw_->local_fingerprint(); }
    std::optional<Fingerprint> remote_fingerprint() const override { return raw_->remote_fingerprint(); }
    std::string close_reason() const override { return raw_->close_reason(); }
    std::string label() const override { return label_; }

    const std::shared_ptr<Channel>& raw() const { return raw_; }

    // Frames currently held (0 once replayed)
    size_t buffered() const;
    // Frames dropped because the buffer was full
    size_t dropped() const;

private:
    struct State;

    ReplaySafeChannel(std::shared_ptr<Channel> raw, std::string label,
                      std::shared_ptr<State> state);

    std::shared_ptr<Channel> raw_;
    std::string              label_;
    std::shared_ptr<State>   state_;
    Subscription             tap_;
};
