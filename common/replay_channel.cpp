// ============================================================
// replay_channel.cpp -- Early-frame buffering channel view
// ============================================================

#include "replay_channel.hpp"
#include "logger.hpp"

ReplayPolicy ReplayPolicy::handshake() {
    ReplayPolicy p;
    p.kinds = { FrameKind::AuthCommit, FrameKind::AuthOffer,
                FrameKind::AuthReveal, FrameKind::AuthConfirm };
    p.capacity = 32;
    return p;
}

ReplayPolicy ReplayPolicy::stream(size_t capacity) {
    ReplayPolicy p;
    p.kinds = { FrameKind::Init, FrameKind::Data, FrameKind::Fin };
    p.capacity = capacity;
    return p;
}

struct ReplaySafeChannel::State {
    std::mutex        mutex;
    std::deque<Frame> held;
    bool              replayed = false;
    size_t            dropped = 0;

    ReplayPolicy policy;
    std::string  session_id;
    std::string  label;
    std::shared_ptr<HandlerList<const Frame&>> handlers =
        std::make_shared<HandlerList<const Frame&>>();

    bool wanted(const Frame& f) const {
        if (!policy.kinds.count(frame_kind(f))) return false;
        const std::string& sid = frame_session(f);
        return sid.empty() || sid == session_id;
    }

    void on_frame(const Frame& f) {
        std::unique_lock<std::mutex> lk(mutex);
        if (!replayed) {
            if (!wanted(f)) return;
            if (held.size() >= policy.capacity) {
                held.pop_front();
                if (dropped++ == 0) {
                    LOG_WARN(label + ": early-frame buffer full (" +
                             std::to_string(policy.capacity) + "), dropping oldest");
                }
            }
            held.push_back(f);
            return;
        }
        lk.unlock();
        handlers->invoke(f);
    }
};

std::shared_ptr<Channel> ReplaySafeChannel::wrap(std::shared_ptr<Channel> raw,
                                                 const std::string& session_id,
                                                 const std::string& label,
                                                 ReplayPolicy policy) {
    if (std::dynamic_pointer_cast<ReplaySafeChannel>(raw)) return raw;

    auto state = std::make_shared<State>();
    state->policy     = std::move(policy);
    state->session_id = session_id;
    state->label      = label;

    std::shared_ptr<ReplaySafeChannel> view(new ReplaySafeChannel(std::move(raw), label, state));
    return view;
}

ReplaySafeChannel::ReplaySafeChannel(std::shared_ptr<Channel> raw, std::string label,
                                     std::shared_ptr<State> state)
    : raw_(std::move(raw))
    , label_(std::move(label))
    , state_(std::move(state))
{
    std::shared_ptr<State> st = state_;
    tap_ = raw_->on_message([st](const Frame& f) { st->on_frame(f); });
}

ReplaySafeChannel::~ReplaySafeChannel() = default;

Subscription ReplaySafeChannel::on_message(MessageHandler handler) {
    std::lock_guard<std::mutex> lk(state_->mutex);
    Subscription sub = state_->handlers->add(handler);
    if (!state_->replayed) {
        state_->replayed = true;
        std::deque<Frame> held;
        held.swap(state_->held);
        if (!held.empty()) {
            LOG_DEBUG(label_ + ": replaying " + std::to_string(held.size()) + " early frame(s)");
        }
        for (const auto& f : held) handler(f);
    }
    return sub;
}

size_t ReplaySafeChannel::buffered() const {
    std::lock_guard<std::mutex> lk(state_->mutex);
    return state_->held.size();
}

size_t ReplaySafeChannel::dropped() const {
    std::lock_guard<std::mutex> lk(state_->mutex);
    return state_->dropped;
}
