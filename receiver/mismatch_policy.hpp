#pragma once

// ============================================================
// mismatch_policy.hpp -- Receiver-side override for byte-count
//                        disagreements
//
// Only SizeMismatchError can be downgraded, and only when counters
// kept outside the stream receiver agree that the payload arrived.
// A FIN{ok:false} from the sender is never downgraded.
// ============================================================

#include "sniffing_sink.hpp"
#include "../common/channel.hpp"
#include "../common/errors.hpp"

// Watches the raw channel for INIT and FIN of one session,
// independently of the stream receiver's own bookkeeping.
class InitFinTracker {
public:
    InitFinTracker(const std::shared_ptr<Channel>& channel, const std::string& session_id);

    InitFinTracker(const InitFinTracker&) = delete;
    InitFinTracker& operator=(const InitFinTracker&) = delete;

    bool init_seen() const;
    bool fin_seen() const;
    // Meaningful once fin_seen(): the sender's own success flag
    bool fin_ok() const;
    u64  announced() const;

private:
    struct State {
        std::mutex mutex;
        bool       init_seen = false;
        bool       fin_seen  = false;
        bool       fin_ok    = false;
        u64        announced = 0;
    };

    std::shared_ptr<State> state_;
    Subscription           sub_;
};

class MismatchPolicy {
public:
    explicit MismatchPolicy(bool enabled) : enabled_(enabled) {}

    // `stripped` is the MetaHeader length removed on the sink side
    // (PQ mode), 0 otherwise.
    bool should_tolerate(const TransferError& err,
                         const SniffingSink::Stats& sink,
                         const InitFinTracker& tracker,
                         u64 stripped) const;

    bool enabled() const { return enabled_; }

private:
    bool enabled_;
};
