#pragma once

// ============================================================
// transfer_engine.hpp -- One session on one channel:
//                        handshake, then stream or PQ transfer
// ============================================================

#include "handshake.hpp"
#include "pq_transfer.hpp"
#include "stream_transfer.hpp"
#include <mutex>

enum class Role { Sender, Receiver };

struct TransferReport {
    HandshakeResult handshake;
    u64             bytes = 0;            // payload bytes, MetaHeader excluded
    u64             stripped_bytes = 0;   // receiver, PQ mode
};

class TransferEngine {
public:
    // Construct before the channel can deliver frames: the handshake
    // view (and on the receiver the stream view) taps it from here on.
    // `keys` is needed for the PQ profile; `bulk` defaults to the
    // framed mover.
    TransferEngine(std::shared_ptr<Channel> raw, std::string session_id, Role role,
                   const TransferConfig& cfg, KeyProvider* keys,
                   BulkTransfer* bulk = nullptr);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    TransferReport send(ByteSource& source, u64 total_bytes,
                        const std::optional<std::string>& meta_name,
                        HandshakeProfile profile,
                        const ConfirmFn& confirm, const ProgressFn& progress);

    TransferReport receive(ByteSink& sink, const ConfirmFn& confirm,
                           const ProgressFn& progress);

    // Close the channel from any thread; blocked waits surface as
    // CancelledError
    void cancel();

    u64 stripped_bytes() const { return pq_.stripped_bytes(); }
    const std::shared_ptr<Channel>& channel() const { return raw_; }

private:
    void teardown();

    std::shared_ptr<Channel> raw_;
    std::string              session_id_;
    Role                     role_;
    TransferConfig           cfg_;
    KeyProvider*             keys_;

    std::unique_ptr<FramedBulkTransfer> own_bulk_;
    PqTransfer                          pq_;

    std::shared_ptr<Channel> handshake_view_;
    std::shared_ptr<Channel> stream_view_;

    std::shared_ptr<Inbox>   peer_closed_;
    Subscription             close_sub_;
    std::atomic<bool>        cancelled_{false};
};

// Lets another thread cancel whichever engine is current. The engine
// pointer is only touched under the mutex, so a cancel racing with the
// end of run() never reaches a destroyed engine.
class CancelSlot {
public:
    class Registration {
    public:
        explicit Registration(CancelSlot& slot) : slot_(&slot) {}
        ~Registration() { if (slot_) slot_->detach(); }
        Registration(Registration&& o) noexcept : slot_(o.slot_) { o.slot_ = nullptr; }
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration& operator=(Registration&&) = delete;

    private:
        CancelSlot* slot_;
    };

    // Cancels at once when cancel() already happened
    Registration attach(TransferEngine& engine);

    void cancel();
    bool cancelled() const;

private:
    void detach();

    mutable std::mutex mutex_;
    TransferEngine*    engine_{nullptr};
    bool               cancelled_{false};
};
