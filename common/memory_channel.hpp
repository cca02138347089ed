#pragma once

// ============================================================
// memory_channel.hpp -- In-process connected channel pair
//
// Frames pass through the real wire codec. Each endpoint has a
// dispatcher thread, so delivery is asynchronous and ordered the
// same way a socket-backed channel delivers.
// ============================================================

#include "channel.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <thread>
#include <utility>

class MemoryChannel : public ChannelBase {
public:
    struct Options {
        std::string                label;
        std::optional<Fingerprint> local_fingerprint;
        // What this endpoint observes as the peer's identity; defaults to
        // the peer's local fingerprint. Set it to model an interposed relay.
        std::optional<Fingerprint> observed_remote;
    };

    // Outbound wire bytes pass through this hook; return false to drop
    using Tamper = std::function<bool(std::vector<u8>& wire)>;

    static std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>>
    create_pair(Options a = Options(), Options b = Options());

    ~MemoryChannel() override;

    void send(const Frame& frame) override;
    bool flush(int timeout_ms) override;
    void close() override;
    bool is_open() const override { return !closing_.load(); }

    std::optional<Fingerprint> local_fingerprint() const override;
    std::optional<Fingerprint> remote_fingerprint() const override;
    std::string label() const override { return label_; }

    // Fingerprint becomes available only after this delay (models a
    // transport that finishes its own handshake late)
    void set_fingerprint_delay_ms(int ms);

    void set_tamper(Tamper fn);

    // Wait until this endpoint's inbound queue is drained
    bool wait_idle(int timeout_ms);

private:
    explicit MemoryChannel(Options opts);

    struct Event {
        bool            is_close = false;
        std::vector<u8> wire;
    };

    void deliver(Event ev);
    void run();

    std::string                label_;
    std::optional<Fingerprint> local_fp_;
    std::optional<Fingerprint> remote_fp_;
    std::chrono::steady_clock::time_point fp_ready_at_;

    std::weak_ptr<MemoryChannel> peer_;
    std::atomic<bool>            closing_{false};

    std::mutex              tamper_mutex_;
    Tamper                  tamper_;

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Event>       queue_;
    bool                    busy_{false};
    bool                    stopping_{false};
    std::thread             thread_;
};
