#pragma once

// ============================================================
// channel.hpp -- Ordered bidirectional frame channel
//
// Implementations deliver inbound frames on their own I/O thread,
// in arrival order. Handlers must not block for long; protocol code
// hands frames to an Inbox and consumes them on its own thread.
// ============================================================

#include "frame.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Channel-binding identity (e.g. a DTLS certificate digest)
struct Fingerprint {
    std::string     algorithm;
    std::vector<u8> bytes;

    bool operator==(const Fingerprint& o) const {
        return algorithm == o.algorithm && bytes == o.bytes;
    }
    bool operator!=(const Fingerprint& o) const { return !(*this == o); }
};

using MessageHandler = std::function<void(const Frame&)>;
using CloseHandler   = std::function<void()>;

// RAII registration handle; reset() or destruction unregisters.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& o) noexcept : cancel_(std::move(o.cancel_)) {
        o.cancel_ = nullptr;
    }
    Subscription& operator=(Subscription&& o) noexcept {
        if (this != &o) {
            reset();
            cancel_ = std::move(o.cancel_);
            o.cancel_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (cancel_) {
            auto c = std::move(cancel_);
            cancel_ = nullptr;
            c();
        }
    }

    bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

// Thread-safe handler registry. invoke() calls a snapshot outside the
// lock, so a handler removed concurrently may still see one last call.
template<typename... Args>
class HandlerList : public std::enable_shared_from_this<HandlerList<Args...>> {
public:
    using Fn = std::function<void(Args...)>;

    Subscription add(Fn fn) {
        u64 id;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            id = next_id_++;
            handlers_.emplace(id, std::move(fn));
        }
        std::weak_ptr<HandlerList> weak = this->shared_from_this();
        return Subscription([weak, id] {
            if (auto self = weak.lock()) self->remove(id);
        });
    }

    void invoke(Args... args) {
        std::vector<Fn> snapshot;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            snapshot.reserve(handlers_.size());
            for (auto& kv : handlers_) snapshot.push_back(kv.second);
        }
        for (auto& fn : snapshot) fn(args...);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return handlers_.size();
    }

private:
    void remove(u64 id) {
        std::lock_guard<std::mutex> lk(mutex_);
        handlers_.erase(id);
    }

    mutable std::mutex mutex_;
    std::map<u64, Fn>  handlers_;
    u64                next_id_{1};
};

class Channel {
public:
    virtual ~Channel() = default;

    // Queue a frame for the peer. Throws NetworkError once closed.
    virtual void send(const Frame& frame) = 0;

    virtual Subscription on_message(MessageHandler handler) = 0;

    // Fires once. Registering on an already-closed channel fires at once.
    virtual Subscription on_close(CloseHandler handler) = 0;

    // Wait until queued outbound frames have left this endpoint.
    // Returns false on timeout.
    virtual bool flush(int timeout_ms) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual std::optional<Fingerprint> local_fingerprint() const = 0;
    virtual std::optional<Fingerprint> remote_fingerprint() const = 0;

    // Non-empty when the channel dropped because of a fault (bad frame,
    // socket error) rather than an orderly close.
    virtual std::string close_reason() const = 0;

    virtual std::string label() const = 0;
};

// Handler bookkeeping and close-once semantics shared by transports.
class ChannelBase : public Channel {
public:
    Subscription on_message(MessageHandler handler) override {
        return message_handlers_->add(std::move(handler));
    }

    Subscription on_close(CloseHandler handler) override {
        {
            std::lock_guard<std::mutex> lk(close_mutex_);
            if (!closed_fired_) return close_handlers_->add(std::move(handler));
        }
        handler();
        return Subscription();
    }

    std::string close_reason() const override {
        std::lock_guard<std::mutex> lk(close_mutex_);
        return close_reason_;
    }

protected:
    void dispatch_message(const Frame& frame) {
        message_handlers_->invoke(frame);
    }

    // Runs close handlers exactly once
    void dispatch_close(const std::string& reason = std::string()) {
        {
            std::lock_guard<std::mutex> lk(close_mutex_);
            if (closed_fired_) return;
            closed_fired_ = true;
            if (close_reason_.empty()) close_reason_ = reason;
        }
        close_handlers_->invoke();
    }

    void set_close_reason(const std::string& reason) {
        std::lock_guard<std::mutex> lk(close_mutex_);
        if (close_reason_.empty()) close_reason_ = reason;
    }

private:
    std::shared_ptr<HandlerList<const Frame&>> message_handlers_ =
        std::make_shared<HandlerList<const Frame&>>();
    std::shared_ptr<HandlerList<>> close_handlers_ = std::make_shared<HandlerList<>>();

    mutable std::mutex close_mutex_;
    bool               closed_fired_{false};
    std::string        close_reason_;
};
