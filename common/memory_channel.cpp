// ============================================================
// memory_channel.cpp -- In-process channel pair
// ============================================================

#include "memory_channel.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "protocol_io.hpp"

std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>>
MemoryChannel::create_pair(Options a, Options b) {
    if (a.label.empty()) a.label = "mem-a";
    if (b.label.empty()) b.label = "mem-b";

    std::optional<Fingerprint> a_sees = a.observed_remote ? a.observed_remote : b.local_fingerprint;
    std::optional<Fingerprint> b_sees = b.observed_remote ? b.observed_remote : a.local_fingerprint;

    std::shared_ptr<MemoryChannel> ca(new MemoryChannel(std::move(a)));
    std::shared_ptr<MemoryChannel> cb(new MemoryChannel(std::move(b)));
    ca->remote_fp_ = std::move(a_sees);
    cb->remote_fp_ = std::move(b_sees);
    ca->peer_ = cb;
    cb->peer_ = ca;
    return { ca, cb };
}

MemoryChannel::MemoryChannel(Options opts)
    : label_(std::move(opts.label))
    , local_fp_(std::move(opts.local_fingerprint))
    , fp_ready_at_(std::chrono::steady_clock::now())
{
    thread_ = std::thread([this] { run(); });
}

MemoryChannel::~MemoryChannel() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) thread_.detach();
        else thread_.join();
    }
}

void MemoryChannel::set_fingerprint_delay_ms(int ms) {
    std::lock_guard<std::mutex> lk(mutex_);
    fp_ready_at_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
}

void MemoryChannel::set_tamper(Tamper fn) {
    std::lock_guard<std::mutex> lk(tamper_mutex_);
    tamper_ = std::move(fn);
}

std::optional<Fingerprint> MemoryChannel::local_fingerprint() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (std::chrono::steady_clock::now() < fp_ready_at_) return std::nullopt;
    return local_fp_;
}

std::optional<Fingerprint> MemoryChannel::remote_fingerprint() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (std::chrono::steady_clock::now() < fp_ready_at_) return std::nullopt;
    return remote_fp_;
}

void MemoryChannel::send(const Frame& frame) {
    if (closing_.load()) throw NetworkError(label_ + ": send on closed channel");

    std::vector<u8> wire = proto::encode_frame(frame);
    {
        std::lock_guard<std::mutex> lk(tamper_mutex_);
        if (tamper_ && !tamper_(wire)) return;
    }

    auto peer = peer_.lock();
    if (!peer) throw NetworkError(label_ + ": peer is gone");
    Event ev;
    ev.wire = std::move(wire);
    peer->deliver(std::move(ev));
}

bool MemoryChannel::flush(int timeout_ms) {
    auto peer = peer_.lock();
    if (!peer) return true;
    return peer->wait_idle(timeout_ms);
}

void MemoryChannel::close() {
    if (closing_.exchange(true)) return;
    Event ev;
    ev.is_close = true;
    deliver(ev);
    if (auto peer = peer_.lock()) peer->deliver(std::move(ev));
}

void MemoryChannel::deliver(Event ev) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopping_) return;
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

bool MemoryChannel::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lk(mutex_);
    return idle_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                             [this] { return stopping_ || (queue_.empty() && !busy_); });
}

void MemoryChannel::run() {
    bool closed_delivered = false;
    for (;;) {
        Event ev;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) break;
            ev = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        if (ev.is_close) {
            if (!closed_delivered) {
                closed_delivered = true;
                closing_.store(true);
                dispatch_close();
            }
        } else if (!closed_delivered) {
            try {
                auto frame = proto::decode_frame(ev.wire);
                if (frame) {
                    dispatch_message(*frame);
                } else {
                    LOG_DEBUG(label_ + ": ignoring frame of unknown type");
                }
            } catch (const ProtocolError& e) {
                LOG_ERROR(label_ + ": dropping channel: " + e.what());
                set_close_reason(e.what());
                close();
            } catch (const std::exception& e) {
                LOG_ERROR(label_ + ": message handler failed: " + e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lk(mutex_);
            busy_ = false;
            if (queue_.empty()) idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}
