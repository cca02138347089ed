#pragma once

// ============================================================
// inbox.hpp -- Frame queue between a channel thread and the
//              protocol thread that consumes it
// ============================================================

#include "frame.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

class Inbox {
public:
    enum class PopResult { Ok, Timeout, Closed };

    // limit == 0: unbounded. Otherwise push() blocks while full, which
    // stalls the channel reader and pushes back on the peer.
    explicit Inbox(size_t limit = 0) : limit_(limit) {}

    Inbox(const Inbox&) = delete;
    Inbox& operator=(const Inbox&) = delete;

    // Returns false (frame dropped) once closed
    bool push(Frame frame) {
        std::unique_lock<std::mutex> lk(mutex_);
        if (limit_ > 0) {
            not_full_.wait(lk, [this] { return closed_ || queue_.size() < limit_; });
        }
        if (closed_) return false;
        queue_.push_back(std::move(frame));
        not_empty_.notify_one();
        return true;
    }

    // Frames already queued stay poppable; Closed is reported after them.
    void close() {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    PopResult pop(Frame& out, int timeout_ms) {
        std::unique_lock<std::mutex> lk(mutex_);
        bool ready = not_empty_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                                         [this] { return closed_ || !queue_.empty(); });
        if (!queue_.empty()) {
            out = std::move(queue_.front());
            queue_.pop_front();
            not_full_.notify_one();
            return PopResult::Ok;
        }
        return ready ? PopResult::Closed : PopResult::Timeout;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<Frame>       queue_;
    size_t                  limit_;
    bool                    closed_{false};
};
