#pragma once

// ============================================================
// stream_transfer.hpp -- INIT / DATA / FIN streaming
//
//   sender:   INIT{total} [DATA{seq 0, MetaHeader}] DATA... FIN{ok}
//   receiver: ... FIN{ok=true} once every byte reached the sink
//
// Byte accounting: total_bytes never includes the MetaHeader, and
// the receiver counts only what the sink actually accepted.
// ============================================================

#include "byte_stream.hpp"
#include "channel.hpp"
#include "config.hpp"
#include "inbox.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <thread>

using ProgressFn = std::function<void(u64 done, u64 total)>;

// ---- SerialWriter: one worker owns the sink; tasks run in order ----
class SerialWriter {
public:
    SerialWriter(ByteSink& sink, size_t queue_limit);
    ~SerialWriter();

    SerialWriter(const SerialWriter&) = delete;
    SerialWriter& operator=(const SerialWriter&) = delete;

    // Blocks while the queue is full. Rethrows a failure from the worker.
    void info(SinkInfo info);
    void write(std::vector<u8> chunk);
    void close_sink();

    // Wait until every queued task has run; rethrows a worker failure
    void drain();

    // Bytes the sink has accepted
    u64 written() const { return written_.load(); }

private:
    struct Task {
        enum Type { Info, Write, Close } type = Write;
        SinkInfo        info;
        std::vector<u8> data;
    };

    void push(Task t);
    void run();
    void rethrow_locked();

    ByteSink&    sink_;
    size_t       limit_;

    std::mutex              mutex_;
    std::condition_variable cv_;
    std::deque<Task>        tasks_;
    bool                    busy_{false};
    bool                    stop_{false};
    std::exception_ptr      error_;
    std::atomic<u64>        written_{0};
    std::thread             thread_;
};

// ---- StreamSender ----
class StreamSender {
public:
    // Subscribes for the receiver's FIN ack right away, so construct
    // it before anything can provoke that ack.
    StreamSender(std::shared_ptr<Channel> channel, std::string session_id,
                 const TransferConfig& cfg);
    ~StreamSender();

    StreamSender(const StreamSender&) = delete;
    StreamSender& operator=(const StreamSender&) = delete;

    // Streams exactly total_bytes from src. Returns payload bytes sent.
    // Throws InvalidInputError (total 0), SizeMismatchError (short or
    // long source, after FIN{ok=false}), or the source's read error.
    u64 send(ByteSource& src, u64 total_bytes,
             const std::optional<std::string>& meta_name,
             const ProgressFn& progress);

private:
    void abort_stream();
    void wait_ack();

    std::shared_ptr<Channel> channel_;
    std::string              session_id_;
    TransferConfig           cfg_;

    std::shared_ptr<Inbox>   acks_;
    Subscription             msg_sub_;
    Subscription             close_sub_;
};

// ---- StreamReceiver ----
class StreamReceiver {
public:
    // `channel` should be a stream ReplaySafeChannel view created before
    // the handshake started; subscribing here replays what it held.
    // strip_meta: treat a leading "SCM1" DATA payload as the filename.
    StreamReceiver(std::shared_ptr<Channel> channel, std::string session_id,
                   const TransferConfig& cfg, bool strip_meta = true);
    ~StreamReceiver();

    StreamReceiver(const StreamReceiver&) = delete;
    StreamReceiver& operator=(const StreamReceiver&) = delete;

    // Runs until FIN or channel close. Returns bytes written. On success
    // the sink is closed and FIN{ok=true} goes back to the sender.
    u64 receive(ByteSink& sink, const ProgressFn& progress);

    bool init_seen() const { return init_seen_; }
    u64  announced() const { return announced_; }

private:
    void handle_data(DataFrame& d, SerialWriter& writer, const ProgressFn& progress);
    void send_ack();

    std::shared_ptr<Channel> channel_;
    std::string              session_id_;
    TransferConfig           cfg_;
    bool                     strip_meta_;

    std::shared_ptr<Inbox>   inbox_;
    Subscription             msg_sub_;
    Subscription             close_sub_;

    bool init_seen_{false};
    u64  announced_{0};
    u64  next_seq_{0};
    u64  enqueued_{0};
    bool meta_pending_{true};
};
