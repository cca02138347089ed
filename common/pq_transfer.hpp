#pragma once

// ============================================================
// pq_transfer.hpp -- Post-quantum mode: MetaHeader framing around
//                    an opaque authenticated bulk transfer
// ============================================================

#include "stream_transfer.hpp"

// The bulk mover used once the PQ handshake has finished. Both ends
// return the payload bytes they moved and throw TransferError.
class BulkTransfer {
public:
    virtual ~BulkTransfer() = default;

    virtual u64 send_file(const std::shared_ptr<Channel>& channel,
                          const std::string& session_id,
                          ByteSource& source, u64 total_bytes,
                          const ProgressFn& on_progress) = 0;

    virtual u64 recv_file(const std::shared_ptr<Channel>& channel,
                          const std::string& session_id,
                          ByteSink& sink,
                          const ProgressFn& on_progress) = 0;
};

// Default mover: the INIT/DATA/FIN engine with MetaHeader handling off
class FramedBulkTransfer : public BulkTransfer {
public:
    explicit FramedBulkTransfer(const TransferConfig& cfg) : cfg_(cfg) {}

    u64 send_file(const std::shared_ptr<Channel>& channel, const std::string& session_id,
                  ByteSource& source, u64 total_bytes, const ProgressFn& on_progress) override;

    u64 recv_file(const std::shared_ptr<Channel>& channel, const std::string& session_id,
                  ByteSink& sink, const ProgressFn& on_progress) override;

private:
    TransferConfig cfg_;
};

// Serves `prefix` first, then the inner source
class PrefixedSource : public ByteSource {
public:
    PrefixedSource(std::vector<u8> prefix, ByteSource& inner)
        : prefix_(std::move(prefix)), inner_(inner) {}

    size_t read(u8* buf, size_t cap) override;
    std::optional<u64> size() const override;
    std::string name() const override { return inner_.name(); }

private:
    std::vector<u8> prefix_;
    size_t          pos_{0};
    ByteSource&     inner_;
};

// Removes a leading MetaHeader (even when it is split across writes),
// forwards the name, and reports the announced total minus the header.
class MetaStrippingSink : public ByteSink {
public:
    explicit MetaStrippingSink(ByteSink& inner) : inner_(inner) {}

    void info(const SinkInfo& info) override;
    void write(const u8* data, size_t len) override;
    void close() override;
    u64 written() const override { return inner_.written(); }

    u64 stripped_bytes() const { return stripped_; }

private:
    void decide();

    ByteSink&          inner_;
    std::vector<u8>    head_;
    bool               decided_{false};
    std::optional<u64> pending_total_;
    std::atomic<u64>   stripped_{0};
};

class PqTransfer {
public:
    explicit PqTransfer(BulkTransfer& bulk) : bulk_(bulk) {}

    // Returns payload bytes, header excluded
    u64 send(const std::shared_ptr<Channel>& channel, const std::string& session_id,
             ByteSource& source, u64 total_bytes,
             const std::optional<std::string>& meta_name,
             const ProgressFn& progress);

    u64 receive(const std::shared_ptr<Channel>& channel, const std::string& session_id,
                ByteSink& sink, const ProgressFn& progress);

    // Header bytes removed on the receive side
    u64 stripped_bytes() const { return stripped_.load(); }

private:
    BulkTransfer&    bulk_;
    std::atomic<u64> stripped_{0};
};
