#pragma once

// ============================================================
// send_app.hpp -- sascp sender: listen, wait for one receiver,
//   confirm the SAS, stream the payload, exit.
//
// Payload selection:
//   "-"                 stdin, length from --size
//   one non-empty file  the file itself
//   anything else       a tar stream built on the fly
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/key_provider.hpp"
#include "../common/socket.hpp"
#include "../common/transfer_engine.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct SendConfig {
    std::vector<std::string> paths;
    std::string              bind_ip{"0.0.0.0"};
    u16                      port{9999};
    bool                     pq{false};
    bool                     auto_accept{false};
    std::string              name;                     // --name override
    std::string              stdin_name{"stdin.bin"};
    std::optional<u64>       size;                     // --size, stdin only
    std::vector<std::string> excludes;
    std::string              session_id;               // generated when empty
    TransferConfig           transfer;
};

class SendApp {
public:
    explicit SendApp(SendConfig config);
    ~SendApp();

    // Blocks until the transfer finished. Returns 0; failures throw
    // TransferError.
    int run();

    // Any thread; not async-signal-safe (see StopSignals)
    void stop();

    const std::string& session_id() const { return config_.session_id; }

private:
    SendConfig config_;

    std::unique_ptr<ByteSource> source_;
    u64                         total_{0};
    std::optional<std::string>  meta_name_;

    OpensslKeyProvider           keys_;
    TcpSocket                    listen_sock_;
    std::atomic<bool>            stop_{false};
    CancelSlot                   cancel_;

    // Pick the ByteSource and its MetaHeader name
    void prepare();

    // Poll accept() so stop() is noticed; throws CancelledError
    TcpSocket accept_peer();
};
