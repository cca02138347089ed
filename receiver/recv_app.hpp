#pragma once

// ============================================================
// recv_app.hpp -- sascp receiver: connect to a waiting sender
//   (with retry), confirm the SAS, write the payload out.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/key_provider.hpp"
#include "../common/socket.hpp"
#include "../common/transfer_engine.hpp"
#include <atomic>
#include <string>

struct RecvConfig {
    std::string    destination;     // directory, file, "-" or "" (cwd)
    std::string    host;
    u16            port{9999};
    std::string    session_id;
    bool           overwrite{false};
    bool           auto_accept{false};
    int            retry_secs{30};
    TransferConfig transfer;        // tolerate_count_mismatch off with --strict
};

class RecvApp {
public:
    explicit RecvApp(RecvConfig config);
    ~RecvApp();

    // Returns 0 on success; failures throw TransferError
    int run();

    // Any thread; not async-signal-safe (see StopSignals)
    void stop();

private:
    RecvConfig config_;

    OpensslKeyProvider           keys_;
    std::atomic<bool>            stop_{false};
    CancelSlot                   cancel_;

    // Back-off 0.5 s -> 8 s until retry_secs run out; throws
    // NetworkError (gave up) or CancelledError
    TcpSocket connect_with_retry();
};
