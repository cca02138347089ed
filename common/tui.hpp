#pragma once

// ============================================================
// tui.hpp -- Transfer progress line on stderr
//
// The line only appears once the SAS has been confirmed: the
// first update() starts the refresh thread. finish() prints the
// summary line, also when stderr is not a terminal.
// ============================================================

#include "platform.hpp"
#include <string>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>

class ProgressLine {
public:
    // label: "Sent" / "Recv"
    explicit ProgressLine(std::string label, std::string name = {});
    ~ProgressLine();

    ProgressLine(const ProgressLine&) = delete;
    ProgressLine& operator=(const ProgressLine&) = delete;

    // Safe from any thread; matches the ProgressFn signature
    void update(u64 done, u64 total);

    void set_name(const std::string& name);

    // Stop refreshing and print the summary (idempotent)
    void finish();

    static bool stderr_is_tty();

private:
    using Clock = std::chrono::steady_clock;

    std::string label_;
    std::string name_;
    std::mutex  mu_;
    std::condition_variable cv_;
    std::thread ticker_;
    bool started_{false};
    bool finished_{false};

    std::atomic<u64> done_{0};
    std::atomic<u64> total_{0};

    // Rate estimate, ticker thread only
    u64 sample_bytes_{0};
    Clock::time_point sample_time_;
    Clock::time_point begin_;
    double rate_{0.0};

    void tick();
    std::string bar(double pct) const;
};
