#pragma once

// ============================================================
// stop_signals.hpp -- SIGINT / SIGTERM without work in the handler
//
// The handler only writes the signal number into a self-pipe.
// A watcher thread reads it and runs the callback, which may
// then take locks and close channels like any other thread.
// One instance per process.
// ============================================================

#include "platform.hpp"
#include <functional>
#include <thread>

class StopSignals {
public:
    explicit StopSignals(std::function<void(int)> on_signal);
    ~StopSignals();

    StopSignals(const StopSignals&) = delete;
    StopSignals& operator=(const StopSignals&) = delete;

private:
    void watch();

    std::function<void(int)> on_signal_;
    int                      pipe_[2]{-1, -1};
    std::thread              watcher_;
};
