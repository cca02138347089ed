#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "../common/stop_signals.hpp"
#include "test_support.hpp"

namespace {

bool WaitFor(const std::atomic<int>& v, int expected) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (v.load() != expected) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

}  // namespace

int main() {
  test::quiet_logs();

  // The callback runs on the watcher thread, not inside the handler
  {
    std::atomic<int> seen{0};
    std::thread::id where;
    StopSignals signals([&](int sig) {
      where = std::this_thread::get_id();
      seen = sig;
    });
    std::raise(SIGTERM);
    assert(WaitFor(seen, SIGTERM));
    assert(where != std::this_thread::get_id());

    seen = 0;
    std::raise(SIGINT);
    assert(WaitFor(seen, SIGINT));
  }

  // A lock held by the interrupted thread is not a problem: the
  // callback waits for it instead of deadlocking in the handler
  {
    std::mutex m;
    std::atomic<int> seen{0};
    StopSignals signals([&](int sig) {
      std::lock_guard<std::mutex> lk(m);
      seen = sig;
    });
    {
      std::lock_guard<std::mutex> lk(m);
      std::raise(SIGINT);
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      assert(seen.load() == 0);
    }
    assert(WaitFor(seen, SIGINT));
  }

  // Only one instance at a time
  {
    StopSignals first([](int) {});
    bool threw = false;
    try {
      StopSignals second([](int) {});
    } catch (const std::logic_error&) {
      threw = true;
    }
    assert(threw);
  }

  // Reinstalling after the previous one is gone works
  {
    std::atomic<int> seen{0};
    StopSignals again([&](int sig) { seen = sig; });
    std::raise(SIGTERM);
    assert(WaitFor(seen, SIGTERM));
  }

  return 0;
}
