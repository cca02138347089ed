// ============================================================
// stop_signals.cpp -- Self-pipe signal forwarding
// ============================================================

#include "stop_signals.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>

namespace {

// Write end of the active pipe, -1 when none
volatile std::sig_atomic_t g_signal_fd = -1;

// Byte 0 asks the watcher to exit
constexpr unsigned char WAKE_EXIT = 0;

extern "C" void forward_signal(int sig) {
    int saved = errno;
    int fd = g_signal_fd;
    if (fd >= 0) {
        unsigned char b = (unsigned char)sig;
        ssize_t n = ::write(fd, &b, 1);
        (void)n;   // pipe full: a stop is already pending
    }
    errno = saved;
}

} // namespace

StopSignals::StopSignals(std::function<void(int)> on_signal)
    : on_signal_(std::move(on_signal))
{
    if (g_signal_fd >= 0) throw std::logic_error("StopSignals already installed");
    if (::pipe(pipe_) != 0) {
        throw IoError(std::string("pipe() failed: ") + std::strerror(errno));
    }
    for (int fd : pipe_) ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    ::fcntl(pipe_[1], F_SETFL, ::fcntl(pipe_[1], F_GETFL) | O_NONBLOCK);

    watcher_ = std::thread([this] { watch(); });
    g_signal_fd = pipe_[1];
    std::signal(SIGINT,  forward_signal);
    std::signal(SIGTERM, forward_signal);
}

StopSignals::~StopSignals() {
    std::signal(SIGINT,  SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_fd = -1;

    unsigned char b = WAKE_EXIT;
    while (::write(pipe_[1], &b, 1) < 0 && errno == EINTR) {}
    if (watcher_.joinable()) watcher_.join();
    ::close(pipe_[0]);
    ::close(pipe_[1]);
}

void StopSignals::watch() {
    for (;;) {
        unsigned char b = 0;
        ssize_t n = ::read(pipe_[0], &b, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0 || b == WAKE_EXIT) return;

        LOG_WARN(std::string("caught ") + (b == SIGINT ? "SIGINT" : "SIGTERM") + ", stopping");
        try {
            on_signal_(b);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("stop handler failed: ") + e.what());
        }
    }
}
