// ============================================================
// tui.cpp -- ProgressLine
// ============================================================

#include "tui.hpp"
#include "utils.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace {
constexpr int  BAR_WIDTH  = 28;
constexpr auto REFRESH    = std::chrono::milliseconds(250);
constexpr size_t NAME_MAX_SHOWN = 32;
} // namespace

bool ProgressLine::stderr_is_tty() {
    return platform::fd_is_tty(STDERR_FILENO);
}

ProgressLine::ProgressLine(std::string label, std::string name)
    : label_(std::move(label)), name_(std::move(name)) {}

ProgressLine::~ProgressLine() {
    finish();
}

void ProgressLine::set_name(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    name_ = name;
}

void ProgressLine::update(u64 done, u64 total) {
    done_.store(done);
    total_.store(total);

    std::lock_guard<std::mutex> lk(mu_);
    if (started_ || finished_) return;
    started_ = true;
    begin_ = sample_time_ = Clock::now();
    if (!stderr_is_tty()) return;
    ticker_ = std::thread([this] {
        std::unique_lock<std::mutex> lk(mu_);
        while (!finished_) {
            lk.unlock();
            tick();
            lk.lock();
            cv_.wait_for(lk, REFRESH, [this] { return finished_; });
        }
    });
}

void ProgressLine::finish() {
    bool had_started;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (finished_) return;
        finished_ = true;
        had_started = started_;
    }
    cv_.notify_all();
    if (ticker_.joinable()) ticker_.join();
    if (!had_started) return;

    u64 done = done_.load();
    double secs = std::chrono::duration<double>(Clock::now() - begin_).count();
    std::ostringstream line;
    line << "  " << label_ << " " << utils::format_bytes(done)
         << " in " << utils::format_duration_s((u64)secs)
         << ", avg " << utils::format_speed(secs > 0 ? (double)done / secs : 0.0);
    if (stderr_is_tty()) std::cerr << "\r\x1b[2K";
    std::cerr << line.str() << std::endl;
}

std::string ProgressLine::bar(double pct) const {
    int filled = utils::clamp((int)(pct * BAR_WIDTH / 100.0), 0, BAR_WIDTH);
    std::string s(1, '[');
    s.append((size_t)filled, '#');
    s.append((size_t)(BAR_WIDTH - filled), '.');
    s += ']';
    return s;
}

void ProgressLine::tick() {
    auto now   = Clock::now();
    u64  done  = done_.load();
    u64  total = total_.load();

    double dt = std::chrono::duration<double>(now - sample_time_).count();
    if (dt >= 0.1) {
        double inst = (double)(done - sample_bytes_) / dt;
        rate_ = sample_bytes_ == 0 ? inst : 0.75 * rate_ + 0.25 * inst;
        sample_bytes_ = done;
        sample_time_  = now;
    }

    double pct = total ? utils::clamp((double)done * 100.0 / (double)total, 0.0, 100.0) : 0.0;

    std::string name;
    {
        std::lock_guard<std::mutex> lk(mu_);
        name = name_;
    }
    if (name.size() > NAME_MAX_SHOWN) name = "..." + name.substr(name.size() - (NAME_MAX_SHOWN - 3));

    std::ostringstream line;
    line << label_ << " " << bar(pct) << " "
         << std::fixed << std::setprecision(1) << std::setw(5) << pct << "% "
         << utils::format_bytes(done) << "/" << utils::format_bytes(total)
         << "  " << utils::format_speed(rate_);
    if (rate_ > 0 && done < total) {
        line << "  eta " << utils::format_duration_s((u64)((double)(total - done) / rate_));
    }
    if (!name.empty()) line << "  " << name;

    std::cerr << "\r\x1b[2K" << line.str() << std::flush;
}
