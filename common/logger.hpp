#pragma once

// ============================================================
// logger.hpp -- Process-wide logger
//
// Everything goes to stderr: stdout is reserved for payload
// (sascp_recv -) and for the sender's session line.
//
//   text: 2026-01-02 10:11:12.345 sascp_send WARN  message
//   json: {"ts":"2026-01-02T09:11:12.345Z","prog":"sascp_send",
//          "level":"warn","msg":"message"}
// ============================================================

#include "platform.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return lvl >= level_.load(); }

    void set_json(bool on) { json_.store(on); }

    void set_program(const std::string& name) {
        std::lock_guard<std::mutex> lk(mutex_);
        program_ = name;
    }

    void log(LogLevel lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        auto now = std::chrono::system_clock::now();
        std::lock_guard<std::mutex> lk(mutex_);
        if (json_.load()) {
            std::cerr << "{\"ts\":\"" << stamp(now, true) << "\",\"prog\":\"" << program_
                      << "\",\"level\":\"" << lower_name(lvl) << "\",\"msg\":\""
                      << json_escape(msg) << "\"}\n";
        } else {
            std::cerr << stamp(now, false) << ' ' << program_ << ' ' << padded_name(lvl) << ' '
                      << msg << '\n';
        }
        std::cerr.flush();
    }

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR, msg); }

private:
    Logger() = default;

    // Local time for people, UTC for machines
    static std::string stamp(std::chrono::system_clock::time_point tp, bool utc) {
        std::time_t secs = std::chrono::system_clock::to_time_t(tp);
        int millis = (int)(std::chrono::duration_cast<std::chrono::milliseconds>(
                               tp.time_since_epoch()).count() % 1000);
        std::tm parts{};
        if (utc) gmtime_r(&secs, &parts);
        else     localtime_r(&secs, &parts);

        char date[32];
        std::strftime(date, sizeof(date), utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S", &parts);
        char out[48];
        std::snprintf(out, sizeof(out), "%s.%03d%s", date, millis, utc ? "Z" : "");
        return out;
    }

    static const char* padded_name(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?    ";
    }

    static const char* lower_name(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO:  return "info";
            case LogLevel::WARN:  return "warn";
            case LogLevel::ERR:   return "error";
        }
        return "?";
    }

    static std::string json_escape(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (unsigned char c : s) {
            if (c == '"' || c == '\\') {
                out += '\\';
                out += (char)c;
            } else if (c == '\n') {
                out += "\\n";
            } else if (c < 0x20) {
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04x", c);
                out += esc;
            } else {
                out += (char)c;
            }
        }
        return out;
    }

    std::mutex            mutex_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::atomic<bool>     json_{false};
    std::string           program_{"sascp"};
};

#define LOG_DEBUG(msg) Logger::get().debug(msg)
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
