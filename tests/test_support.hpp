#pragma once

// ============================================================
// test_support.hpp -- Scratch directories and payload helpers
// ============================================================

#include "../common/logger.hpp"
#include "../common/platform.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

#include <unistd.h>

namespace test {

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on scope exit
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("sascp-" + tag + "-" + std::to_string(::getpid()) + "-" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline std::vector<u8> pattern(size_t n, u32 seed = 0x5A5Cu) {
    std::mt19937 rng(seed);
    std::vector<u8> out(n);
    for (auto& b : out) b = (u8)(rng() & 0xFF);
    return out;
}

inline std::vector<u8> text_bytes(const std::string& s) {
    return std::vector<u8>(s.begin(), s.end());
}

inline void write_file(const fs::path& p, const std::vector<u8>& data) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
}

inline void write_file(const fs::path& p, const std::string& data) {
    write_file(p, text_bytes(data));
}

inline std::vector<u8> read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::vector<u8>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

inline std::string read_text(const fs::path& p) {
    auto v = read_file(p);
    return std::string(v.begin(), v.end());
}

// Keep test output to failures unless SASCP_DEBUG is set
inline void quiet_logs() {
    const char* v = std::getenv("SASCP_DEBUG");
    Logger::get().set_level(v && *v && std::string(v) != "0" ? LogLevel::DEBUG : LogLevel::ERR);
}

} // namespace test
