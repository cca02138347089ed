// ============================================================
// sender/main.cpp -- sascp_send entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/stop_signals.hpp"
#include "../common/utils.hpp"
#include "../common/protocol.hpp"
#include "send_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options] <path>... | -\n"
        << "\n"
        << "  path             file(s) or directories; several paths or a directory\n"
        << "                   are sent as one tar stream\n"
        << "  -                read stdin (requires --size)\n"
        << "\nOptions:\n"
        << "  --port N         TCP port to listen on (default: 9999, 0 = any)\n"
        << "  --bind IP        address to listen on (default: 0.0.0.0)\n"
        << "  --pq             post-quantum handshake profile\n"
        << "                   (without it, plain TCP gives the handshake no channel\n"
        << "                   fingerprint: compare the SAS on both ends)\n"
        << "  -y, --yes        accept the SAS without asking\n"
        << "  --name S         file name announced to the receiver\n"
        << "  --stdin-name S   name for stdin payloads (default: stdin.bin)\n"
        << "  --size N         exact byte count of stdin\n"
        << "  --exclude a,b    glob patterns to leave out of archives\n"
        << "  --session ID     session code (default: random)\n"
        << "  --chunk-kb N     chunk size in KiB (default: 64)\n"
        << "  --no-compress    disable zstd chunk compression\n"
        << "  -v, --verbose    enable debug logging\n"
        << "  -q, --quiet      errors only\n"
        << "  --json           one JSON object per log line\n"
        << "\nExample:\n"
        << "  " << prog << " -y ./photos notes.txt\n"
        << "  tar c dir | " << prog << " --size 10240 --name dir.tar -\n";
}

static u64 parse_number(const char* flag, const char* value) {
    auto v = utils::parse_u64(value);
    if (!v) throw InvalidInputError(std::string(flag) + ": expected a number, got '" + value + "'");
    return *v;
}

int main(int argc, char* argv[]) {
    // Broken sockets surface as EPIPE, not as a signal
    std::signal(SIGPIPE, SIG_IGN);

    Logger::get().set_program("sascp_send");
    if (config::debug_requested()) Logger::get().set_level(LogLevel::DEBUG);

    SendConfig cfg;
    try {
        config::apply_env_overrides(cfg.transfer);

        for (int i = 1; i < argc; ++i) {
            const char* a = argv[i];
            bool has_val = i + 1 < argc;
            if (std::strcmp(a, "--port") == 0 && has_val) {
                u64 port = parse_number(a, argv[++i]);
                if (port > 65535) throw InvalidInputError("--port: out of range");
                cfg.port = (u16)port;
            } else if (std::strcmp(a, "--bind") == 0 && has_val) {
                cfg.bind_ip = argv[++i];
                if (cfg.bind_ip != "0.0.0.0" && !utils::validate_ip(cfg.bind_ip)) {
                    throw InvalidInputError("invalid IP address: " + cfg.bind_ip);
                }
            } else if (std::strcmp(a, "--pq") == 0) {
                cfg.pq = true;
            } else if (std::strcmp(a, "-y") == 0 || std::strcmp(a, "--yes") == 0) {
                cfg.auto_accept = true;
            } else if (std::strcmp(a, "--name") == 0 && has_val) {
                cfg.name = argv[++i];
            } else if (std::strcmp(a, "--stdin-name") == 0 && has_val) {
                cfg.stdin_name = argv[++i];
            } else if (std::strcmp(a, "--size") == 0 && has_val) {
                cfg.size = parse_number(a, argv[++i]);
            } else if (std::strcmp(a, "--exclude") == 0 && has_val) {
                for (auto& p : utils::split_csv(argv[++i])) cfg.excludes.push_back(p);
            } else if (std::strcmp(a, "--session") == 0 && has_val) {
                cfg.session_id = argv[++i];
                if (cfg.session_id.empty() || cfg.session_id.size() > MAX_SESSION_LEN) {
                    throw InvalidInputError("--session: 1-255 bytes");
                }
            } else if (std::strcmp(a, "--chunk-kb") == 0 && has_val) {
                u64 kb = parse_number(a, argv[++i]);
                if (kb == 0 || kb > MAX_CHUNK_SIZE / 1024) throw InvalidInputError("--chunk-kb: out of range");
                cfg.transfer.chunk_size = (u32)kb * 1024u;
            } else if (std::strcmp(a, "--no-compress") == 0) {
                cfg.transfer.compress = false;
            } else if (std::strcmp(a, "-v") == 0 || std::strcmp(a, "--verbose") == 0) {
                Logger::get().set_level(LogLevel::DEBUG);
            } else if (std::strcmp(a, "-q") == 0 || std::strcmp(a, "--quiet") == 0) {
                Logger::get().set_level(LogLevel::ERR);
            } else if (std::strcmp(a, "--json") == 0) {
                Logger::get().set_json(true);
            } else if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
                print_usage(argv[0]);
                return EXIT_OK;
            } else if (a[0] == '-' && a[1] != '\0') {
                std::cerr << "Unknown option: " << a << "\n";
                print_usage(argv[0]);
                return EXIT_BAD_ARGS;
            } else {
                cfg.paths.push_back(a);
            }
        }

        if (cfg.paths.empty()) {
            print_usage(argv[0]);
            return EXIT_BAD_ARGS;
        }
        config::validate(cfg.transfer);
    } catch (const TransferError& e) {
        LOG_ERROR(e.what());
        return exit_code_for(e);
    }

    try {
        SendApp app(std::move(cfg));
        StopSignals signals([&app](int) { app.stop(); });
        return app.run();
    } catch (const TransferError& e) {
        LOG_ERROR(e.what());
        return exit_code_for(e);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return EXIT_GENERIC;
    }
}
