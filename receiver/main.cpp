// ============================================================
// receiver/main.cpp -- sascp_recv entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/stop_signals.hpp"
#include "../common/utils.hpp"
#include "../common/protocol.hpp"
#include "recv_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [dest|-] --connect IP:PORT --code ID [options]\n"
        << "\n"
        << "  dest            directory to receive into (default: current directory),\n"
        << "                  or a file path for a single-file payload\n"
        << "  -               write the payload to stdout\n"
        << "\nOptions:\n"
        << "  --connect H:P   sender address\n"
        << "  --code ID       session code printed by the sender\n"
        << "  --overwrite     replace existing files (not with stdout)\n"
        << "  -y, --yes       accept the SAS without asking\n"
        << "  --retry N       seconds to retry connecting if the sender is not ready (default: 30)\n"
        << "  --strict        treat any byte-count mismatch as fatal\n"
        << "  -v, --verbose   enable debug logging\n"
        << "  -q, --quiet     errors only\n"
        << "  --json          one JSON object per log line\n"
        << "\nPlain TCP carries no channel fingerprint, so unless the sender uses\n"
        << "--pq the transfer is authenticated by the SAS comparison alone.\n"
        << "\nThe receiver can be started before the sender; it retries with\n"
        << "exponential back-off until the sender is listening.\n"
        << "\nExamples:\n"
        << "  " << prog << " ./inbox --connect 192.168.1.1:9999 --code 4f1c09d2a7b3e680\n"
        << "  " << prog << " - --connect 192.168.1.1:9999 --code 4f1c09d2a7b3e680 > out.bin\n";
}

int main(int argc, char* argv[]) {
    // Broken sockets and a closed stdout pipe surface as EPIPE
    std::signal(SIGPIPE, SIG_IGN);

    Logger::get().set_program("sascp_recv");
    if (config::debug_requested()) Logger::get().set_level(LogLevel::DEBUG);

    RecvConfig cfg;
    bool have_dest = false;
    bool strict = false;
    std::string connect;
    try {
        config::apply_env_overrides(cfg.transfer);

        for (int i = 1; i < argc; ++i) {
            const char* a = argv[i];
            bool has_val = i + 1 < argc;
            if (std::strcmp(a, "--connect") == 0 && has_val) {
                connect = argv[++i];
            } else if (std::strcmp(a, "--code") == 0 && has_val) {
                cfg.session_id = argv[++i];
            } else if (std::strcmp(a, "--overwrite") == 0) {
                cfg.overwrite = true;
            } else if (std::strcmp(a, "-y") == 0 || std::strcmp(a, "--yes") == 0) {
                cfg.auto_accept = true;
            } else if (std::strcmp(a, "--retry") == 0 && has_val) {
                auto secs = utils::parse_u64(argv[++i]);
                if (!secs || *secs > 24 * 3600) throw InvalidInputError("--retry: expected seconds");
                cfg.retry_secs = (int)*secs;
            } else if (std::strcmp(a, "--strict") == 0) {
                strict = true;
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
            } else if (!have_dest) {
                cfg.destination = a;
                have_dest = true;
            } else {
                throw InvalidInputError(std::string("unexpected argument: ") + a);
            }
        }

        if (connect.empty() || cfg.session_id.empty()) {
            print_usage(argv[0]);
            return EXIT_BAD_ARGS;
        }
        auto hp = utils::split_host_port(connect);
        if (!hp) throw InvalidInputError("--connect: expected IP:PORT, got '" + connect + "'");
        cfg.host = hp->first;
        cfg.port = hp->second;

        if (cfg.session_id.size() > MAX_SESSION_LEN) throw InvalidInputError("--code: at most 255 bytes");
        if (cfg.overwrite && cfg.destination == "-") {
            throw InvalidInputError("--overwrite cannot be used with stdout");
        }
        cfg.transfer.tolerate_count_mismatch = !strict;
        config::validate(cfg.transfer);
    } catch (const TransferError& e) {
        LOG_ERROR(e.what());
        return exit_code_for(e);
    }

    try {
        RecvApp app(std::move(cfg));
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
