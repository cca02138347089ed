// ============================================================
// sas_prompt.cpp -- Interactive SAS confirmation
// ============================================================

#include "sas_prompt.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cctype>
#include <cstdio>

bool sas_prompt::is_yes(const std::string& answer) {
    std::string a;
    for (char c : answer) {
        if (std::isspace((unsigned char)c)) continue;
        a += (char)std::tolower((unsigned char)c);
    }
    return a == "y" || a == "yes";
}

ConfirmFn sas_prompt::make(bool auto_accept) {
    return [auto_accept](const std::string& sas) -> bool {
        if (auto_accept) {
            LOG_INFO("SAS " + sas + " (auto-accepted)");
            return true;
        }

        // stdin/stdout may carry payload, so talk to the terminal directly
        FILE* tty = std::fopen("/dev/tty", "r+");
        if (!tty) {
            throw InvalidInputError("no terminal to confirm the SAS on; pass -y to accept "
                                    "after comparing the code out of band");
        }
        std::fprintf(tty, "\n  Verification code: %s\n  Does the peer show the same code? [y/N] ",
                     sas.c_str());
        std::fflush(tty);

        char line[64] = {0};
        bool got = std::fgets(line, sizeof(line), tty) != nullptr;
        std::fclose(tty);
        return got && is_yes(line);
    };
}
