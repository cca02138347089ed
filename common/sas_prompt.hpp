#pragma once

// ============================================================
// sas_prompt.hpp -- Interactive SAS confirmation
// ============================================================

#include "handshake.hpp"

namespace sas_prompt {

// auto_accept: print the SAS and accept (-y).
// Otherwise ask "Does the peer show the same code? [y/N]" on /dev/tty;
// throws InvalidInputError when there is no terminal to ask on.
ConfirmFn make(bool auto_accept);

// Parse a yes/no answer; anything but y/yes (any case) is no
bool is_yes(const std::string& answer);

} // namespace sas_prompt
