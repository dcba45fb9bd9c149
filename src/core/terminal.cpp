#include <reso_client/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace reso_client {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool IsStdoutTty() {
    return isatty(STDOUT_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

// explicit_choice: 1 = --color, 0 = --no-color, -1 = auto.
bool ShouldUseColor(int explicit_choice, bool is_tty) {
    if (explicit_choice == 1) return true;
    if (explicit_choice == 0) return false;
    return is_tty && !NoColorEnvSet();
}

} // namespace reso_client
