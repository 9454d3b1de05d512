#include <toolmux/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace toolmux {

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

bool IsStderrTty() {
    return IsTerminal(STDERR_FILENO);
}

bool IsStdoutTty() {
    return IsTerminal(STDOUT_FILENO);
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace toolmux
