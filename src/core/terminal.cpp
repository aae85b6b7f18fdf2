#include <sre_gateway/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace sre_gateway {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace sre_gateway
