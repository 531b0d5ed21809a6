#include <mcp_agents/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcp_agents {

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

bool IsStderrTty() {
    return IsTerminal(STDERR_FILENO);
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveColor(bool force_color, bool force_no_color) {
    if (force_no_color || NoColorEnvSet()) {
        return false;
    }
    return force_color || IsStderrTty();
}

} // namespace mcp_agents
