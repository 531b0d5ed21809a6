#pragma once

namespace mcp_agents {

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if stderr is a terminal. Diagnostics go to stderr only,
/// so this is the one stream whose color support matters.
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve whether diagnostics should be colored: --no-color and NO_COLOR
/// win over --color, which wins over TTY detection.
bool ResolveColor(bool force_color, bool force_no_color);

} // namespace mcp_agents
