#pragma once

namespace mcp_fleet {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether log output on stderr should be colored.
/// --no-color and NO_COLOR win over --color; otherwise follow the TTY.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace mcp_fleet
