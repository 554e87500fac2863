#pragma once

namespace aion_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Colored logs only when stderr is a TTY and NO_COLOR is unset.
bool UseColorForLogs();

} // namespace aion_mcp
