#pragma once

namespace archive_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether log output on stderr should be colored.
bool UseColorForStderr();

} // namespace archive_mcp
