#pragma once

namespace rdf_sync {

/// True if stderr is a terminal (colored log output).
bool IsStderrTty();

/// True if stdout is a terminal (colored report tables).
bool IsStdoutTty();

/// True if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve the effective color mode from --color / --no-color and a TTY check.
bool ResolveColor(bool force_color, bool force_no_color, bool is_tty);

} // namespace rdf_sync
