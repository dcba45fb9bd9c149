#pragma once

namespace reso_client {

/// Returns true if stderr is a terminal (colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (colored tables and errors).
bool IsStdoutTty();

/// Returns true if NO_COLOR is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve the color decision: an explicit --color/--no-color wins,
/// otherwise color only on a TTY without NO_COLOR.
bool ShouldUseColor(int explicit_choice, bool is_tty);

} // namespace reso_client
