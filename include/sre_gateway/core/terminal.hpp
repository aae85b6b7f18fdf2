#pragma once

namespace sre_gateway {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
/// Read once by main while the logger is being set up.
bool NoColorEnvSet();

} // namespace sre_gateway
