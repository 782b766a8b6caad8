#pragma once

namespace msh {

// The shell itself ignores SIGINT and SIGQUIT while it waits for input.
void installShellSignals();

// Restore default dispositions in a forked child before exec.
void resetChildSignals();

} // namespace msh
