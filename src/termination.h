#pragma once

#include <atomic>

namespace graft {

// Install platform-specific termination handling (SIGINT/SIGTERM on POSIX,
// SetConsoleCtrlHandler on Windows). The first signal sets the cancellation flag so
// running analyses stop between projects; a second one exits immediately.
void termination_handler_install();

// Cancellation flag set by the first termination signal.
std::atomic<bool> const *termination_flag();

}  // namespace graft
