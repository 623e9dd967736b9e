#pragma once

#include <signal.h>

namespace platform {

// Blocks SIGINT and SIGTERM in the calling thread, and so in every thread it
// starts afterwards, and returns that set for signalfd(). Call it before any
// library gets a chance to start threads of its own.
sigset_t block_termination_signals();

} // namespace platform
