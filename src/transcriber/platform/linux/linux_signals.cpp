#include "platform/platform_signals.hpp"

namespace platform {

sigset_t block_termination_signals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    return mask;
}

} // namespace platform
