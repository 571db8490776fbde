#include "system/signals.hpp"

#include <csignal>
#include <unistd.h>

namespace ovaup {

std::atomic_bool g_cancel{false};

namespace {

void HandleSignal(int sig) {
    // Second interrupt: exit without saving the session.
    if (g_cancel.exchange(true, std::memory_order_relaxed)) {
        ::_exit(128 + sig);
    }
}

} // namespace

void InstallSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    struct sigaction ign {};
    ign.sa_handler = SIG_IGN;
    sigemptyset(&ign.sa_mask);
    sigaction(SIGPIPE, &ign, nullptr);
}

} // namespace ovaup
