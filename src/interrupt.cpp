#include "interrupt.hpp"
#include <signal.h>

volatile std::sig_atomic_t gShutdownFlag = 0;

namespace {

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

} // namespace

void installInterruptHandlers() {
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}
