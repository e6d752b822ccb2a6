#include "Signals.h"

volatile std::sig_atomic_t gInterruptRequested = 0;
volatile std::sig_atomic_t gRequeueSignals = 0;

namespace {
void handleInterrupt(int) {
    gInterruptRequested = 1;
}

void handleRequeue(int) {
    gRequeueSignals = gRequeueSignals + 1;
}

bool install(int signo, void (*handler)(int), int flags) {
    struct sigaction action {};
    action.sa_handler = handler;
    action.sa_flags = flags;
    sigemptyset(&action.sa_mask);
    return sigaction(signo, &action, nullptr) == 0;
}
}

bool installInterruptHandler() {
    return install(SIGINT, handleInterrupt, 0);
}

bool installRequeueHandler() {
    return install(SIGUSR1, handleRequeue, SA_RESTART);
}

bool ignoreBrokenPipe() {
    return install(SIGPIPE, SIG_IGN, 0);
}
