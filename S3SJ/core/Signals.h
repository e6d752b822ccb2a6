#pragma once
#include <csignal>

// Set by SIGINT. Reads are not restarted, so a blocked read returns.
extern volatile std::sig_atomic_t gInterruptRequested;

// Number of early-warning (SIGUSR1) deliveries so far.
extern volatile std::sig_atomic_t gRequeueSignals;

bool installInterruptHandler();
bool installRequeueHandler();
bool ignoreBrokenPipe();
