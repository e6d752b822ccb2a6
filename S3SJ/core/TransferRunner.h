#pragma once
#include <csignal>
#include <cstddef>
#include <functional>

#include "ChildProcess.h"
#include "../monitor/Logger.h"

// Supervises the transfer child. States: running, requeue-requested.
// The two overlap: a requeue may be requested any number of times while
// the child keeps running.
class TransferRunner {
public:
    using RequeueCallback = std::function<void()>;
    using PollCallback = std::function<void()>;

    TransferRunner(LaunchOptions transfer,
        volatile std::sig_atomic_t* requeueSignals,
        RequeueCallback onRequeue,
        Logger& logger);

    // Deliveries after this count are requeue requests. Defaults to the
    // count seen at construction.
    void countSignalsSince(std::sig_atomic_t baseline) { handledSignals = baseline; }

    // Called once per poll, e.g. to reap requeue requests.
    void setPollCallback(PollCallback cb) { onPoll = std::move(cb); }

    // Blocks until the child exits. Returns its normalized status.
    int run();

    std::size_t requeueRequests() const { return requeueCount; }

private:
    void serviceRequeue();

private:
    LaunchOptions command;
    volatile std::sig_atomic_t* signalCount{ nullptr };
    std::sig_atomic_t handledSignals{ 0 };
    RequeueCallback requeue;
    PollCallback onPoll;
    Logger& log;
    std::size_t requeueCount{ 0 };
};
