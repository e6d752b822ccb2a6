#include "TransferRunner.h"
#include "utils.h"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <thread>

TransferRunner::TransferRunner(LaunchOptions transfer,
    volatile std::sig_atomic_t* requeueSignals,
    RequeueCallback onRequeue,
    Logger& logger)
    : command(std::move(transfer)),
    signalCount(requeueSignals),
    requeue(std::move(onRequeue)),
    log(logger) {
    if (signalCount)
        handledSignals = *signalCount;
}

void TransferRunner::serviceRequeue() {
    if (!signalCount)
        return;

    // One request per delivery, never more
    const std::sig_atomic_t seen = *signalCount;
    while (handledSignals != seen) {
        ++handledSignals;
        ++requeueCount;
        if (requeue)
            requeue();
    }
}

int TransferRunner::run() {
    log.flush();

    ChildProcess child;
    if (!child.start(command)) {
        log.error("Could not start the transfer: " + child.lastError());
        return 1;
    }

    const auto startTime = std::chrono::steady_clock::now();

    int status = 1;
    for (;;) {
        serviceRequeue();

        if (onPoll)
            onPoll();

        if (child.tryWait(status))
            break;

        std::this_thread::sleep_for(kPollInterval);
    }

    // A signal may have landed between the last check and the exit
    serviceRequeue();

    const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - startTime;

    std::ostringstream conclusion;
    conclusion << "Transfer "
        << (status == 0 ? "completed" : "failed")
        << " in " << std::fixed << std::setprecision(1) << duration.count() << "s"
        << ", exit status " << status
        << ", requeue requests " << requeueCount;
    if (!child.lastError().empty())
        conclusion << " (" << child.lastError() << ")";

    if (status == 0)
        log.log(conclusion.str());
    else
        log.error(conclusion.str());

    return status;
}
