#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ChildProcess.h"
#include "../monitor/Logger.h"

// Fire-and-forget `scontrol requeue <jobid>`. Never retried.
class RequeueRequester {
public:
    RequeueRequester(std::string scontrol, std::string jobId, Logger& logger);

    // Starts one request and returns without waiting for it.
    void request();

    // Collects finished requests; with block set, waits for all of them.
    void reap(bool block = false);

private:
    void report(const ChildProcess& child, int status);

private:
    std::string scontrolPath;
    std::string job;
    Logger& log;
    std::vector<std::unique_ptr<ChildProcess>> inFlight;
};
