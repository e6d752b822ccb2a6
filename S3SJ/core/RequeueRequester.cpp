#include "RequeueRequester.h"

RequeueRequester::RequeueRequester(std::string scontrol, std::string jobId, Logger& logger)
    : scontrolPath(std::move(scontrol)),
    job(std::move(jobId)),
    log(logger) {
}

void RequeueRequester::request() {
    log.log("Time is nearly up; asking SLURM to requeue job " + job);
    log.flush();

    LaunchOptions options;
    options.argv = { scontrolPath, "requeue", job };

    auto child = std::make_unique<ChildProcess>();
    if (!child->start(options)) {
        log.error("Could not run scontrol requeue: " + child->lastError());
        return;
    }

    inFlight.push_back(std::move(child));
}

void RequeueRequester::reap(bool block) {
    for (auto it = inFlight.begin(); it != inFlight.end();) {
        int status = 0;
        bool done = false;

        if (block) {
            status = (*it)->wait();
            done = true;
        }
        else {
            done = (*it)->tryWait(status);
        }

        if (done) {
            report(**it, status);
            it = inFlight.erase(it);
        }
        else {
            ++it;
        }
    }
}

void RequeueRequester::report(const ChildProcess& child, int status) {
    if (status == 0) {
        log.log("Requeue of job " + job + " accepted");
        return;
    }

    std::string msg = "Requeue request for job " + job + " failed with status " + std::to_string(status);
    if (!child.lastError().empty())
        msg += ": " + child.lastError();
    log.error(msg);
}
