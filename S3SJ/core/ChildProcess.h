#pragma once
#include <string>
#include <vector>
#include <sys/types.h>

#include "utils.h"

struct LaunchOptions {
    // argv[0] must be an absolute path; no PATH search happens after fork.
    std::vector<std::string> argv;
    // "NAME=VALUE" entries. Empty means inherit ours.
    std::vector<std::string> env;

    bool captureOutput = false;   // stdout and stderr into one pipe
    bool pipeInput = false;       // otherwise stdin is /dev/null
    bool newProcessGroup = false;
};

class ChildProcess {
public:
    ChildProcess() = default;
    // Waits for a child that has not been reaped yet.
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool start(const LaunchOptions& options);

    // Writes everything, then closes the child's stdin.
    bool writeInput(const std::string& data);
    // Reads captured output until the child closes it.
    std::string readOutput();

    // Non-blocking. Returns true once the child has been reaped.
    bool tryWait(int& status);
    int wait();

    pid_t pid() const { return childPid; }
    const std::string& lastError() const { return errorText; }

    // Shell convention: exit code, or 128 + signal number.
    static int normalizeStatus(int waitStatus);

private:
    void closeFd(int& fd);
    void fail(const std::string& what, int err);

private:
    pid_t childPid{ -1 };
    bool reaped{ false };
    int exitStatus{ 1 };
    int inputFd{ -1 };
    int outputFd{ -1 };
    std::string errorText;
};

// Runs a command to completion, feeding `input` when options.pipeInput is set.
CommandResult runCommand(LaunchOptions options, const std::string& input = std::string());
