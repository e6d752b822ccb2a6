#pragma once
#include <csignal>
#include <istream>
#include <string>

#include "utils.h"
#include "ToolLocator.h"
#include "../io/Environment.h"
#include "../monitor/Logger.h"

// Drives one invocation: the interactive phase outside a job, the
// transfer phase inside one. Both return the process exit status.
class SyncJobController {
public:
    SyncJobController(Logger& logger, ToolLocator locator, Environment environment);

    static bool inJob(const Environment& environment);

    int runInteractive(std::istream& in,
        const SubmitOptions& options,
        volatile std::sig_atomic_t* interrupt);

    int runJob();

    void setDirectives(const SchedulerDirectives& directives) { dirs = directives; }
    // Defaults to /proc/self/exe.
    void setSelfPath(const std::string& path) { self = path; }
    void setWorkingDirectory(const std::string& path) { workDir = path; }

private:
    bool locate(const char* name, std::string& out);
    void reportMissing(ConfigField field, bool fromJobEnvironment);
    void greet();

private:
    Logger& log;
    ToolLocator tools;
    Environment env;
    SchedulerDirectives dirs;
    std::string self;
    std::string workDir;
};
