#pragma once
#include <string>
#include <vector>

#include "utils.h"
#include "../io/Environment.h"

class JobSubmitter {
public:
    JobSubmitter(std::string sbatch, SchedulerDirectives directives);

    // #!/bin/sh, the #SBATCH lines, then exec of selfPath.
    std::string batchScript(const std::string& selfPath) const;

    // sbatch <forwarded args>, script on stdin, env carries the sync config.
    CommandResult submit(const std::vector<std::string>& forwardedArgs,
        const std::string& selfPath,
        const Environment& env) const;

    static std::string shellQuote(const std::string& value);

    // Absolute path of the running executable.
    static bool selfPath(std::string& out);

private:
    std::string sbatchPath;
    SchedulerDirectives dirs;
};
