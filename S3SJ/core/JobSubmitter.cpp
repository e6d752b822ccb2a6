#include "JobSubmitter.h"
#include "ChildProcess.h"

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

JobSubmitter::JobSubmitter(std::string sbatch, SchedulerDirectives directives)
    : sbatchPath(std::move(sbatch)),
    dirs(std::move(directives)) {
}

std::string JobSubmitter::shellQuote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

std::string JobSubmitter::batchScript(const std::string& selfPath) const {
    std::ostringstream os;
    os << "#!/bin/sh\n"
        << "#SBATCH --time=" << dirs.timeLimit << "\n"
        << "#SBATCH --cpus-per-task=" << dirs.cpusPerTask << "\n"
        << "#SBATCH --mem-per-cpu=" << dirs.memPerCpu << "\n"
        << "#SBATCH --signal=" << dirs.signal << "\n"
        << "#SBATCH --mail-type=" << dirs.mailType << "\n"
        // exec, so the batch-shell signal lands on us
        << "exec " << shellQuote(selfPath) << "\n";
    return os.str();
}

CommandResult JobSubmitter::submit(const std::vector<std::string>& forwardedArgs,
    const std::string& selfPath,
    const Environment& env) const {
    LaunchOptions options;
    options.argv.push_back(sbatchPath);
    options.argv.insert(options.argv.end(), forwardedArgs.begin(), forwardedArgs.end());
    options.env = env.entries();
    options.pipeInput = true;

    return runCommand(options, batchScript(selfPath));
}

bool JobSubmitter::selfPath(std::string& out) {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec || self.empty())
        return false;

    out = self.string();
    return true;
}
