#include "ArgumentParser.h"
#include <iostream>

bool ArgumentParser::parse(int argc, char* argv[], SubmitOptions& out) {
    out.sbatchArgs.clear();
    out.showHelp = false;

    if (argc == 2) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            out.showHelp = true;
            return true;
        }
    }

    // Everything else belongs to sbatch, e.g. "--partition owners"
    for (int i = 1; i < argc; ++i)
        out.sbatchArgs.emplace_back(argv[i]);

    return true;
}

void ArgumentParser::printUsage(const std::string& program) const {
    std::cout <<
        "Usage:\n"
        "  cd /path/to/where/the/files/should/go\n"
        "  " << program << " [sbatch options]\n\n"
        "Reads a pasted S3 download script on stdin, checks its AWS credentials,\n"
        "and submits itself as a SLURM job that runs `aws s3 sync <URL> .` in the\n"
        "current directory. The job requeues itself if it runs out of time.\n\n"
        "Options:\n"
        "  -h, --help       Show this help\n"
        "  anything else    Passed to sbatch unchanged (e.g. --partition owners)\n";
}
