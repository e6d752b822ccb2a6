#include <iostream>
#include <string>
#include "cli/ArgumentParser.h"
#include "core/Signals.h"
#include "core/SyncJobController.h"
#include "monitor/Logger.h"

int main(int argc, char* argv[]) {
    SubmitOptions options;
    ArgumentParser parser;

    if (!parser.parse(argc, argv, options))
        return 1;

    if (options.showHelp) {
        parser.printUsage(argc > 0 ? argv[0] : "s3sj");
        return 0;
    }

    Environment env = Environment::current();
    const bool inJob = SyncJobController::inJob(env);

    // Control-C while waiting for the paste means "goodbye", not a crash
    if (!ignoreBrokenPipe() || (!inJob && !installInterruptHandler())) {
        std::cerr << "Unable to install signal handlers" << std::endl;
        return 1;
    }

    Logger logger;
    logger.start();

    SyncJobController controller(logger, ToolLocator(), env);

    int status = 0;
    if (inJob)
        status = controller.runJob();
    else
        status = controller.runInteractive(std::cin, options, &gInterruptRequested);

    logger.stop();
    return status;
}
