#include "SyncJobController.h"

#include "JobSubmitter.h"
#include "RequeueRequester.h"
#include "Signals.h"
#include "TransferRunner.h"
#include "../cli/InputParser.h"
#include "../net/AwsCli.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace {
std::string chomp(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
        text.pop_back();
    return text;
}
}

SyncJobController::SyncJobController(Logger& logger, ToolLocator locator, Environment environment)
    : log(logger),
    tools(std::move(locator)),
    env(std::move(environment)) {
}

bool SyncJobController::inJob(const Environment& environment) {
    return !environment.get(kJobIdVar).empty();
}

bool SyncJobController::locate(const char* name, std::string& out) {
    if (tools.find(name, out)) {
        log.log(std::string("Using `") + name + "` at " + out);
        return true;
    }

    log.error(std::string("Could not find `") + name + "`!");
    if (std::string(name) == "aws")
        log.error("You may have to install the AWS CLI, or modify your PATH.");
    else
        log.error("This has to run on a SLURM cluster, with the SLURM commands in your PATH.");
    log.error(std::string("Please do what is needed to make the `") + name + "` command available, and try again.");
    return false;
}

void SyncJobController::reportMissing(ConfigField field, bool fromJobEnvironment) {
    if (field == ConfigField::S3Url && !fromJobEnvironment) {
        log.error("ERROR!  The \"aws s3 sync\" command was not found.");
        log.error("Maybe your \"aws s3 sync\" lines were commented out?");
        log.error("Please check your input, and try again.");
        return;
    }

    const std::string name = fieldName(field);
    if (fromJobEnvironment) {
        log.error("ERROR!  The " + name + " variable was not found in the job environment.");
        log.error("Please run this program outside of a job, so it can submit itself.");
        return;
    }

    log.error("ERROR!  The " + name + " variable was not found.");
    log.error("Maybe your \"export " + name + "\" lines were commented out?");
    log.error("Please check your input, and try again.");
}

void SyncJobController::greet() {
    std::string where = workDir;
    if (where.empty()) {
        std::error_code ec;
        where = fs::current_path(ec).string();
    }

    log.log("Hello!");
    log.log("");
    log.log("This program will place all download files in " + where);
    log.log("If that is the wrong place, then press Control-C to exit, `cd` to the correct place, and run this program again!");
    log.log("");
    log.log("Please paste the download script (the .sh file) now.");
    log.log("You can paste the entire file.");
    log.log("When done, send an EOF.");
    log.log("(Press Return (or Enter) once, and then press Control-D.)");
    log.log("To exit, press Control-C.");
    log.log("Waiting for input...");
    log.flush();
}

int SyncJobController::runInteractive(std::istream& in,
    const SubmitOptions& options,
    volatile std::sig_atomic_t* interrupt) {
    SyncConfig config;
    std::string sbatchPath;

    // Missing tools are fatal before any input is read
    if (!locate("aws", config.awsPath) || !locate("sbatch", sbatchPath))
        return 1;

    if (self.empty() && !JobSubmitter::selfPath(self)) {
        log.error("Could not work out where this program lives (/proc/self/exe).");
        return 1;
    }

    greet();

    InputParser parser(interrupt);
    const ParseResult parsed = parser.parse(in, config);

    switch (parsed.status) {
    case ParseStatus::Interrupted:
        log.log("Goodbye!");
        return 0;
    case ParseStatus::ReadError:
        log.error("Sorry, reading the input failed unexpectedly.");
        return 1;
    case ParseStatus::Incomplete:
        log.log("EOF received!");
        reportMissing(parsed.missing, false);
        return 1;
    case ParseStatus::Complete:
        log.log("EOF received!");
        break;
    }

    log.log("Checking AWS credentials...");
    log.flush();

    AwsCli aws(config, env);
    const CommandResult check = aws.checkCredentials();
    if (interrupt && *interrupt) {
        // Control-C also hit the listing; its failure is not a credential problem
        log.log("Goodbye!");
        return 0;
    }
    if (!check.ok()) {
        log.error("ERROR!  Our attempt to call `" + aws.describeList() + "` failed.");
        log.error("There is probably a problem with your credentials.");
        log.error("Here is the output we received from the command:");
        log.error(chomp(check.output));
        return 1;
    }

    log.log("Everything looks good!");
    log.log("Submitting ourselves as a SLURM job...");
    log.log("(You should get mail when the job starts, and completes or fails.)");
    log.flush();

    Environment jobEnv = env;
    jobEnv.exportSyncConfig(config);

    JobSubmitter submitter(sbatchPath, dirs);
    const CommandResult submitted = submitter.submit(options.sbatchArgs, self, jobEnv);
    if (interrupt && *interrupt) {
        log.log("Goodbye!");
        return 0;
    }

    const std::string sbatchOutput = chomp(submitted.output);
    if (!sbatchOutput.empty()) {
        if (submitted.ok())
            log.log(sbatchOutput);
        else
            log.error(sbatchOutput);
    }

    if (!submitted.started) {
        log.error("Could not run sbatch.");
        return 1;
    }
    if (submitted.status != 0)
        log.error("sbatch exited with status " + std::to_string(submitted.status));

    return submitted.status;
}

int SyncJobController::runJob() {
    // Installed first, so an early warning during setup is not lost and does
    // not kill the job
    const std::sig_atomic_t baseline = gRequeueSignals;
    if (!installRequeueHandler()) {
        log.error("Could not install the SIGUSR1 handler; the job will not requeue itself.");
        return 1;
    }

    SyncConfig config;
    std::string scontrolPath;

    if (!locate("aws", config.awsPath) || !locate("scontrol", scontrolPath))
        return 1;

    const ConfigField missing = env.loadSyncConfig(config);
    if (missing != ConfigField::None) {
        reportMissing(missing, true);
        return 1;
    }

    const std::string jobId = env.get(kJobIdVar);

    log.log("Job " + jobId + ": syncing " + config.s3Url);

    AwsCli aws(config, env);
    RequeueRequester requester(scontrolPath, jobId, log);

    TransferRunner runner(aws.syncCommand(), &gRequeueSignals,
        [&requester]() { requester.request(); },
        log);
    runner.countSignalsSince(baseline);
    runner.setPollCallback([&requester]() { requester.reap(); });

    const int status = runner.run();

    requester.reap(true);
    log.flush();
    return status;
}
