#include "AwsCli.h"

AwsCli::AwsCli(const SyncConfig& config, Environment base)
    : cfg(config),
    env(std::move(base)) {
    env.exportCredentials(cfg.credentials);
}

std::vector<std::string> AwsCli::childEnv() const {
    return env.entries();
}

LaunchOptions AwsCli::listCommand() const {
    LaunchOptions options;
    options.argv = { cfg.awsPath, "s3", "ls", cfg.s3Url, "--recursive", "--page-size", "10" };
    options.env = childEnv();
    options.captureOutput = true;
    return options;
}

LaunchOptions AwsCli::syncCommand() const {
    LaunchOptions options;
    options.argv = { cfg.awsPath, "s3", "sync", cfg.s3Url, ".", "--only-show-errors" };
    options.env = childEnv();
    // Own process group: signals aimed at us stay with us
    options.newProcessGroup = true;
    return options;
}

CommandResult AwsCli::checkCredentials() const {
    return runCommand(listCommand());
}

std::string AwsCli::describeList() const {
    return cfg.awsPath + " s3 ls " + cfg.s3Url;
}
