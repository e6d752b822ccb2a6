#pragma once
#include <string>

#include "../core/utils.h"
#include "../core/ChildProcess.h"
#include "../io/Environment.h"

// Builds and runs the `aws s3` commands for one SyncConfig.
class AwsCli {
public:
    AwsCli(const SyncConfig& config, Environment base);

    // aws s3 ls <URL> --recursive --page-size 10, output captured
    LaunchOptions listCommand() const;
    // aws s3 sync <URL> . --only-show-errors, output inherited
    LaunchOptions syncCommand() const;

    // Read-only listing used to validate credentials and URL.
    CommandResult checkCredentials() const;

    std::string describeList() const;

private:
    std::vector<std::string> childEnv() const;

private:
    const SyncConfig& cfg;
    Environment env;
};
