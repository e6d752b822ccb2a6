#include "../core/ChildProcess.h"
#include "../core/Signals.h"
#include "../core/JobSubmitter.h"
#include "../core/ToolLocator.h"
#include "../io/Environment.h"
#include "../net/AwsCli.h"
#include "TestUtils.h"

#include <cerrno>
#include <csignal>
#include <sys/wait.h>

using namespace s3sj_test;

namespace {

SyncConfig sampleConfig(const std::string& awsPath) {
    SyncConfig config;
    config.credentials.accessKeyId = "AKIAEXAMPLE";
    config.credentials.secretAccessKey = "secret";
    config.credentials.sessionToken = "token";
    config.s3Url = "s3://bucket/run";
    config.awsPath = awsPath;
    return config;
}

void testChildStatus() {
    TempDir tmp;
    LaunchOptions ok;
    ok.argv = { tmp.script("ok", "exit 0") };
    check(runCommand(ok).ok(), "exit 0 is ok");

    LaunchOptions seven;
    seven.argv = { tmp.script("seven", "echo out; echo err >&2; exit 7") };
    CommandResult r = runCommand(seven);
    check(r.started, "started");
    check(r.status == 7, "exit status 7 kept");
    check(contains(r.output, "out") && contains(r.output, "err"), "stdout and stderr captured together");

    LaunchOptions killed;
    killed.argv = { tmp.script("killed", "kill -TERM $$") };
    check(runCommand(killed).status == 128 + SIGTERM, "signalled child maps to 128+signal");

    LaunchOptions missing;
    missing.argv = { tmp.file("does-not-exist") };
    r = runCommand(missing);
    check(r.status == 127, "execve failure exits 127");
}

void testDroppedChildIsReaped() {
    TempDir tmp;
    LaunchOptions options;
    options.argv = { tmp.script("slow", "sleep 0.3\nexit 5") };

    pid_t pid = -1;
    {
        ChildProcess child;
        check(child.start(options), "slow child started");
        pid = child.pid();
    }

    int status = 0;
    errno = 0;
    check(waitpid(pid, &status, WNOHANG) == -1 && errno == ECHILD,
        "no zombie left once the child object is gone");
}

void testChildInputAndEnv() {
    TempDir tmp;
    LaunchOptions options;
    options.argv = { tmp.script("cat", "cat; echo \"[$GREETING]\"") };
    options.env = { "GREETING=hello", "PATH=/bin:/usr/bin" };
    options.pipeInput = true;

    CommandResult r = runCommand(options, "line one\n");
    check(r.ok(), "piped command ok");
    check(contains(r.output, "line one"), "stdin delivered");
    check(contains(r.output, "[hello]"), "explicit environment used");

    LaunchOptions quiet;
    quiet.argv = { tmp.script("stdin", "cat") };
    r = runCommand(quiet);
    check(r.ok() && r.output.empty(), "stdin is /dev/null when not piped");
}

void testToolLocator() {
    TempDir tmp;
    const std::string tool = tmp.script("fake-aws", "exit 0");
    const std::string plain = tmp.file("not-executable");
    {
        std::ofstream out(plain);
        out << "data\n";
    }

    ToolLocator locator("/nonexistent:" + tmp.path());
    std::string found;
    check(locator.find("fake-aws", found), "finds tool on PATH");
    check(found == tool, "absolute path returned");
    check(!locator.find("not-executable", found), "skips non-executable files");
    check(!locator.find("no-such-tool", found), "reports missing tool");
    check(locator.find(tool, found) && found == tool, "explicit path accepted");

    ToolLocator empty("");
    check(!empty.find("fake-aws", found), "empty PATH finds nothing");
}

void testEnvironment() {
    Environment env({ "HOME=/home/op", "AWS_SESSION_TOKEN=old", "BROKEN", "=x" });
    check(env.get("HOME") == "/home/op", "value read back");
    check(env.get("BROKEN").empty(), "entries without '=' dropped");

    SyncConfig config = sampleConfig("/usr/bin/aws");
    env.exportSyncConfig(config);
    check(env.get("AWS_SESSION_TOKEN") == "token", "credential overrides old value");
    check(env.get("S3_URL") == "s3://bucket/run", "url exported");

    int tokenEntries = 0;
    for (const auto& e : env.entries()) {
        if (e.rfind("AWS_SESSION_TOKEN=", 0) == 0)
            ++tokenEntries;
    }
    check(tokenEntries == 1, "no duplicate entries");

    SyncConfig loaded;
    check(env.loadSyncConfig(loaded) == ConfigField::None, "complete config loads");
    check(loaded.credentials.accessKeyId == "AKIAEXAMPLE" && loaded.s3Url == "s3://bucket/run",
        "loaded values match");

    Environment partial({ "AWS_ACCESS_KEY_ID=a", "AWS_SECRET_ACCESS_KEY=b", "AWS_SESSION_TOKEN=c" });
    check(partial.loadSyncConfig(loaded) == ConfigField::S3Url, "missing url reported");
}

void testCredentialCheck() {
    TempDir tmp;

    // Records its arguments and the credentials it saw
    const std::string good = tmp.script("aws-good",
        "echo \"$@\" > '" + tmp.file("args") + "'\n"
        "echo \"$AWS_ACCESS_KEY_ID $AWS_SECRET_ACCESS_KEY $AWS_SESSION_TOKEN\" > '" + tmp.file("creds") + "'\n"
        "exit 0");
    SyncConfig config = sampleConfig(good);
    AwsCli aws(config, Environment({ "PATH=/bin:/usr/bin" }));

    CommandResult r = aws.checkCredentials();
    check(r.ok(), "listing succeeds");
    check(contains(readFile(tmp.file("args")), "s3 ls s3://bucket/run --recursive --page-size 10"),
        "listing arguments");
    check(contains(readFile(tmp.file("creds")), "AKIAEXAMPLE secret token"), "credentials in child env");

    const std::string bad = tmp.script("aws-bad",
        "echo 'An error occurred (ExpiredToken) when calling the ListObjectsV2 operation' >&2\n"
        "exit 255");
    SyncConfig badConfig = sampleConfig(bad);
    AwsCli denied(badConfig, Environment({ "PATH=/bin:/usr/bin" }));
    r = denied.checkCredentials();
    check(!r.ok(), "failing listing is reported");
    check(r.status == 255, "listing status kept");
    check(contains(r.output, "ExpiredToken"), "raw output kept");
    check(denied.describeList() == bad + " s3 ls s3://bucket/run", "command description");

    LaunchOptions sync = aws.syncCommand();
    check(sync.argv.size() == 6 && sync.argv[2] == "sync" && sync.argv[4] == "." &&
        sync.argv[5] == "--only-show-errors", "sync arguments");
    check(sync.newProcessGroup && !sync.captureOutput, "sync runs detached with inherited output");
}

void testBatchScript() {
    JobSubmitter submitter("/usr/bin/sbatch", SchedulerDirectives());
    const std::string script = submitter.batchScript("/opt/tools/s3sj");

    check(script.rfind("#!/bin/sh\n", 0) == 0, "shebang first");
    check(contains(script, "#SBATCH --time=4:00:00\n"), "time limit");
    check(contains(script, "#SBATCH --cpus-per-task=4\n"), "cpus");
    check(contains(script, "#SBATCH --mem-per-cpu=1G\n"), "memory");
    check(contains(script, "#SBATCH --signal=B:SIGUSR1@60\n"), "early-warning signal");
    check(contains(script, "#SBATCH --mail-type=BEGIN,END,FAIL\n"), "mail");
    check(contains(script, "\nexec '/opt/tools/s3sj'\n"), "exec of self");
    check(script.find("#SBATCH") < script.find("exec"), "directives before the command");

    check(JobSubmitter::shellQuote("it's here") == "'it'\\''s here'", "single quote escaped");

    std::string self;
    check(JobSubmitter::selfPath(self) && !self.empty() && self[0] == '/', "self path is absolute");
}

void testSubmit() {
    TempDir tmp;
    const std::string sbatch = tmp.script("sbatch",
        "cat > '" + tmp.file("script") + "'\n"
        "echo \"$@\" > '" + tmp.file("args") + "'\n"
        "echo \"$S3_URL $AWS_SESSION_TOKEN\" > '" + tmp.file("env") + "'\n"
        "echo 'Submitted batch job 4242'");

    Environment env({ "PATH=/bin:/usr/bin" });
    env.exportSyncConfig(sampleConfig("/usr/bin/aws"));

    JobSubmitter submitter(sbatch, SchedulerDirectives());
    CommandResult r = submitter.submit({ "--partition", "owners" }, "/opt/tools/s3sj", env);
    check(r.ok(), "submission ok");
    check(contains(r.output, "Submitted batch job 4242"), "sbatch output captured");
    check(readFile(tmp.file("args")) == "--partition owners\n", "caller args forwarded");
    check(readFile(tmp.file("script")) == submitter.batchScript("/opt/tools/s3sj"), "script on stdin");
    check(readFile(tmp.file("env")) == "s3://bucket/run token\n", "sync config in sbatch env");

    const std::string failing = tmp.script("sbatch-fail",
        "cat > /dev/null\n"
        "echo 'sbatch: error: invalid partition specified: nope' >&2\n"
        "exit 1");
    JobSubmitter rejected(failing, SchedulerDirectives());
    r = rejected.submit({ "--partition", "nope" }, "/opt/tools/s3sj", env);
    check(r.started && r.status == 1, "sbatch status propagated");
    check(contains(r.output, "invalid partition"), "sbatch error captured");
}

} // namespace

int main() {
    ignoreBrokenPipe();

    testChildStatus();
    testDroppedChildIsReaped();
    testChildInputAndEnv();
    testToolLocator();
    testEnvironment();
    testCredentialCheck();
    testBatchScript();
    testSubmit();
    return finish();
}
