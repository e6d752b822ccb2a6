#pragma once
#include <string>
#include <vector>
#include <chrono>

constexpr const char* kAccessKeyIdVar = "AWS_ACCESS_KEY_ID";
constexpr const char* kSecretAccessKeyVar = "AWS_SECRET_ACCESS_KEY";
constexpr const char* kSessionTokenVar = "AWS_SESSION_TOKEN";
constexpr const char* kS3UrlVar = "S3_URL";
constexpr const char* kJobIdVar = "SLURM_JOBID";

constexpr std::chrono::milliseconds kPollInterval{ 50 };

struct AwsCredentials {
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string sessionToken;
};

struct SyncConfig {
    AwsCredentials credentials;
    std::string s3Url;
    std::string awsPath;
};

// Static submission metadata, written as #SBATCH lines.
struct SchedulerDirectives {
    std::string timeLimit = "4:00:00";
    unsigned cpusPerTask = 4;
    std::string memPerCpu = "1G";
    std::string signal = "B:SIGUSR1@60";
    std::string mailType = "BEGIN,END,FAIL";
};

struct SubmitOptions {
    std::vector<std::string> sbatchArgs;
    bool showHelp = false;
};

enum class ConfigField {
    None,
    SessionToken,
    SecretAccessKey,
    AccessKeyId,
    S3Url
};

struct CommandResult {
    bool started = false;
    int status = 1;
    std::string output;

    bool ok() const { return started && status == 0; }
};

// First missing field, in the order operators are told about them.
ConfigField firstMissingField(const SyncConfig& config);
const char* fieldName(ConfigField field);
