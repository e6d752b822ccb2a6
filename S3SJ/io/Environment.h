#pragma once
#include <string>
#include <vector>
#include <utility>

#include "../core/utils.h"

// A private copy of a process environment. Changes never reach our own.
class Environment {
public:
    Environment() = default;
    explicit Environment(const std::vector<std::string>& entries);

    static Environment current();

    std::string get(const std::string& name) const;
    void set(const std::string& name, const std::string& value);

    // "NAME=VALUE" list, ready for execve.
    std::vector<std::string> entries() const;

    // The variables the job phase reads back.
    void exportSyncConfig(const SyncConfig& config);
    void exportCredentials(const AwsCredentials& credentials);

    // Fills everything except awsPath. Returns the first missing field.
    ConfigField loadSyncConfig(SyncConfig& out) const;

private:
    std::vector<std::pair<std::string, std::string>> vars;
};
