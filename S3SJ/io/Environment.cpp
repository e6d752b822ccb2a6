#include "Environment.h"

extern char** environ;

Environment::Environment(const std::vector<std::string>& entries) {
    for (const auto& entry : entries) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0)
            continue;
        set(entry.substr(0, eq), entry.substr(eq + 1));
    }
}

Environment Environment::current() {
    std::vector<std::string> entries;
    for (char** e = environ; e && *e; ++e)
        entries.emplace_back(*e);
    return Environment(entries);
}

std::string Environment::get(const std::string& name) const {
    for (const auto& var : vars) {
        if (var.first == name)
            return var.second;
    }
    return "";
}

void Environment::set(const std::string& name, const std::string& value) {
    for (auto& var : vars) {
        if (var.first == name) {
            var.second = value;
            return;
        }
    }
    vars.emplace_back(name, value);
}

std::vector<std::string> Environment::entries() const {
    std::vector<std::string> out;
    out.reserve(vars.size());
    for (const auto& var : vars)
        out.push_back(var.first + "=" + var.second);
    return out;
}

void Environment::exportCredentials(const AwsCredentials& credentials) {
    set(kAccessKeyIdVar, credentials.accessKeyId);
    set(kSecretAccessKeyVar, credentials.secretAccessKey);
    set(kSessionTokenVar, credentials.sessionToken);
}

void Environment::exportSyncConfig(const SyncConfig& config) {
    exportCredentials(config.credentials);
    set(kS3UrlVar, config.s3Url);
}

ConfigField Environment::loadSyncConfig(SyncConfig& out) const {
    out.credentials.accessKeyId = get(kAccessKeyIdVar);
    out.credentials.secretAccessKey = get(kSecretAccessKeyVar);
    out.credentials.sessionToken = get(kSessionTokenVar);
    out.s3Url = get(kS3UrlVar);
    return firstMissingField(out);
}
