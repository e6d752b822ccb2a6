#include "utils.h"

ConfigField firstMissingField(const SyncConfig& config) {
    if (config.credentials.sessionToken.empty())
        return ConfigField::SessionToken;
    if (config.credentials.secretAccessKey.empty())
        return ConfigField::SecretAccessKey;
    if (config.credentials.accessKeyId.empty())
        return ConfigField::AccessKeyId;
    if (config.s3Url.empty())
        return ConfigField::S3Url;
    return ConfigField::None;
}

const char* fieldName(ConfigField field) {
    switch (field) {
    case ConfigField::SessionToken:
        return kSessionTokenVar;
    case ConfigField::SecretAccessKey:
        return kSecretAccessKeyVar;
    case ConfigField::AccessKeyId:
        return kAccessKeyIdVar;
    case ConfigField::S3Url:
        return kS3UrlVar;
    case ConfigField::None:
        break;
    }
    return "";
}
