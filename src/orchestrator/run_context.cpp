#include "orchestrator/run_context.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdlib>

namespace CDP {
namespace Orchestrator {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

} // namespace

RunContext::RunContext(BuildMetadata metadata, CancellationToken token)
    : metadata_(std::move(metadata)), token_(std::move(token)) {}

BuildMetadata RunContext::metadataFromEnvironment(const std::string& project) {
    BuildMetadata metadata;
    metadata.project = project;
    metadata.run_id = envOr("BUILD_NUMBER", "local");
    metadata.branch = envOr("BRANCH_NAME", "local");
    metadata.revision = envOr("GIT_COMMIT", "unknown");
    metadata.build_url = envOr("BUILD_URL", "");
    return metadata;
}

RunContext RunContext::fromEnvironment(const std::string& project) {
    return RunContext(metadataFromEnvironment(project));
}

std::string RunContext::env(const std::string& key, const std::string& default_value) const {
    auto it = environment_.find(key);
    return it != environment_.end() ? it->second : default_value;
}

std::string RunContext::artifact(const std::string& key, const std::string& default_value) const {
    auto it = artifacts_.find(key);
    return it != artifacts_.end() ? it->second : default_value;
}

const Credential& RunContext::resolveCredential(const CredentialStore& store, const std::string& name) {
    auto it = credentials_.find(name);
    if (it != credentials_.end()) {
        return it->second;
    }
    Credential credential = store.resolve(name, &redactor_);
    return credentials_.emplace(name, std::move(credential)).first->second;
}

void RunContext::wipeCredentials() {
    if (!credentials_.empty()) {
        LOG_DEBUG("run_context", "Wiping " + std::to_string(credentials_.size()) + " resolved credential(s)");
    }
    for (auto& [name, credential] : credentials_) {
        for (auto& [field, value] : credential.fields) {
            value.assign(value.size(), '\0');
        }
    }
    credentials_.clear();
}

void RunContext::addWarning(ErrorKind kind, const std::string& source, const std::string& message) {
    const std::string redacted = redactor_.redact(message);
    warnings_.push_back({kind, source, redacted});
    LOG_WARN("run_context", source + ": " + redacted);
}

} // namespace Orchestrator
} // namespace CDP
