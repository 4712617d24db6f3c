// EN: Error taxonomy shared by the pipeline core and the operations its stages delegate to
// FR: Taxonomie d'erreurs partagée par le cœur du pipeline et les opérations déléguées par ses étapes

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace CDP {
namespace Orchestrator {

// EN: Classification of a stage failure or a run warning
// FR: Classification d'un échec d'étape ou d'un avertissement d'exécution
enum class ErrorKind {
    WORK_FAILED = 0,                    // EN: Operation returned failure / FR: L'opération a retourné un échec
    TIMEOUT = 1,                        // EN: Stage exceeded its budget / FR: Étape hors budget de temps
    ABORTED = 2,                        // EN: Cancellation or crash / FR: Annulation ou plantage
    CREDENTIAL_NOT_FOUND = 3,
    BUILD_FAILED = 4,
    PUBLISH_FAILED = 5,
    DEPLOY_FAILED = 6,
    NOTIFICATION_DISPATCH_FAILED = 7    // EN: Never escalates to a run failure / FR: Ne devient jamais un échec d'exécution
};

// EN: Base class of every error raised by pipeline operations
// FR: Classe de base de toutes les erreurs levées par les opérations du pipeline
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class CredentialNotFoundError : public PipelineError {
public:
    explicit CredentialNotFoundError(const std::string& name)
        : PipelineError(ErrorKind::CREDENTIAL_NOT_FOUND, "Credential not found: " + name), name_(name) {}
    
    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class BuildFailedError : public PipelineError {
public:
    explicit BuildFailedError(const std::string& message)
        : PipelineError(ErrorKind::BUILD_FAILED, message) {}
};

// EN: Carries which tags reached the registry before the failure
// FR: Indique quels tags ont atteint le registre avant l'échec
class PublishFailedError : public PipelineError {
public:
    PublishFailedError(const std::string& message,
                       std::vector<std::string> pushed_tags = {},
                       std::vector<std::string> unpushed_tags = {})
        : PipelineError(ErrorKind::PUBLISH_FAILED, message),
          pushed_tags_(std::move(pushed_tags)),
          unpushed_tags_(std::move(unpushed_tags)) {}
    
    const std::vector<std::string>& pushedTags() const { return pushed_tags_; }
    const std::vector<std::string>& unpushedTags() const { return unpushed_tags_; }

private:
    std::vector<std::string> pushed_tags_;
    std::vector<std::string> unpushed_tags_;
};

class DeployFailedError : public PipelineError {
public:
    explicit DeployFailedError(const std::string& message)
        : PipelineError(ErrorKind::DEPLOY_FAILED, message) {}
};

class NotificationDispatchError : public PipelineError {
public:
    explicit NotificationDispatchError(const std::string& message)
        : PipelineError(ErrorKind::NOTIFICATION_DISPATCH_FAILED, message) {}
};

} // namespace Orchestrator
} // namespace CDP
