// EN: Per-run mutable state: build metadata, environment, resolved credentials, outcome log and warnings
// FR: État mutable d'une exécution : métadonnées de build, environnement, credentials résolus, journal et avertissements

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/system/cancellation.hpp"
#include "orchestrator/credential_store.hpp"
#include "orchestrator/pipeline_errors.hpp"

namespace CDP {
namespace Orchestrator {

// EN: Identity of one run, passed explicitly instead of read from ambient state
// FR: Identité d'une exécution, passée explicitement au lieu d'être lue depuis l'état ambiant
struct BuildMetadata {
    std::string project;                // EN: Project / pipeline name / FR: Nom du projet / pipeline
    std::string run_id = "local";       // EN: Monotonic build number / FR: Numéro de build monotone
    std::string branch = "local";
    std::string revision = "unknown";
    std::string build_url;              // EN: Link to the run in the CI server / FR: Lien vers l'exécution dans le serveur CI
    std::string image_tag;              // EN: Set once the image is built / FR: Renseigné une fois l'image construite
};

// EN: Terminal state of a stage
// FR: État terminal d'une étape
enum class StageStatus {
    SUCCEEDED = 0,
    FAILED = 1,
    SKIPPED = 2
};

// EN: Outcome of one stage, as appended to the run log. Output and message are already redacted.
// FR: Résultat d'une étape, tel qu'ajouté au journal. Sortie et message sont déjà masqués.
struct StageOutcome {
    std::string stage;
    StageStatus status = StageStatus::SKIPPED;
    std::optional<ErrorKind> failure_kind;          // EN: Set only when FAILED / FR: Renseigné uniquement si FAILED
    int exit_code = 0;
    std::string output;                             // EN: Tail of captured output / FR: Fin de la sortie capturée
    std::string message;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point started_at;
    
    bool succeeded() const { return status == StageStatus::SUCCEEDED; }
    bool failed() const { return status == StageStatus::FAILED; }
    bool skipped() const { return status == StageStatus::SKIPPED; }
};

// EN: A non-fatal problem surfaced in the run output
// FR: Un problème non bloquant remonté dans la sortie de l'exécution
struct RunWarning {
    ErrorKind kind;
    std::string source;
    std::string message;
};

// EN: Exclusively owned by one run; stages execute one at a time so no locking is needed.
// FR: Possédé exclusivement par une exécution ; les étapes s'exécutent une à une, sans verrou.
class RunContext {
public:
    explicit RunContext(BuildMetadata metadata, CancellationToken token = CancellationToken());
    
    // EN: Read BUILD_NUMBER, BRANCH_NAME, GIT_COMMIT and BUILD_URL, with local defaults.
    // FR: Lit BUILD_NUMBER, BRANCH_NAME, GIT_COMMIT et BUILD_URL, avec des valeurs locales par défaut.
    static BuildMetadata metadataFromEnvironment(const std::string& project);
    static RunContext fromEnvironment(const std::string& project);
    
    const BuildMetadata& metadata() const { return metadata_; }
    BuildMetadata& metadata() { return metadata_; }
    
    // EN: Environment variables resolved for this run
    // FR: Variables d'environnement résolues pour cette exécution
    void setEnv(const std::string& key, const std::string& value) { environment_[key] = value; }
    std::string env(const std::string& key, const std::string& default_value = "") const;
    const std::map<std::string, std::string>& environment() const { return environment_; }
    
    // EN: Named artifacts produced by stages (image reference, target URL, ...)
    // FR: Artefacts nommés produits par les étapes (référence d'image, URL cible, ...)
    void setArtifact(const std::string& key, const std::string& value) { artifacts_[key] = value; }
    std::string artifact(const std::string& key, const std::string& default_value = "") const;
    
    // EN: Resolve through the store, cache for the run and register the secrets for redaction.
    // FR: Résout via le magasin, met en cache pour l'exécution et enregistre les secrets à masquer.
    const Credential& resolveCredential(const CredentialStore& store, const std::string& name);
    bool hasCredential(const std::string& name) const { return credentials_.count(name) > 0; }
    size_t credentialCount() const { return credentials_.size(); }
    
    // EN: Drop resolved credentials; the redactor keeps masking them.
    // FR: Oublie les credentials résolus ; le redacteur continue de les masquer.
    void wipeCredentials();
    
    SecretRedactor& redactor() { return redactor_; }
    const SecretRedactor& redactor() const { return redactor_; }
    std::string redact(const std::string& text) const { return redactor_.redact(text); }
    
    const CancellationToken& cancellationToken() const { return token_; }
    void requestCancellation() const { token_.cancel(); }
    bool isCancelled() const { return token_.isCancelled(); }
    
    void appendOutcome(const StageOutcome& outcome) { outcomes_.push_back(outcome); }
    const std::vector<StageOutcome>& outcomes() const { return outcomes_; }
    
    void addWarning(ErrorKind kind, const std::string& source, const std::string& message);
    const std::vector<RunWarning>& warnings() const { return warnings_; }

private:
    BuildMetadata metadata_;
    CancellationToken token_;
    std::map<std::string, std::string> environment_;
    std::map<std::string, std::string> artifacts_;
    std::map<std::string, Credential> credentials_;
    SecretRedactor redactor_;
    std::vector<StageOutcome> outcomes_;
    std::vector<RunWarning> warnings_;
};

} // namespace Orchestrator
} // namespace CDP
