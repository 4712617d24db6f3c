// EN: Pipeline definition and sequential orchestrator with outcome-selected post-run hooks
// FR: Définition de pipeline et orchestrateur séquentiel avec hooks post-exécution choisis selon le résultat

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "orchestrator/run_context.hpp"
#include "orchestrator/stage_runner.hpp"

namespace CDP {
namespace Orchestrator {

struct RunOutcome;

// EN: Post-run action. An empty action is a no-op but still counts as run.
// FR: Action post-exécution. Une action vide ne fait rien mais compte comme exécutée.
struct Hook {
    std::string name;
    std::function<void(RunContext&, const RunOutcome&)> action;
};

// EN: Exactly one of on_success / on_failure runs, then always
// FR: Exactement un de on_success / on_failure s'exécute, puis always
struct PostActions {
    Hook on_success{"success", nullptr};
    Hook on_failure{"failure", nullptr};
    Hook always{"always", nullptr};
};

// EN: Ordered, immutable list of stages plus post actions
// FR: Liste ordonnée et immuable d'étapes plus les actions post-exécution
class Pipeline {
public:
    // EN: Throws std::invalid_argument on an empty or duplicate stage name.
    // FR: Lève std::invalid_argument pour un nom d'étape vide ou dupliqué.
    Pipeline(std::string name, std::vector<StageDefinition> stages, PostActions post_actions = {});
    
    const std::string& name() const { return name_; }
    const std::vector<StageDefinition>& stages() const { return stages_; }
    const PostActions& postActions() const { return post_actions_; }
    size_t size() const { return stages_.size(); }

private:
    std::string name_;
    std::vector<StageDefinition> stages_;
    PostActions post_actions_;
};

// EN: Result of one pipeline run
// FR: Résultat d'une exécution de pipeline
struct RunOutcome {
    std::string pipeline;
    std::string run_id;
    bool success = false;
    bool cancelled = false;
    std::vector<StageOutcome> stages;               // EN: One entry per stage, in order / FR: Une entrée par étape, dans l'ordre
    std::chrono::milliseconds total_duration{0};
    std::vector<std::string> hooks_run;             // EN: Hook names in execution order / FR: Noms des hooks dans l'ordre d'exécution
    std::vector<std::string> hook_errors;
    std::vector<RunWarning> warnings;
    
    int exitCode() const { return success ? 0 : 1; }
    
    // EN: First failed stage, nullptr on success
    // FR: Première étape en échec, nullptr en cas de succès
    const StageOutcome* failedStage() const;
    
    size_t countStatus(StageStatus status) const;
};

enum class PipelineEventType {
    RUN_STARTED,
    STAGE_STARTED,
    STAGE_COMPLETED,
    STAGE_FAILED,
    STAGE_SKIPPED,
    HOOK_FAILED,
    RUN_COMPLETED
};

struct PipelineEvent {
    PipelineEventType type;
    std::string stage;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

using PipelineEventCallback = std::function<void(const PipelineEvent&)>;

// EN: Interprets a Pipeline against a RunContext
// FR: Interprète un Pipeline sur un RunContext
class PipelineOrchestrator {
public:
    PipelineOrchestrator();
    ~PipelineOrchestrator();
    
    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;
    
    // EN: Runs stages in order, fail-fast, then one terminal hook and the always hook.
    //     Never throws for stage or hook errors.
    // FR: Exécute les étapes dans l'ordre, arrêt au premier échec, puis un hook terminal et le hook always.
    //     Ne lève jamais pour une erreur d'étape ou de hook.
    RunOutcome run(const Pipeline& pipeline, RunContext& context);
    
    void setEventCallback(PipelineEventCallback callback);

private:
    class PipelineOrchestratorImpl;
    std::unique_ptr<PipelineOrchestratorImpl> impl_;
};

} // namespace Orchestrator
} // namespace CDP
