// EN: Stage runner: worker thread, bounded wait, exception to outcome translation
// FR: Lanceur d'étape : thread de travail, attente bornée, traduction exception vers résultat

#include "orchestrator/stage_runner.hpp"
#include "orchestrator/pipeline_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <future>
#include <thread>

namespace CDP {
namespace Orchestrator {

std::string StageRunner::tail(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    return text.substr(text.size() - max_bytes);
}

StageOutcome StageRunner::execute(const StageDefinition& stage, RunContext& context) const {
    StageOutcome outcome;
    outcome.stage = stage.name;
    outcome.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();
    
    std::unordered_map<std::string, std::string> meta = {{"stage", stage.name}};
    if (stage.timeout) {
        meta["timeout"] = PipelineUtils::formatDuration(*stage.timeout);
    }
    LOG_INFO_META("stage_runner", "Stage started: " + stage.name, meta);
    for (const auto& resource : stage.resources) {
        LOG_DEBUG("stage_runner", stage.name + " acquires " + resource.kind + " " + resource.detail);
    }
    
    StageExecution execution{context, context.cancellationToken().child(), stage.name};
    
    bool timed_out = false;
    WorkResult result;
    std::optional<ErrorKind> thrown_kind;
    std::string thrown_message;
    
    if (!stage.work) {
        thrown_kind = ErrorKind::ABORTED;
        thrown_message = "stage has no work";
    } else {
        std::packaged_task<WorkResult()> task([&stage, &execution]() { return stage.work(execution); });
        std::future<WorkResult> future = task.get_future();
        std::thread worker(std::move(task));
        
        if (stage.timeout && future.wait_for(*stage.timeout) == std::future_status::timeout) {
            timed_out = true;
            LOG_WARN("stage_runner", "Stage " + stage.name + " exceeded " +
                     PipelineUtils::formatDuration(*stage.timeout) + ", cancelling");
            execution.token.cancel();
        }
        // EN: Always join: the work unwinds through its own cleanup before the outcome is recorded.
        // FR: Toujours joindre : le travail se déroule via son propre nettoyage avant l'enregistrement.
        worker.join();
        
        try {
            result = future.get();
        } catch (const PipelineError& e) {
            thrown_kind = e.kind();
            thrown_message = e.what();
        } catch (const std::exception& e) {
            thrown_kind = ErrorKind::ABORTED;
            thrown_message = e.what();
        } catch (...) {
            thrown_kind = ErrorKind::ABORTED;
            thrown_message = "stage threw a non-standard exception";
        }
    }
    
    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    outcome.exit_code = result.status;
    outcome.output = tail(context.redact(result.output));
    
    if (timed_out) {
        outcome.status = StageStatus::FAILED;
        outcome.failure_kind = ErrorKind::TIMEOUT;
        outcome.message = "stage exceeded timeout of " + PipelineUtils::formatDuration(*stage.timeout);
    } else if (context.isCancelled()) {
        // EN: Run cancellation wins over whatever error the work raised while unwinding
        // FR: L'annulation de l'exécution l'emporte sur l'erreur levée par le travail en se déroulant
        outcome.status = StageStatus::FAILED;
        outcome.failure_kind = ErrorKind::ABORTED;
        outcome.message = "run cancelled during stage";
        if (thrown_kind) {
            outcome.message += ": " + thrown_message;
        }
    } else if (thrown_kind) {
        outcome.status = StageStatus::FAILED;
        outcome.failure_kind = *thrown_kind;
        outcome.message = thrown_message;
    } else if (result.status != 0) {
        outcome.status = StageStatus::FAILED;
        outcome.failure_kind = result.failure_kind.value_or(ErrorKind::WORK_FAILED);
        outcome.message = result.message.empty() ? "exit status " + std::to_string(result.status)
                                                 : result.message;
    } else {
        outcome.status = StageStatus::SUCCEEDED;
        outcome.message = result.message;
    }
    outcome.message = context.redact(outcome.message);
    
    context.appendOutcome(outcome);
    
    meta["duration"] = PipelineUtils::formatDuration(outcome.duration);
    meta["status"] = PipelineUtils::stageStatusToString(outcome.status);
    if (outcome.succeeded()) {
        LOG_INFO_META("stage_runner", "Stage succeeded: " + stage.name, meta);
    } else {
        meta["kind"] = PipelineUtils::errorKindToString(*outcome.failure_kind);
        LOG_ERROR_META("stage_runner", "Stage failed: " + stage.name + ": " + outcome.message, meta);
    }
    return outcome;
}

} // namespace Orchestrator
} // namespace CDP
