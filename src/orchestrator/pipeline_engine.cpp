#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace CDP {
namespace Orchestrator {

Pipeline::Pipeline(std::string name, std::vector<StageDefinition> stages, PostActions post_actions)
    : name_(std::move(name)), stages_(std::move(stages)), post_actions_(std::move(post_actions)) {
    std::set<std::string> seen;
    for (const auto& stage : stages_) {
        if (stage.name.empty()) {
            throw std::invalid_argument("Pipeline '" + name_ + "' has a stage without a name");
        }
        if (!seen.insert(stage.name).second) {
            throw std::invalid_argument("Pipeline '" + name_ + "' has duplicate stage '" + stage.name + "'");
        }
    }
}

const StageOutcome* RunOutcome::failedStage() const {
    auto it = std::find_if(stages.begin(), stages.end(),
                           [](const StageOutcome& s) { return s.failed(); });
    return it != stages.end() ? &*it : nullptr;
}

size_t RunOutcome::countStatus(StageStatus status) const {
    return static_cast<size_t>(std::count_if(stages.begin(), stages.end(),
                                             [status](const StageOutcome& s) { return s.status == status; }));
}

// EN: Internal implementation
// FR: Implémentation interne
class PipelineOrchestrator::PipelineOrchestratorImpl {
public:
    RunOutcome run(const Pipeline& pipeline, RunContext& context) {
        auto& logger = Logger::getInstance();
        logger.setCorrelationId(context.metadata().run_id);
        
        RunOutcome outcome;
        outcome.pipeline = pipeline.name();
        outcome.run_id = context.metadata().run_id;
        const auto start = std::chrono::steady_clock::now();
        
        LOG_INFO_META("orchestrator", "Run started: " + pipeline.name(),
                      (std::unordered_map<std::string, std::string>{
                          {"run_id", context.metadata().run_id},
                          {"branch", context.metadata().branch},
                          {"revision", context.metadata().revision},
                          {"stages", std::to_string(pipeline.size())}}));
        emit(PipelineEventType::RUN_STARTED, "", pipeline.name());
        
        const auto& stages = pipeline.stages();
        bool halted = false;
        for (size_t i = 0; i < stages.size(); ++i) {
            const auto& stage = stages[i];
            
            if (!halted && context.isCancelled()) {
                LOG_WARN("orchestrator", "Run cancelled before stage " + stage.name);
                outcome.cancelled = true;
                halted = true;
            }
            if (halted) {
                outcome.stages.push_back(skip(stage, context));
                continue;
            }
            
            emit(PipelineEventType::STAGE_STARTED, stage.name, stage.description);
            StageOutcome stage_outcome = runner_.execute(stage, context);
            outcome.stages.push_back(stage_outcome);
            
            if (stage_outcome.succeeded()) {
                emit(PipelineEventType::STAGE_COMPLETED, stage.name, stage_outcome.message);
                continue;
            }
            emit(PipelineEventType::STAGE_FAILED, stage.name, stage_outcome.message);
            if (stage_outcome.failure_kind == ErrorKind::ABORTED && context.isCancelled()) {
                outcome.cancelled = true;
            }
            halted = true;
        }
        
        outcome.success = !halted;
        
        // EN: Exactly one terminal hook, then always; a hook failure never masks the outcome.
        // FR: Exactement un hook terminal, puis always ; un échec de hook ne masque jamais le résultat.
        const auto& post = pipeline.postActions();
        runHook(outcome.success ? post.on_success : post.on_failure, context, outcome);
        runHook(post.always, context, outcome);
        
        outcome.warnings = context.warnings();
        outcome.total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        
        const std::string verdict = outcome.success ? "SUCCESS" : (outcome.cancelled ? "CANCELLED" : "FAILURE");
        std::unordered_map<std::string, std::string> meta = {
            {"run_id", outcome.run_id},
            {"result", verdict},
            {"duration", PipelineUtils::formatDuration(outcome.total_duration)},
            {"warnings", std::to_string(outcome.warnings.size())}};
        if (outcome.success) {
            LOG_INFO_META("orchestrator", "Run completed: " + pipeline.name(), meta);
        } else {
            LOG_ERROR_META("orchestrator", "Run completed: " + pipeline.name(), meta);
        }
        emit(PipelineEventType::RUN_COMPLETED, "", verdict);
        return outcome;
    }
    
    void setEventCallback(PipelineEventCallback callback) {
        event_callback_ = std::move(callback);
    }

private:
    StageOutcome skip(const StageDefinition& stage, RunContext& context) {
        StageOutcome skipped;
        skipped.stage = stage.name;
        skipped.status = StageStatus::SKIPPED;
        skipped.started_at = std::chrono::system_clock::now();
        context.appendOutcome(skipped);
        LOG_INFO("orchestrator", "Stage skipped: " + stage.name);
        emit(PipelineEventType::STAGE_SKIPPED, stage.name, "");
        return skipped;
    }
    
    void runHook(const Hook& hook, RunContext& context, RunOutcome& outcome) {
        outcome.hooks_run.push_back(hook.name);
        if (!hook.action) {
            return;
        }
        LOG_DEBUG("orchestrator", "Running hook " + hook.name);
        try {
            hook.action(context, outcome);
        } catch (const std::exception& e) {
            recordHookError(hook.name + ": " + context.redact(e.what()), outcome);
        } catch (...) {
            recordHookError(hook.name + ": non-standard exception", outcome);
        }
    }
    
    void recordHookError(const std::string& message, RunOutcome& outcome) {
        outcome.hook_errors.push_back(message);
        LOG_ERROR("orchestrator", "Hook failed: " + message);
        emit(PipelineEventType::HOOK_FAILED, "", message);
    }
    
    void emit(PipelineEventType type, const std::string& stage, const std::string& message) {
        if (!event_callback_) {
            return;
        }
        PipelineEvent event{type, stage, message, std::chrono::system_clock::now()};
        try {
            event_callback_(event);
        } catch (const std::exception& e) {
            LOG_WARN("orchestrator", std::string("Event callback failed: ") + e.what());
        } catch (...) {
            LOG_WARN("orchestrator", "Event callback failed with a non-standard exception");
        }
    }
    
    StageRunner runner_;
    PipelineEventCallback event_callback_;
};

PipelineOrchestrator::PipelineOrchestrator() : impl_(std::make_unique<PipelineOrchestratorImpl>()) {}

PipelineOrchestrator::~PipelineOrchestrator() = default;

RunOutcome PipelineOrchestrator::run(const Pipeline& pipeline, RunContext& context) {
    return impl_->run(pipeline, context);
}

void PipelineOrchestrator::setEventCallback(PipelineEventCallback callback) {
    impl_->setEventCallback(std::move(callback));
}

} // namespace Orchestrator
} // namespace CDP
