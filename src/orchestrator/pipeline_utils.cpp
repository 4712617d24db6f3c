#include "orchestrator/pipeline_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace CDP {
namespace Orchestrator {

std::string PipelineUtils::stageStatusToString(StageStatus status) {
    switch (status) {
        case StageStatus::SUCCEEDED: return "SUCCEEDED";
        case StageStatus::FAILED: return "FAILED";
        case StageStatus::SKIPPED: return "SKIPPED";
        default: return "UNKNOWN";
    }
}

std::string PipelineUtils::errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::WORK_FAILED: return "WorkFailed";
        case ErrorKind::TIMEOUT: return "Timeout";
        case ErrorKind::ABORTED: return "Aborted";
        case ErrorKind::CREDENTIAL_NOT_FOUND: return "CredentialNotFound";
        case ErrorKind::BUILD_FAILED: return "BuildFailed";
        case ErrorKind::PUBLISH_FAILED: return "PublishFailed";
        case ErrorKind::DEPLOY_FAILED: return "DeployFailed";
        case ErrorKind::NOTIFICATION_DISPATCH_FAILED: return "NotificationDispatchFailed";
        default: return "Unknown";
    }
}

std::string PipelineUtils::eventTypeToString(PipelineEventType type) {
    switch (type) {
        case PipelineEventType::RUN_STARTED: return "RUN_STARTED";
        case PipelineEventType::STAGE_STARTED: return "STAGE_STARTED";
        case PipelineEventType::STAGE_COMPLETED: return "STAGE_COMPLETED";
        case PipelineEventType::STAGE_FAILED: return "STAGE_FAILED";
        case PipelineEventType::STAGE_SKIPPED: return "STAGE_SKIPPED";
        case PipelineEventType::HOOK_FAILED: return "HOOK_FAILED";
        case PipelineEventType::RUN_COMPLETED: return "RUN_COMPLETED";
        default: return "UNKNOWN";
    }
}

std::string PipelineUtils::formatDuration(std::chrono::milliseconds duration) {
    const auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    std::ostringstream oss;
    if (ms < 60000) {
        oss << std::fixed << std::setprecision(1) << (static_cast<double>(ms) / 1000.0) << "s";
        return oss.str();
    }
    oss << (ms / 60000) << "m" << ((ms % 60000) / 1000) << "s";
    return oss.str();
}

std::string PipelineUtils::formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    const auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string PipelineUtils::formatRunSummary(const RunOutcome& outcome) {
    size_t width = 5;
    for (const auto& stage : outcome.stages) {
        width = std::max(width, stage.stage.size());
    }
    
    std::ostringstream oss;
    oss << "Pipeline " << outcome.pipeline << " #" << outcome.run_id << "\n";
    oss << std::left << std::setw(static_cast<int>(width) + 2) << "STAGE"
        << std::setw(11) << "STATUS" << std::setw(20) << "KIND" << "DURATION\n";
    for (const auto& stage : outcome.stages) {
        oss << std::left << std::setw(static_cast<int>(width) + 2) << stage.stage
            << std::setw(11) << stageStatusToString(stage.status)
            << std::setw(20) << (stage.failure_kind ? errorKindToString(*stage.failure_kind) : "-")
            << (stage.skipped() ? "-" : formatDuration(stage.duration)) << "\n";
    }
    
    oss << "Result: " << (outcome.success ? "SUCCESS" : "FAILURE");
    if (outcome.cancelled) {
        oss << " (cancelled)";
    }
    oss << " in " << formatDuration(outcome.total_duration) << "\n";
    
    oss << "Hooks:";
    for (const auto& hook : outcome.hooks_run) {
        oss << " " << hook;
    }
    oss << "\n";
    for (const auto& error : outcome.hook_errors) {
        oss << "Hook error: " << error << "\n";
    }
    for (const auto& warning : outcome.warnings) {
        oss << "Warning [" << errorKindToString(warning.kind) << "] "
            << warning.source << ": " << warning.message << "\n";
    }
    return oss.str();
}

std::string PipelineUtils::formatPlan(const Pipeline& pipeline) {
    std::ostringstream oss;
    oss << "Pipeline " << pipeline.name() << " (" << pipeline.size() << " stages)\n";
    size_t index = 1;
    for (const auto& stage : pipeline.stages()) {
        oss << "  " << index++ << ". " << stage.name;
        oss << "  timeout=" << (stage.timeout ? formatDuration(*stage.timeout) : std::string("none"));
        if (!stage.description.empty()) {
            oss << "  " << stage.description;
        }
        oss << "\n";
        for (const auto& resource : stage.resources) {
            oss << "       - " << resource.kind << ": " << resource.detail << "\n";
        }
    }
    const auto& post = pipeline.postActions();
    oss << "Post actions: success=" << post.on_success.name
        << " failure=" << post.on_failure.name
        << " always=" << post.always.name << "\n";
    return oss.str();
}

nlohmann::json PipelineUtils::outcomeToJson(const RunOutcome& outcome) {
    nlohmann::json report;
    report["pipeline"] = outcome.pipeline;
    report["run_id"] = outcome.run_id;
    report["success"] = outcome.success;
    report["cancelled"] = outcome.cancelled;
    report["exit_code"] = outcome.exitCode();
    report["total_duration_ms"] = outcome.total_duration.count();
    
    nlohmann::json stages = nlohmann::json::array();
    for (const auto& stage : outcome.stages) {
        nlohmann::json entry;
        entry["name"] = stage.stage;
        entry["status"] = stageStatusToString(stage.status);
        entry["kind"] = stage.failure_kind ? nlohmann::json(errorKindToString(*stage.failure_kind))
                                           : nlohmann::json(nullptr);
        entry["exit_code"] = stage.exit_code;
        entry["duration_ms"] = stage.duration.count();
        entry["message"] = stage.message;
        if (stage.failed()) {
            entry["output_tail"] = stage.output;
        }
        stages.push_back(entry);
    }
    report["stages"] = stages;
    report["hooks_run"] = outcome.hooks_run;
    report["hook_errors"] = outcome.hook_errors;
    
    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& warning : outcome.warnings) {
        warnings.push_back({{"kind", errorKindToString(warning.kind)},
                            {"source", warning.source},
                            {"message", warning.message}});
    }
    report["warnings"] = warnings;
    return report;
}

bool PipelineUtils::writeJsonReport(const RunOutcome& outcome, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_ERROR("report", "Cannot open report file: " + filepath);
        return false;
    }
    file << outcomeToJson(outcome).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return file.good();
}

} // namespace Orchestrator
} // namespace CDP
