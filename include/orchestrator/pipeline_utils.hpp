// EN: Utility functions for pipeline reporting: names, durations, summary table and JSON report
// FR: Fonctions utilitaires pour le rapport du pipeline : noms, durées, tableau récapitulatif et rapport JSON

#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "orchestrator/pipeline_engine.hpp"

namespace CDP {
namespace Orchestrator {
namespace PipelineUtils {

// EN: Status conversion utilities
// FR: Utilitaires de conversion de statut
std::string stageStatusToString(StageStatus status);
std::string errorKindToString(ErrorKind kind);
std::string eventTypeToString(PipelineEventType type);

// EN: Time and duration utilities
// FR: Utilitaires de temps et de durée
std::string formatDuration(std::chrono::milliseconds duration);
std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);   // EN: ISO-8601 UTC / FR: ISO-8601 UTC

// EN: Per-stage table with the final verdict, hooks and warnings
// FR: Tableau par étape avec le verdict final, les hooks et les avertissements
std::string formatRunSummary(const RunOutcome& outcome);

// EN: Stage order, timeouts and declared resources, without executing anything
// FR: Ordre des étapes, timeouts et ressources déclarées, sans rien exécuter
std::string formatPlan(const Pipeline& pipeline);

nlohmann::json outcomeToJson(const RunOutcome& outcome);
bool writeJsonReport(const RunOutcome& outcome, const std::string& filepath);

} // namespace PipelineUtils
} // namespace Orchestrator
} // namespace CDP
