// EN: Executes one stage's unit of work with timeout, cancellation and output capture
// FR: Exécute l'unité de travail d'une étape avec timeout, annulation et capture de sortie

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/system/cancellation.hpp"
#include "orchestrator/run_context.hpp"

namespace CDP {
namespace Orchestrator {

// EN: What a unit of work reports back
// FR: Ce que rapporte une unité de travail
struct WorkResult {
    int status = 0;                                 // EN: 0 means success / FR: 0 signifie succès
    std::string output;
    std::optional<ErrorKind> failure_kind;          // EN: Overrides WORK_FAILED when status != 0 / FR: Remplace WORK_FAILED si status != 0
    std::string message;
    
    static WorkResult success(std::string output = "", std::string message = "") {
        WorkResult result;
        result.output = std::move(output);
        result.message = std::move(message);
        return result;
    }
    
    static WorkResult failure(int status, std::string output, std::string message = "",
                              std::optional<ErrorKind> kind = std::nullopt) {
        WorkResult result;
        result.status = status;
        result.output = std::move(output);
        result.message = std::move(message);
        result.failure_kind = kind;
        return result;
    }
};

// EN: Handle given to the work: run context plus the stage's own cancellation token
// FR: Poignée donnée au travail : contexte d'exécution et jeton d'annulation propre à l'étape
struct StageExecution {
    RunContext& context;
    CancellationToken token;
    std::string stage_name;
};

// EN: Declared resource acquisition, used for logs and plans
// FR: Acquisition de ressource déclarée, utilisée pour les logs et les plans
struct ResourceDeclaration {
    std::string kind;       // EN: e.g. "container", "port", "credential" / FR: ex. "container", "port", "credential"
    std::string detail;
};

using StageWork = std::function<WorkResult(StageExecution&)>;

// EN: Static description of a stage
// FR: Description statique d'une étape
struct StageDefinition {
    std::string name;                                       // EN: Unique within a pipeline / FR: Unique dans un pipeline
    std::string description;
    StageWork work;
    std::optional<std::chrono::milliseconds> timeout;
    std::vector<ResourceDeclaration> resources;
};

class StageRunner {
public:
    static constexpr size_t OUTPUT_TAIL_BYTES = 64 * 1024;
    
    // EN: Never throws for stage errors; the outcome is appended to the context log and returned.
    //     On timeout the stage token is cancelled and the runner waits for the work to unwind.
    // FR: Ne lève jamais pour une erreur d'étape ; le résultat est ajouté au journal et retourné.
    //     Sur timeout le jeton de l'étape est annulé et le lanceur attend que le travail se termine.
    StageOutcome execute(const StageDefinition& stage, RunContext& context) const;
    
    static std::string tail(const std::string& text, size_t max_bytes = OUTPUT_TAIL_BYTES);
};

} // namespace Orchestrator
} // namespace CDP
