// EN: Subprocess execution with captured output, stdin feeding, timeout and cooperative cancellation
// FR: Exécution de sous-processus avec capture de sortie, alimentation stdin, timeout et annulation coopérative

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/system/cancellation.hpp"

namespace CDP {

// EN: Description of a process to launch
// FR: Description d'un processus à lancer
struct ProcessSpec {
    std::vector<std::string> argv;                   // EN: argv[0] resolved through PATH / FR: argv[0] résolu via PATH
    std::map<std::string, std::string> environment;  // EN: Added to the inherited environment / FR: Ajouté à l'environnement hérité
    std::string working_directory;                   // EN: Empty keeps the current directory / FR: Vide conserve le répertoire courant
    std::optional<std::string> stdin_data;           // EN: Written then stdin is closed / FR: Écrit puis stdin est fermé
    std::chrono::milliseconds timeout{0};            // EN: 0 means no timeout / FR: 0 signifie pas de timeout
    std::chrono::milliseconds kill_grace{2000};      // EN: SIGTERM to SIGKILL delay / FR: Délai entre SIGTERM et SIGKILL
};

// EN: Result of a finished process
// FR: Résultat d'un processus terminé
struct ProcessResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool cancelled = false;
    int term_signal = 0;                             // EN: Signal that ended the process, 0 if exited / FR: Signal ayant terminé le processus
    std::chrono::milliseconds duration{0};
    
    bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled && term_signal == 0; }
    
    // EN: stdout followed by stderr, as a single diagnostic text
    // FR: stdout suivi de stderr, en un seul texte de diagnostic
    std::string combinedOutput() const;
};

// EN: Abstract process launcher so callers can be tested without spawning processes
// FR: Lanceur de processus abstrait pour tester les appelants sans créer de processus
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const ProcessSpec& spec, const CancellationToken* token = nullptr) = 0;
};

// EN: POSIX fork/exec implementation
// FR: Implémentation POSIX fork/exec
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const ProcessSpec& spec, const CancellationToken* token = nullptr) override;
};

// EN: Render argv as a shell-like string for logs
// FR: Rend argv comme une chaîne de type shell pour les logs
std::string joinCommandLine(const std::vector<std::string>& argv);

} // namespace CDP
