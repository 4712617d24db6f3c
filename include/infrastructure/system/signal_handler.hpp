// EN: Signal Handler for CD-Pipeline - turns SIGINT/SIGTERM into run cancellation requests
// FR: Gestionnaire de signaux pour CD-Pipeline - transforme SIGINT/SIGTERM en demandes d'annulation

#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace CDP {

// EN: Callback invoked once when a shutdown signal is received (receives the signal number)
// FR: Callback invoqué une fois à la réception d'un signal d'arrêt (reçoit le numéro du signal)
using CancellationCallback = std::function<void(int signal_number)>;

// EN: Signal handler statistics for monitoring
// FR: Statistiques du gestionnaire de signaux pour monitoring
struct SignalHandlerStats {
    size_t signals_received{0};
    size_t callbacks_registered{0};
    size_t callbacks_failed{0};
    int last_signal{0};
};

// EN: Process-wide signal handler. The C handler only records the signal; a dispatcher
// EN: thread runs the registered callbacks outside signal context.
// FR: Gestionnaire de signaux global. Le handler C enregistre seulement le signal ; un thread
// FR: dispatcher exécute les callbacks enregistrés hors du contexte du signal.
class SignalHandler {
public:
    static SignalHandler& getInstance();
    
    // EN: Install SIGINT/SIGTERM handlers and start the dispatcher thread
    // FR: Installe les handlers SIGINT/SIGTERM et démarre le thread dispatcher
    void initialize();
    
    // EN: Restore default handlers and stop the dispatcher thread
    // FR: Restaure les handlers par défaut et arrête le thread dispatcher
    void shutdown();
    
    void registerCallback(const std::string& name, CancellationCallback callback);
    void unregisterCallback(const std::string& name);
    
    // EN: Run callbacks as if the signal had been delivered (used by tests and the CLI)
    // FR: Exécute les callbacks comme si le signal avait été reçu (utilisé par les tests et la CLI)
    void triggerShutdown(int signal_number = SIGTERM);
    
    bool isShutdownRequested() const { return shutdown_requested_.load(); }
    SignalHandlerStats getStats() const;
    
    // EN: Clear callbacks and flags (mainly for testing)
    // FR: Efface callbacks et flags (principalement pour les tests)
    void reset();
    
    ~SignalHandler();

private:
    SignalHandler() = default;
    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;
    
    static void signalCallback(int signal_number);
    void dispatchLoop();
    void runCallbacks(int signal_number);

    mutable std::mutex mutex_;
    std::map<std::string, CancellationCallback> callbacks_;
    SignalHandlerStats stats_;
    
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> stop_dispatcher_{false};
    std::thread dispatcher_;
    
    static volatile std::sig_atomic_t pending_signal_;
};

} // namespace CDP
