// EN: Implementation of the SignalHandler class. Signals are recorded asynchronously and dispatched
// EN: to cancellation callbacks from a regular thread.
// FR: Implémentation de la classe SignalHandler. Les signaux sont enregistrés de façon asynchrone
// FR: et dispatchés vers les callbacks d'annulation depuis un thread normal.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <signal.h>

#include <stdexcept>
#include <vector>

namespace CDP {

volatile std::sig_atomic_t SignalHandler::pending_signal_ = 0;

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

SignalHandler::~SignalHandler() {
    shutdown();
}

// EN: Initialize signal handling by registering SIGINT and SIGTERM handlers.
// FR: Initialise la gestion des signaux en enregistrant les handlers SIGINT et SIGTERM.
void SignalHandler::initialize() {
    if (initialized_.exchange(true)) {
        LOG_WARN("signal_handler", "SignalHandler already initialized");
        return;
    }
    
    struct sigaction action {};
    action.sa_handler = &SignalHandler::signalCallback;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    
    if (sigaction(SIGINT, &action, nullptr) != 0) {
        initialized_ = false;
        throw std::runtime_error("Failed to register SIGINT handler");
    }
    if (sigaction(SIGTERM, &action, nullptr) != 0) {
        std::signal(SIGINT, SIG_DFL);
        initialized_ = false;
        throw std::runtime_error("Failed to register SIGTERM handler");
    }
    
    stop_dispatcher_ = false;
    dispatcher_ = std::thread([this]() { dispatchLoop(); });
    
    LOG_DEBUG("signal_handler", "SIGINT and SIGTERM handlers registered");
}

void SignalHandler::shutdown() {
    if (!initialized_.exchange(false)) {
        return;
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    stop_dispatcher_ = true;
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

void SignalHandler::registerCallback(const std::string& name, CancellationCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_[name] = std::move(callback);
    stats_.callbacks_registered = callbacks_.size();
}

void SignalHandler::unregisterCallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(name);
    stats_.callbacks_registered = callbacks_.size();
}

void SignalHandler::triggerShutdown(int signal_number) {
    LOG_INFO("signal_handler", "Shutdown triggered with signal: " + std::to_string(signal_number));
    runCallbacks(signal_number);
}

SignalHandlerStats SignalHandler::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void SignalHandler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.clear();
    stats_ = SignalHandlerStats{};
    shutdown_requested_ = false;
    pending_signal_ = 0;
}

// EN: Async-signal-safe: only stores the signal number.
// FR: Async-signal-safe : stocke uniquement le numéro du signal.
void SignalHandler::signalCallback(int signal_number) {
    pending_signal_ = signal_number;
}

void SignalHandler::dispatchLoop() {
    while (!stop_dispatcher_.load()) {
        int signal_number = pending_signal_;
        if (signal_number != 0) {
            pending_signal_ = 0;
            LOG_WARN("signal_handler", "Received signal " + std::to_string(signal_number) +
                     ", requesting cancellation");
            runCallbacks(signal_number);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

// EN: Callbacks are copied out so they can register/unregister without deadlocking.
// FR: Les callbacks sont copiés pour pouvoir s'enregistrer/désenregistrer sans interblocage.
void SignalHandler::runCallbacks(int signal_number) {
    std::vector<std::pair<std::string, CancellationCallback>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_requested_ = true;
        stats_.signals_received++;
        stats_.last_signal = signal_number;
        snapshot.assign(callbacks_.begin(), callbacks_.end());
    }
    
    for (const auto& [name, callback] : snapshot) {
        try {
            callback(signal_number);
        } catch (const std::exception& e) {
            LOG_ERROR("signal_handler", "Cancellation callback '" + name + "' failed: " + e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.callbacks_failed++;
        }
    }
}

} // namespace CDP
