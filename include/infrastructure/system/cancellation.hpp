// EN: Cooperative cancellation token shared between a run, its stages and the operations they delegate to
// FR: Jeton d'annulation coopératif partagé entre une exécution, ses étapes et les opérations déléguées

#pragma once

#include <atomic>
#include <memory>

namespace CDP {

// EN: Copies share the same state. A child token reports cancelled when it or any ancestor is cancelled.
// FR: Les copies partagent le même état. Un jeton enfant est annulé si lui ou un ancêtre l'est.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}
    
    void cancel() const { state_->cancelled.store(true); }
    
    bool isCancelled() const {
        for (const State* state = state_.get(); state != nullptr; state = state->parent.get()) {
            if (state->cancelled.load()) {
                return true;
            }
        }
        return false;
    }
    
    // EN: Create a token cancelled together with this one, but cancellable on its own.
    // FR: Crée un jeton annulé avec celui-ci, mais annulable indépendamment.
    CancellationToken child() const {
        CancellationToken token;
        token.state_->parent = state_;
        return token;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<State> parent;
    };
    std::shared_ptr<State> state_;
};

} // namespace CDP
