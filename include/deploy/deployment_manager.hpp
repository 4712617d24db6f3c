// EN: Idempotent stop-then-start deployment of named instances, followed by a liveness check
// FR: Déploiement idempotent arrêt-puis-démarrage d'instances nommées, suivi d'une vérification de disponibilité

#pragma once

#include <chrono>
#include <string>

#include "deploy/container_runtime.hpp"
#include "deploy/deployment_target.hpp"
#include "deploy/health_gate.hpp"

namespace CDP {
namespace Deploy {

class DeploymentManager : public InstanceController {
public:
    struct Config {
        std::string host = "localhost";
        int container_port = 5000;                          // EN: Port the application listens on / FR: Port d'écoute de l'application
        std::string restart_policy = "unless-stopped";
        std::chrono::milliseconds settle_interval{10000};   // EN: Wait before the first probe / FR: Attente avant la première sonde
        std::string health_path = "/health";
        std::chrono::milliseconds health_budget{30000};
        std::chrono::milliseconds poll_interval{2000};
    };
    
    using Sleeper = HealthGate::Sleeper;
    
    DeploymentManager(ContainerRuntime& runtime, HealthGate& gate);
    DeploymentManager(ContainerRuntime& runtime, HealthGate& gate, Config config, Sleeper sleeper = nullptr);
    
    // EN: Replaces any instance named `name`, starts `image` on `port`, waits the settle
    //     interval, then checks liveness. Throws DeployFailedError; an unhealthy new
    //     instance is left running for inspection.
    // FR: Remplace toute instance nommée `name`, démarre `image` sur `port`, attend l'intervalle
    //     de stabilisation, puis vérifie la disponibilité. Lève DeployFailedError ; une nouvelle
    //     instance en échec est laissée en marche pour inspection.
    DeploymentTarget deploy(const std::string& name, const std::string& image, int port,
                            const CancellationToken* token = nullptr);
    
    // EN: InstanceController, throwing std::runtime_error on runtime failure
    // FR: InstanceController, lève std::runtime_error en cas d'échec du runtime
    std::string start(const InstanceSpec& spec) override;
    void stopAndRemove(const std::string& name) override;
    bool isRunning(const std::string& name) override;
    
    const Config& config() const { return config_; }

private:
    ContainerRuntime& runtime_;
    HealthGate& gate_;
    Config config_;
    Sleeper sleeper_;
};

} // namespace Deploy
} // namespace CDP
