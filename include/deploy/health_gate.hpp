// EN: Liveness polling with a bounded budget, and scoped ephemeral test instances
// FR: Sondage de disponibilité avec budget borné, et instances de test éphémères bornées

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "deploy/container_runtime.hpp"
#include "deploy/deployment_target.hpp"
#include "infrastructure/networking/http_client.hpp"
#include "infrastructure/system/cancellation.hpp"

namespace CDP {
namespace Deploy {

enum class HealthStatus {
    HEALTHY = 0,
    UNHEALTHY = 1
};

struct HealthReport {
    HealthStatus status = HealthStatus::UNHEALTHY;
    int attempts = 0;
    std::chrono::milliseconds elapsed{0};
    long last_http_status = 0;              // EN: 0 when no response was received / FR: 0 si aucune réponse reçue
    std::string detail;
    bool instance_started = true;           // EN: False when the checked instance never started / FR: Faux si l'instance vérifiée n'a jamais démarré
    
    bool healthy() const { return status == HealthStatus::HEALTHY; }
};

// EN: One liveness request. Throws when the endpoint cannot be reached.
// FR: Une requête de disponibilité. Lève si le point d'accès est injoignable.
class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    virtual HttpResponse probe(const std::string& url) = 0;
};

class HttpHealthProbe : public HealthProbe {
public:
    explicit HttpHealthProbe(long request_timeout_ms = 2000);
    HttpResponse probe(const std::string& url) override;

private:
    HttpClient client_;
};

// EN: Starts, stops and queries named instances; implemented by the deployment manager
// FR: Démarre, arrête et interroge des instances nommées ; implémenté par le gestionnaire de déploiement
class InstanceController {
public:
    virtual ~InstanceController() = default;
    virtual std::string start(const InstanceSpec& spec) = 0;        // EN: Returns the container id / FR: Retourne l'id du conteneur
    virtual void stopAndRemove(const std::string& name) = 0;        // EN: Absence is not an error / FR: L'absence n'est pas une erreur
    virtual bool isRunning(const std::string& name) = 0;
};

// EN: Instance started on construction and always stopped/removed on destruction
// FR: Instance démarrée à la construction et toujours arrêtée/supprimée à la destruction
class ScopedInstance {
public:
    ScopedInstance(InstanceController& controller, const InstanceSpec& spec);
    ~ScopedInstance();
    
    ScopedInstance(const ScopedInstance&) = delete;
    ScopedInstance& operator=(const ScopedInstance&) = delete;
    
    const std::string& name() const { return name_; }
    const std::string& containerId() const { return container_id_; }

private:
    InstanceController& controller_;
    std::string name_;
    std::string container_id_;
};

// EN: Parameters of a check against a disposable instance
// FR: Paramètres d'une vérification sur une instance jetable
struct EphemeralCheck {
    std::string image;
    std::string instance_name;
    int host_port = 0;
    int container_port = 0;
    std::string path = "/health";
    std::chrono::milliseconds budget{30000};
    std::chrono::milliseconds interval{2000};
};

class HealthGate {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    
    // EN: Default clock is steady_clock, default sleeper is this_thread::sleep_for.
    // FR: Horloge par défaut steady_clock, attente par défaut this_thread::sleep_for.
    explicit HealthGate(HealthProbe& probe, Clock clock = nullptr, Sleeper sleeper = nullptr);
    
    // EN: First probe is immediate; polls until a 2xx response or the budget elapses.
    //     Probe errors count as "not yet". Stops early when the token is cancelled.
    // FR: Première sonde immédiate ; interroge jusqu'à une réponse 2xx ou l'épuisement du budget.
    //     Les erreurs de sonde comptent comme "pas encore". S'arrête si le jeton est annulé.
    HealthReport checkLiveness(const DeploymentTarget& target, const std::string& path,
                               std::chrono::milliseconds budget, std::chrono::milliseconds interval,
                               const CancellationToken* token = nullptr);
    
    // EN: Starts a disposable instance, checks it, then always removes it.
    //     A start failure is reported as UNHEALTHY with the reason.
    // FR: Démarre une instance jetable, la vérifie, puis la supprime toujours.
    //     Un échec de démarrage est rapporté UNHEALTHY avec la raison.
    HealthReport checkEphemeral(const EphemeralCheck& check, InstanceController& controller,
                                const CancellationToken* token = nullptr);
    
    // EN: "<repository basename>-test-<run id>"
    // FR: "<nom de base du dépôt>-test-<id d'exécution>"
    static std::string ephemeralInstanceName(const std::string& repository, const std::string& run_id);

private:
    HealthProbe& probe_;
    Clock clock_;
    Sleeper sleeper_;
};

} // namespace Deploy
} // namespace CDP
