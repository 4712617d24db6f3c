#include "deploy/deployment_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/pipeline_errors.hpp"

#include <stdexcept>
#include <thread>

namespace CDP {
namespace Deploy {

DeploymentManager::DeploymentManager(ContainerRuntime& runtime, HealthGate& gate)
    : DeploymentManager(runtime, gate, Config()) {}

DeploymentManager::DeploymentManager(ContainerRuntime& runtime, HealthGate& gate, Config config, Sleeper sleeper)
    : runtime_(runtime), gate_(gate), config_(std::move(config)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

std::string DeploymentManager::start(const InstanceSpec& spec) {
    InstanceSpec effective = spec;
    if (effective.container_port == 0) {
        effective.container_port = config_.container_port;
    }
    const RuntimeResult result = runtime_.runContainer(effective);
    if (!result.ok) {
        throw std::runtime_error("Cannot start " + spec.name + " from " + spec.image + ": " + result.output);
    }
    LOG_INFO("deployment", "Started " + spec.name + " (" + spec.image + ") on port " +
             std::to_string(spec.host_port));
    return result.value;
}

void DeploymentManager::stopAndRemove(const std::string& name) {
    const auto state = runtime_.inspectContainer(name);
    if (!state) {
        LOG_DEBUG("deployment", "No instance named " + name);
        return;
    }
    if (state->running) {
        const RuntimeResult stopped = runtime_.stopContainer(name);
        if (!stopped.ok) {
            throw std::runtime_error("Cannot stop " + name + ": " + stopped.output);
        }
    }
    const RuntimeResult removed = runtime_.removeContainer(name);
    if (!removed.ok) {
        throw std::runtime_error("Cannot remove " + name + ": " + removed.output);
    }
    LOG_INFO("deployment", "Removed instance " + name);
}

bool DeploymentManager::isRunning(const std::string& name) {
    const auto state = runtime_.inspectContainer(name);
    return state.has_value() && state->running;
}

DeploymentTarget DeploymentManager::deploy(const std::string& name, const std::string& image, int port,
                                           const CancellationToken* token) {
    using Orchestrator::DeployFailedError;
    
    LOG_INFO_META("deployment", "Deploying " + name,
                  (std::unordered_map<std::string, std::string>{
                      {"image", image}, {"port", std::to_string(port)}}));
    
    DeploymentTarget target;
    target.name = name;
    target.host = config_.host;
    target.port = port;
    target.image = image;
    
    try {
        stopAndRemove(name);
        
        InstanceSpec spec;
        spec.name = name;
        spec.image = image;
        spec.host_port = port;
        spec.container_port = config_.container_port;
        spec.restart_policy = config_.restart_policy;
        target.container_id = start(spec);
    } catch (const std::runtime_error& e) {
        throw DeployFailedError("Deployment of " + name + " failed: " + e.what());
    }
    
    if (config_.settle_interval.count() > 0) {
        sleeper_(config_.settle_interval);
    }
    
    const HealthReport report = gate_.checkLiveness(target, config_.health_path, config_.health_budget,
                                                    config_.poll_interval, token);
    if (!report.healthy()) {
        LOG_ERROR("deployment", "Instance " + name + " is left running for inspection");
        throw DeployFailedError("Deployment of " + name + " is unhealthy after " +
                                std::to_string(report.attempts) + " attempt(s): " + report.detail);
    }
    LOG_INFO("deployment", "Deployed " + name + " at " + target.url());
    return target;
}

} // namespace Deploy
} // namespace CDP
