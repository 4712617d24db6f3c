#include "deploy/health_gate.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <thread>

namespace CDP {
namespace Deploy {

HttpHealthProbe::HttpHealthProbe(long request_timeout_ms)
    : client_(request_timeout_ms, request_timeout_ms) {}

HttpResponse HttpHealthProbe::probe(const std::string& url) {
    return client_.get(url);
}

ScopedInstance::ScopedInstance(InstanceController& controller, const InstanceSpec& spec)
    : controller_(controller), name_(spec.name) {
    container_id_ = controller_.start(spec);
}

ScopedInstance::~ScopedInstance() {
    try {
        controller_.stopAndRemove(name_);
    } catch (const std::exception& e) {
        LOG_ERROR("health_gate", "Failed to remove ephemeral instance " + name_ + ": " + e.what());
    }
}

HealthGate::HealthGate(HealthProbe& probe, Clock clock, Sleeper sleeper)
    : probe_(probe), clock_(std::move(clock)), sleeper_(std::move(sleeper)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

HealthReport HealthGate::checkLiveness(const DeploymentTarget& target, const std::string& path,
                                       std::chrono::milliseconds budget, std::chrono::milliseconds interval,
                                       const CancellationToken* token) {
    const std::string url = target.url() + path;
    const auto start = clock_();
    HealthReport report;
    
    LOG_INFO("health_gate", "Polling " + url + " (budget " + std::to_string(budget.count()) + "ms)");
    while (true) {
        if (token != nullptr && token->isCancelled()) {
            report.detail = "cancelled";
            break;
        }
        
        ++report.attempts;
        try {
            const HttpResponse response = probe_.probe(url);
            report.last_http_status = response.status;
            if (response.isSuccess()) {
                report.status = HealthStatus::HEALTHY;
                report.detail = "HTTP " + std::to_string(response.status);
                break;
            }
            report.detail = "HTTP " + std::to_string(response.status);
        } catch (const std::exception& e) {
            report.detail = e.what();
        }
        
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - start);
        if (elapsed >= budget) {
            report.detail = "no success within " + std::to_string(budget.count()) + "ms, last: " + report.detail;
            break;
        }
        sleeper_(std::min(interval, budget - elapsed));
    }
    
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - start);
    std::unordered_map<std::string, std::string> meta = {
        {"url", url},
        {"attempts", std::to_string(report.attempts)},
        {"elapsed_ms", std::to_string(report.elapsed.count())}};
    if (report.healthy()) {
        LOG_INFO_META("health_gate", "Healthy: " + target.name, meta);
    } else {
        LOG_WARN_META("health_gate", "Unhealthy: " + target.name + ": " + report.detail, meta);
    }
    return report;
}

HealthReport HealthGate::checkEphemeral(const EphemeralCheck& check, InstanceController& controller,
                                        const CancellationToken* token) {
    InstanceSpec spec;
    spec.name = check.instance_name;
    spec.image = check.image;
    spec.host_port = check.host_port;
    spec.container_port = check.container_port;
    
    std::unique_ptr<ScopedInstance> instance;
    try {
        instance = std::make_unique<ScopedInstance>(controller, spec);
    } catch (const std::exception& e) {
        HealthReport report;
        report.instance_started = false;
        report.detail = std::string("failed to start ") + check.instance_name + ": " + e.what();
        LOG_ERROR("health_gate", report.detail);
        // EN: A half-started container may exist under the name.
        // FR: Un conteneur à moitié démarré peut exister sous ce nom.
        try {
            controller.stopAndRemove(check.instance_name);
        } catch (const std::exception& cleanup_error) {
            LOG_ERROR("health_gate", std::string("Cleanup after failed start: ") + cleanup_error.what());
        }
        return report;
    }
    
    DeploymentTarget target;
    target.name = instance->name();
    target.port = check.host_port;
    target.image = check.image;
    target.container_id = instance->containerId();
    return checkLiveness(target, check.path, check.budget, check.interval, token);
}

std::string HealthGate::ephemeralInstanceName(const std::string& repository, const std::string& run_id) {
    const auto slash = repository.find_last_of('/');
    const std::string basename = slash == std::string::npos ? repository : repository.substr(slash + 1);
    return basename + "-test-" + run_id;
}

} // namespace Deploy
} // namespace CDP
