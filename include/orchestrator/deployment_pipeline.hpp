// EN: Assembles the standard gate/build/test/push/deploy pipeline and its post-run hooks from configuration
// FR: Assemble le pipeline standard gate/build/test/push/deploy et ses hooks post-exécution depuis la configuration

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "deploy/container_runtime.hpp"
#include "deploy/deployment_manager.hpp"
#include "deploy/health_gate.hpp"
#include "deploy/image_builder.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/system/process_runner.hpp"
#include "notify/notifier.hpp"
#include "orchestrator/credential_store.hpp"
#include "orchestrator/pipeline_engine.hpp"

namespace CDP {
namespace Orchestrator {

// EN: Settings of the standard pipeline, one field per recognised configuration key
// FR: Paramètres du pipeline standard, un champ par clé de configuration reconnue
struct DeploymentSettings {
    struct Gate {
        std::string name;
        std::string command;                                    // EN: Run as /bin/sh -c <command> / FR: Exécutée via /bin/sh -c <command>
    };
    
    // EN: pipeline section
    // FR: section pipeline
    std::string project = "telco-churn-prediction";
    std::string workspace = ".";
    std::string build_url;
    
    // EN: gates section
    // FR: section gates
    std::vector<Gate> gates;
    std::chrono::seconds gate_timeout{900};
    
    // EN: image section
    // FR: section image
    std::string registry;                                       // EN: Empty means Docker Hub / FR: Vide signifie Docker Hub
    std::string repository = "telco-churn-prediction";
    std::string build_context = ".";
    std::string dockerfile;
    std::string floating_tag = "latest";
    std::chrono::seconds build_timeout{1800};
    
    // EN: registry section
    // FR: section registry
    bool push = true;
    std::string registry_credential = "docker-hub-credentials";
    std::chrono::seconds push_timeout{900};
    
    // EN: test section
    // FR: section test
    int test_port = 5001;
    int test_container_port = 5000;
    std::string health_path = "/health";
    std::chrono::seconds test_timeout{30};
    std::chrono::seconds test_poll_interval{2};
    
    // EN: deploy section
    // FR: section deploy
    bool deploy = true;
    std::string deploy_name = "telco-churn-staging";
    int deploy_port = 5000;
    int deploy_container_port = 5000;
    std::chrono::seconds settle_interval{10};
    std::chrono::seconds deploy_health_timeout{30};
    std::chrono::seconds deploy_poll_interval{2};
    
    // EN: notify section
    // FR: section notify
    bool notify = true;
    std::string notify_transport = "log";                      // EN: "log" or "smtp" / FR: "log" ou "smtp"
    std::vector<std::string> recipients;
    std::string sender = "cdp@localhost";
    std::string smtp_url;
    std::string smtp_credential;
    
    // EN: credentials and cleanup sections
    // FR: sections credentials et cleanup
    std::string credentials_file;
    bool prune_images = true;
    
    static DeploymentSettings fromConfig(const ConfigManager& config);
    static std::vector<ConfigManager::ValidationRule> validationRules();
};

// EN: Collaborators of the standard pipeline; tests substitute fakes
// FR: Collaborateurs du pipeline standard ; les tests substituent des faux
struct DeploymentServices {
    Deploy::ContainerRuntime& runtime;
    ProcessRunner& process_runner;
    CredentialStore& credentials;
    Deploy::HealthProbe& probe;
    std::shared_ptr<Notify::NotificationTransport> transport;  // EN: Null selects from settings / FR: Nul choisit selon les paramètres
    Deploy::HealthGate::Clock clock = nullptr;
    Deploy::HealthGate::Sleeper sleeper = nullptr;
};

// EN: Owns the delegated components; must outlive every run of the pipelines it builds.
// FR: Possède les composants délégués ; doit survivre à toute exécution des pipelines construits.
class DeploymentPipelineBuilder {
public:
    DeploymentPipelineBuilder(DeploymentSettings settings, DeploymentServices services);
    
    DeploymentPipelineBuilder(const DeploymentPipelineBuilder&) = delete;
    DeploymentPipelineBuilder& operator=(const DeploymentPipelineBuilder&) = delete;
    
    Pipeline build(const BuildMetadata& metadata) const;
    
    const DeploymentSettings& settings() const { return settings_; }
    
    // EN: Artifact keys written into the RunContext by the stages
    // FR: Clés d'artefacts écrites dans le RunContext par les étapes
    static constexpr const char* ARTIFACT_IMAGE = "image";
    static constexpr const char* ARTIFACT_IMAGE_ID = "image_id";
    static constexpr const char* ARTIFACT_TARGET_URL = "target_url";

private:
    StageDefinition gateStage(const DeploymentSettings::Gate& gate) const;
    StageDefinition buildStage() const;
    StageDefinition testStage(const BuildMetadata& metadata) const;
    StageDefinition pushStage() const;
    StageDefinition deployStage() const;
    PostActions postActions() const;
    
    void sendNotification(Notify::NotificationKind kind, RunContext& context, const RunOutcome& outcome) const;
    std::shared_ptr<Notify::NotificationTransport> makeTransport(RunContext& context) const;
    std::vector<std::string> imageTags(const RunContext& context) const;
    
    DeploymentSettings settings_;
    DeploymentServices services_;
    std::unique_ptr<Deploy::HealthGate> gate_;
    std::unique_ptr<Deploy::DeploymentManager> manager_;
    std::unique_ptr<Deploy::ImageBuilder> image_builder_;
};

} // namespace Orchestrator
} // namespace CDP
