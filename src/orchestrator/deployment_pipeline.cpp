// EN: Standard deployment pipeline: stage definitions delegating to the deploy and notify components
// FR: Pipeline de déploiement standard : définitions d'étapes déléguant aux composants deploy et notify

#include "orchestrator/deployment_pipeline.hpp"
#include "infrastructure/logging/logger.hpp"

namespace CDP {
namespace Orchestrator {

namespace {

const std::chrono::seconds CONTAINER_OVERHEAD{120};

std::chrono::seconds seconds(const ConfigManager& config, const std::string& section,
                             const std::string& key, std::chrono::seconds fallback) {
    return std::chrono::seconds(config.getInt(section, key, static_cast<int>(fallback.count())));
}

} // namespace

DeploymentSettings DeploymentSettings::fromConfig(const ConfigManager& config) {
    DeploymentSettings s;
    
    s.project = config.getString("pipeline", "name", s.project);
    s.workspace = config.getString("pipeline", "workspace", s.workspace);
    s.build_url = config.getString("pipeline", "build_url", s.build_url);
    
    const auto names = config.getList("gates", "names");
    const auto commands = config.getList("gates", "commands");
    for (size_t i = 0; i < commands.size(); ++i) {
        const std::string name = i < names.size() ? names[i] : "gate-" + std::to_string(i + 1);
        s.gates.push_back({name, commands[i]});
    }
    s.gate_timeout = seconds(config, "gates", "timeout_seconds", s.gate_timeout);
    
    s.registry = config.getString("image", "registry", s.registry);
    s.repository = config.getString("image", "repository", s.repository);
    s.build_context = config.getString("image", "context", s.build_context);
    s.dockerfile = config.getString("image", "dockerfile", s.dockerfile);
    s.floating_tag = config.getString("image", "floating_tag", s.floating_tag);
    s.build_timeout = seconds(config, "image", "build_timeout_seconds", s.build_timeout);
    
    s.push = config.getBool("registry", "push", s.push);
    s.registry_credential = config.getString("registry", "credential", s.registry_credential);
    s.push_timeout = seconds(config, "registry", "push_timeout_seconds", s.push_timeout);
    
    s.test_port = config.getInt("test", "port", s.test_port);
    s.test_container_port = config.getInt("test", "container_port", s.test_container_port);
    s.health_path = config.getString("test", "health_path", s.health_path);
    s.test_timeout = seconds(config, "test", "timeout_seconds", s.test_timeout);
    s.test_poll_interval = seconds(config, "test", "poll_interval_seconds", s.test_poll_interval);
    
    s.deploy = config.getBool("deploy", "enabled", s.deploy);
    s.deploy_name = config.getString("deploy", "name", s.deploy_name);
    s.deploy_port = config.getInt("deploy", "port", s.deploy_port);
    s.deploy_container_port = config.getInt("deploy", "container_port", s.deploy_container_port);
    s.settle_interval = seconds(config, "deploy", "settle_seconds", s.settle_interval);
    s.deploy_health_timeout = seconds(config, "deploy", "health_timeout_seconds", s.deploy_health_timeout);
    s.deploy_poll_interval = seconds(config, "deploy", "poll_interval_seconds", s.deploy_poll_interval);
    
    s.notify = config.getBool("notify", "enabled", s.notify);
    s.notify_transport = config.getString("notify", "transport", s.notify_transport);
    s.recipients = config.getList("notify", "recipients");
    s.sender = config.getString("notify", "sender", s.sender);
    s.smtp_url = config.getString("notify", "smtp_url", s.smtp_url);
    s.smtp_credential = config.getString("notify", "smtp_credential", s.smtp_credential);
    
    s.credentials_file = config.getString("credentials", "file", s.credentials_file);
    s.prune_images = config.getBool("cleanup", "prune_images", s.prune_images);
    return s;
}

std::vector<ConfigManager::ValidationRule> DeploymentSettings::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;
    auto port = [](const std::string& key) {
        ConfigManager::ValidationRule rule;
        rule.key = key;
        rule.type = "int";
        rule.min_value = 1;
        rule.max_value = 65535;
        rule.description = "TCP port";
        return rule;
    };
    auto positive = [](const std::string& key) {
        ConfigManager::ValidationRule rule;
        rule.key = key;
        rule.type = "int";
        rule.min_value = 1;
        rule.description = "Duration in seconds";
        return rule;
    };
    
    rules.push_back(port("test.port"));
    rules.push_back(port("test.container_port"));
    rules.push_back(port("deploy.port"));
    rules.push_back(port("deploy.container_port"));
    for (const char* key : {"gates.timeout_seconds", "image.build_timeout_seconds", "registry.push_timeout_seconds",
                            "test.timeout_seconds", "test.poll_interval_seconds",
                            "deploy.health_timeout_seconds", "deploy.poll_interval_seconds"}) {
        rules.push_back(positive(key));
    }
    
    ConfigManager::ValidationRule settle;
    settle.key = "deploy.settle_seconds";
    settle.type = "int";
    settle.min_value = 0;
    rules.push_back(settle);
    
    ConfigManager::ValidationRule transport;
    transport.key = "notify.transport";
    transport.type = "string";
    transport.allowed_values = {"log", "smtp"};
    rules.push_back(transport);
    
    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"DEBUG", "INFO", "WARN", "ERROR", "debug", "info", "warn", "error"};
    rules.push_back(level);
    
    for (const char* key : {"registry.push", "deploy.enabled", "notify.enabled", "cleanup.prune_images"}) {
        ConfigManager::ValidationRule flag;
        flag.key = key;
        flag.type = "bool";
        rules.push_back(flag);
    }
    return rules;
}

DeploymentPipelineBuilder::DeploymentPipelineBuilder(DeploymentSettings settings, DeploymentServices services)
    : settings_(std::move(settings)), services_(std::move(services)) {
    gate_ = std::make_unique<Deploy::HealthGate>(services_.probe, services_.clock, services_.sleeper);
    
    Deploy::DeploymentManager::Config manager_config;
    manager_config.container_port = settings_.deploy_container_port;
    manager_config.settle_interval = settings_.settle_interval;
    manager_config.health_path = settings_.health_path;
    manager_config.health_budget = settings_.deploy_health_timeout;
    manager_config.poll_interval = settings_.deploy_poll_interval;
    manager_ = std::make_unique<Deploy::DeploymentManager>(services_.runtime, *gate_, manager_config,
                                                           services_.sleeper);
    
    image_builder_ = std::make_unique<Deploy::ImageBuilder>(services_.runtime, settings_.registry,
                                                            settings_.repository, settings_.floating_tag);
}

std::vector<std::string> DeploymentPipelineBuilder::imageTags(const RunContext& context) const {
    return image_builder_->orderTags({context.metadata().run_id, settings_.floating_tag});
}

Pipeline DeploymentPipelineBuilder::build(const BuildMetadata& metadata) const {
    std::vector<StageDefinition> stages;
    for (const auto& gate : settings_.gates) {
        stages.push_back(gateStage(gate));
    }
    stages.push_back(buildStage());
    stages.push_back(testStage(metadata));
    if (settings_.push) {
        stages.push_back(pushStage());
    }
    if (settings_.deploy) {
        stages.push_back(deployStage());
    }
    return Pipeline(settings_.project, std::move(stages), postActions());
}

StageDefinition DeploymentPipelineBuilder::gateStage(const DeploymentSettings::Gate& gate) const {
    StageDefinition stage;
    stage.name = gate.name;
    stage.description = "Quality gate: " + gate.command;
    stage.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(settings_.gate_timeout);
    stage.work = [this, command = gate.command](StageExecution& execution) {
        ProcessSpec spec;
        spec.argv = {"/bin/sh", "-c", command};
        spec.working_directory = settings_.workspace;
        spec.environment = execution.context.environment();
        
        const ProcessResult result = services_.process_runner.run(spec, &execution.token);
        if (result.succeeded()) {
            return WorkResult::success(result.combinedOutput());
        }
        if (result.cancelled || result.timed_out) {
            return WorkResult::failure(result.exit_code, result.combinedOutput(),
                                       "gate command interrupted", ErrorKind::ABORTED);
        }
        const int status = result.exit_code != 0 ? result.exit_code : 128 + result.term_signal;
        return WorkResult::failure(status, result.combinedOutput(),
                                   "gate command exited with status " + std::to_string(status));
    };
    return stage;
}

StageDefinition DeploymentPipelineBuilder::buildStage() const {
    StageDefinition stage;
    stage.name = "build-image";
    stage.description = "Build " + (settings_.registry.empty() ? settings_.repository
                                                               : settings_.registry + "/" + settings_.repository);
    stage.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(settings_.build_timeout);
    stage.resources = {{"image", settings_.repository + ":<run id>, " + settings_.repository + ":" + settings_.floating_tag}};
    stage.work = [this](StageExecution& execution) {
        Deploy::BuildContext build_context;
        build_context.directory = settings_.build_context;
        build_context.dockerfile = settings_.dockerfile;
        
        const Deploy::ImageReference image =
            image_builder_->build(build_context, imageTags(execution.context), &execution.token);
        
        execution.context.metadata().image_tag = image.tags.front();
        execution.context.setArtifact(ARTIFACT_IMAGE, image.primary());
        execution.context.setArtifact(ARTIFACT_IMAGE_ID, image.image_id);
        return WorkResult::success("", "built " + image.primary());
    };
    return stage;
}

StageDefinition DeploymentPipelineBuilder::testStage(const BuildMetadata& metadata) const {
    const std::string instance = Deploy::HealthGate::ephemeralInstanceName(settings_.repository, metadata.run_id);
    
    StageDefinition stage;
    stage.name = "test-image";
    stage.description = "Health check of the built image in a disposable container";
    stage.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(settings_.test_timeout + CONTAINER_OVERHEAD);
    stage.resources = {{"container", instance}, {"port", std::to_string(settings_.test_port)}};
    stage.work = [this](StageExecution& execution) {
        Deploy::EphemeralCheck check;
        check.image = execution.context.artifact(ARTIFACT_IMAGE);
        check.instance_name = Deploy::HealthGate::ephemeralInstanceName(settings_.repository,
                                                                        execution.context.metadata().run_id);
        check.host_port = settings_.test_port;
        check.container_port = settings_.test_container_port;
        check.path = settings_.health_path;
        check.budget = settings_.test_timeout;
        check.interval = settings_.test_poll_interval;
        
        const Deploy::HealthReport report = gate_->checkEphemeral(check, *manager_, &execution.token);
        const std::string summary = std::to_string(report.attempts) + " attempt(s) in " +
                                    std::to_string(report.elapsed.count()) + "ms: " + report.detail;
        if (!report.instance_started) {
            return WorkResult::failure(1, summary, "test instance did not start: " + report.detail,
                                       ErrorKind::WORK_FAILED);
        }
        if (!report.healthy()) {
            return WorkResult::failure(1, summary, "image is unhealthy: " + report.detail, ErrorKind::TIMEOUT);
        }
        return WorkResult::success(summary, "image is healthy");
    };
    return stage;
}

StageDefinition DeploymentPipelineBuilder::pushStage() const {
    StageDefinition stage;
    stage.name = "push-image";
    stage.description = "Push image tags to " + (settings_.registry.empty() ? std::string("Docker Hub") : settings_.registry);
    stage.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(settings_.push_timeout);
    stage.resources = {{"credential", settings_.registry_credential},
                       {"registry-session", settings_.registry.empty() ? "docker.io" : settings_.registry}};
    stage.work = [this](StageExecution& execution) {
        const Credential& credential =
            execution.context.resolveCredential(services_.credentials, settings_.registry_credential);
        
        Deploy::ImageReference image;
        image.registry = settings_.registry;
        image.repository = settings_.repository;
        image.tags = imageTags(execution.context);
        image.image_id = execution.context.artifact(ARTIFACT_IMAGE_ID);
        
        image_builder_->publish(image, credential, &execution.token);
        return WorkResult::success("", "pushed " + std::to_string(image.tags.size()) + " tag(s)");
    };
    return stage;
}

StageDefinition DeploymentPipelineBuilder::deployStage() const {
    StageDefinition stage;
    stage.name = "deploy-staging";
    stage.description = "Replace " + settings_.deploy_name + " with the new image";
    stage.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        settings_.settle_interval + settings_.deploy_health_timeout + CONTAINER_OVERHEAD);
    stage.resources = {{"container", settings_.deploy_name}, {"port", std::to_string(settings_.deploy_port)}};
    stage.work = [this](StageExecution& execution) {
        const Deploy::DeploymentTarget target = manager_->deploy(
            settings_.deploy_name, execution.context.artifact(ARTIFACT_IMAGE), settings_.deploy_port,
            &execution.token);
        execution.context.setArtifact(ARTIFACT_TARGET_URL, target.url());
        return WorkResult::success("", "deployed at " + target.url());
    };
    return stage;
}

PostActions DeploymentPipelineBuilder::postActions() const {
    PostActions post;
    post.on_success = {"notify-success", [this](RunContext& context, const RunOutcome& outcome) {
        sendNotification(Notify::NotificationKind::SUCCESS, context, outcome);
    }};
    post.on_failure = {"notify-failure", [this](RunContext& context, const RunOutcome& outcome) {
        sendNotification(Notify::NotificationKind::FAILURE, context, outcome);
    }};
    post.always = {"cleanup", [this](RunContext& context, const RunOutcome&) {
        if (settings_.prune_images) {
            const Deploy::RuntimeResult pruned = services_.runtime.pruneDanglingImages();
            if (!pruned.ok) {
                LOG_WARN("cleanup", "Image prune failed: " + context.redact(pruned.output));
            }
        }
        context.wipeCredentials();
        LOG_INFO("cleanup", "Run resources released");
    }};
    return post;
}

std::shared_ptr<Notify::NotificationTransport> DeploymentPipelineBuilder::makeTransport(RunContext& context) const {
    if (services_.transport) {
        return services_.transport;
    }
    if (settings_.notify_transport != "smtp") {
        return std::make_shared<Notify::LogTransport>();
    }
    
    Notify::SmtpTransport::Config smtp;
    smtp.url = settings_.smtp_url;
    smtp.sender = settings_.sender;
    if (!settings_.smtp_credential.empty()) {
        const Credential& credential = context.resolveCredential(services_.credentials, settings_.smtp_credential);
        smtp.username = credential.username();
        smtp.password = credential.password();
    }
    return std::make_shared<Notify::SmtpTransport>(smtp);
}

void DeploymentPipelineBuilder::sendNotification(Notify::NotificationKind kind, RunContext& context,
                                                 const RunOutcome& outcome) const {
    if (!settings_.notify) {
        LOG_INFO("notifier", "Notifications disabled");
        return;
    }
    
    std::shared_ptr<Notify::NotificationTransport> transport;
    try {
        transport = makeTransport(context);
    } catch (const CredentialNotFoundError& e) {
        context.addWarning(ErrorKind::NOTIFICATION_DISPATCH_FAILED, "notifier", e.what());
        return;
    }
    
    const Notify::NotificationEvent event = Notify::buildNotificationEvent(
        kind, context, outcome, context.artifact(ARTIFACT_IMAGE), context.artifact(ARTIFACT_TARGET_URL),
        settings_.recipients);
    Notify::Notifier(transport).notify(event, context);
}

} // namespace Orchestrator
} // namespace CDP
