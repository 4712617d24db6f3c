// EN: End-to-end tests of the standard deployment pipeline over in-memory collaborators
// FR: Tests de bout en bout du pipeline de déploiement standard sur des collaborateurs en mémoire

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/deployment_pipeline.hpp"
#include "orchestrator/pipeline_utils.hpp"
#include "test_fakes.hpp"

using namespace CDP;
using namespace CDP::Orchestrator;
using CDP::Testing::FakeClock;
using CDP::Testing::FakeContainerRuntime;
using CDP::Testing::FakeHealthProbe;
using CDP::Testing::RecordingTransport;

class DeploymentPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        // EN: Registry credential registered explicitly, no environment fallback
        // FR: Credential du registre enregistré explicitement, sans repli sur l'environnement
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        unsetenv("DOCKER_HUB_CREDENTIALS_USR");
        unsetenv("DOCKER_HUB_CREDENTIALS_PSW");
        credentials_.registerCredential(Credential{"docker-hub-credentials",
                                                   {{"username", "ci-bot"}, {"password", "hub-s3cret"}}});
        transport_ = std::make_shared<RecordingTransport>();
        
        settings_.repository = "acme/telco-churn-prediction";
        settings_.recipients = {"mlops@example.com"};
        settings_.gates = {{"code-quality", "true"}, {"unit-tests", "true"}};
    }
    
    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }
    
    std::unique_ptr<DeploymentPipelineBuilder> makeBuilder() {
        DeploymentServices services{runtime_, runner_, credentials_, probe_, transport_,
                                    clock_.clock(), clock_.sleeper()};
        return std::make_unique<DeploymentPipelineBuilder>(settings_, services);
    }
    
    RunOutcome runPipeline() {
        auto builder = makeBuilder();
        Pipeline pipeline = builder->build(context_.metadata());
        return orchestrator_.run(pipeline, context_);
    }
    
    static std::vector<std::string> stageNames(const RunOutcome& outcome) {
        std::vector<std::string> names;
        for (const auto& stage : outcome.stages) {
            names.push_back(stage.stage);
        }
        return names;
    }
    
    FakeContainerRuntime runtime_;
    PosixProcessRunner runner_;
    CredentialStore credentials_;
    FakeHealthProbe probe_;
    FakeClock clock_;
    std::shared_ptr<RecordingTransport> transport_;
    DeploymentSettings settings_;
    PipelineOrchestrator orchestrator_;
    RunContext context_{BuildMetadata{"telco-churn-prediction", "57", "main", "a1b2c3d",
                                      "https://ci.example.com/job/telco/57", ""}};
};

TEST_F(DeploymentPipelineTest, FullRunBuildsPublishesAndDeploys) {
    RunOutcome outcome = runPipeline();
    
    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(stageNames(outcome), (std::vector<std::string>{"code-quality", "unit-tests", "build-image",
                                                             "test-image", "push-image", "deploy-staging"}));
    EXPECT_EQ(outcome.hooks_run, (std::vector<std::string>{"notify-success", "cleanup"}));
    
    EXPECT_EQ(context_.artifact(DeploymentPipelineBuilder::ARTIFACT_IMAGE), "acme/telco-churn-prediction:57");
    EXPECT_EQ(context_.artifact(DeploymentPipelineBuilder::ARTIFACT_IMAGE_ID), "sha256:new");
    EXPECT_EQ(context_.artifact(DeploymentPipelineBuilder::ARTIFACT_TARGET_URL), "http://localhost:5000");
    EXPECT_EQ(context_.metadata().image_tag, "57");
    
    EXPECT_EQ(runtime_.pushed, (std::vector<std::string>{"acme/telco-churn-prediction:57",
                                                         "acme/telco-churn-prediction:latest"}));
    EXPECT_EQ(runtime_.last_password, "hub-s3cret");
    EXPECT_EQ(runtime_.logouts, 1);
    EXPECT_EQ(runtime_.countCalls("prune"), 1u);
    
    // EN: The disposable test instance is gone, the staging instance stays
    // FR: L'instance de test jetable a disparu, l'instance de staging reste
    EXPECT_EQ(runtime_.containers.count("telco-churn-prediction-test-57"), 0u);
    ASSERT_EQ(runtime_.containers.count("telco-churn-staging"), 1u);
    EXPECT_TRUE(runtime_.containers["telco-churn-staging"].running);
    EXPECT_EQ(probe_.urls.front(), "http://localhost:5001/health");
    EXPECT_EQ(probe_.urls.back(), "http://localhost:5000/health");
    
    ASSERT_EQ(transport_->sent.size(), 1u);
    EXPECT_EQ(transport_->sent[0].subject, "SUCCESS: telco-churn-prediction #57 deployed");
    EXPECT_NE(transport_->sent[0].body.find("Target:    http://localhost:5000"), std::string::npos);
    EXPECT_EQ(transport_->sent[0].recipients, settings_.recipients);
}

TEST_F(DeploymentPipelineTest, FailingGateSkipsEverythingAfterIt) {
    settings_.gates = {{"code-quality", "true"}, {"unit-tests", "echo 'assertion failed'; exit 1"}};
    
    RunOutcome outcome = runPipeline();
    
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.exitCode(), 1);
    ASSERT_EQ(outcome.stages.size(), 6u);
    EXPECT_TRUE(outcome.stages[0].succeeded());
    EXPECT_TRUE(outcome.stages[1].failed());
    EXPECT_EQ(outcome.stages[1].exit_code, 1);
    EXPECT_EQ(outcome.stages[1].message, "gate command exited with status 1");
    EXPECT_NE(outcome.stages[1].output.find("assertion failed"), std::string::npos);
    for (size_t i = 2; i < outcome.stages.size(); ++i) {
        EXPECT_TRUE(outcome.stages[i].skipped()) << outcome.stages[i].stage;
    }
    
    EXPECT_EQ(runtime_.countCalls("build"), 0u);
    EXPECT_EQ(outcome.hooks_run, (std::vector<std::string>{"notify-failure", "cleanup"}));
    ASSERT_EQ(transport_->sent.size(), 1u);
    EXPECT_EQ(transport_->sent[0].subject, "FAILURE: telco-churn-prediction #57 failed");
    EXPECT_NE(transport_->sent[0].body.find("  - unit-tests: FAILED (WorkFailed)"), std::string::npos);
    EXPECT_NE(transport_->sent[0].body.find("Image:     n/a"), std::string::npos);
}

TEST_F(DeploymentPipelineTest, MissingRegistryCredentialFailsPush) {
    credentials_.clear();
    
    RunOutcome outcome = runPipeline();
    
    EXPECT_FALSE(outcome.success);
    ASSERT_EQ(outcome.stages.size(), 6u);
    EXPECT_EQ(outcome.stages[4].stage, "push-image");
    EXPECT_TRUE(outcome.stages[4].failed());
    ASSERT_TRUE(outcome.stages[4].failure_kind.has_value());
    EXPECT_EQ(*outcome.stages[4].failure_kind, ErrorKind::CREDENTIAL_NOT_FOUND);
    EXPECT_NE(outcome.stages[4].message.find("docker-hub-credentials"), std::string::npos);
    EXPECT_TRUE(outcome.stages[5].skipped());
    EXPECT_TRUE(runtime_.pushed.empty());
    EXPECT_EQ(runtime_.logins, 0);
}

TEST_F(DeploymentPipelineTest, UnhealthyImageStopsBeforePublishing) {
    probe_.handler = [](const std::string&) { return FakeHealthProbe::status(500); };
    
    RunOutcome outcome = runPipeline();
    
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.stages[3].stage, "test-image");
    ASSERT_TRUE(outcome.stages[3].failure_kind.has_value());
    EXPECT_EQ(*outcome.stages[3].failure_kind, ErrorKind::TIMEOUT);
    EXPECT_TRUE(outcome.stages[4].skipped());
    EXPECT_TRUE(runtime_.pushed.empty());
    EXPECT_EQ(runtime_.containers.count("telco-churn-prediction-test-57"), 0u);
}

// EN: A test instance that cannot start is a work failure, not an exhausted health budget
// FR: Une instance de test qui ne démarre pas est un échec de travail, pas un budget de santé épuisé
TEST_F(DeploymentPipelineTest, TestInstanceStartFailureIsWorkFailed) {
    runtime_.fail_run = true;
    
    RunOutcome outcome = runPipeline();
    
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.stages[3].stage, "test-image");
    ASSERT_TRUE(outcome.stages[3].failure_kind.has_value());
    EXPECT_EQ(*outcome.stages[3].failure_kind, ErrorKind::WORK_FAILED);
    EXPECT_NE(outcome.stages[3].message.find("port is already allocated"), std::string::npos);
    EXPECT_TRUE(probe_.urls.empty());
    EXPECT_TRUE(outcome.stages[4].skipped());
}

TEST_F(DeploymentPipelineTest, DisabledPushAndDeployShortenThePipeline) {
    settings_.push = false;
    settings_.deploy = false;
    settings_.gates.clear();
    
    RunOutcome outcome = runPipeline();
    
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(stageNames(outcome), (std::vector<std::string>{"build-image", "test-image"}));
    EXPECT_EQ(runtime_.logins, 0);
    EXPECT_EQ(runtime_.containers.count("telco-churn-staging"), 0u);
    ASSERT_EQ(transport_->sent.size(), 1u);
    EXPECT_NE(transport_->sent[0].body.find("Target:    n/a"), std::string::npos);
}

TEST_F(DeploymentPipelineTest, CleanupWipesCredentialsAndSkipsPruneWhenDisabled) {
    settings_.prune_images = false;
    
    RunOutcome outcome = runPipeline();
    
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(runtime_.countCalls("prune"), 0u);
    EXPECT_EQ(context_.redact("token hub-s3cret"), "token ****");
}

// EN: A notification failure is a warning; the run keeps its success
// FR: Un échec de notification est un avertissement ; l'exécution reste réussie
TEST_F(DeploymentPipelineTest, NotificationFailureDoesNotFailTheRun) {
    transport_->fail = true;
    
    RunOutcome outcome = runPipeline();
    
    EXPECT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.hook_errors.empty());
    ASSERT_EQ(outcome.warnings.size(), 1u);
    EXPECT_EQ(outcome.warnings[0].kind, ErrorKind::NOTIFICATION_DISPATCH_FAILED);
}

TEST_F(DeploymentPipelineTest, DisabledNotificationsSendNothing) {
    settings_.notify = false;
    
    RunOutcome outcome = runPipeline();
    
    EXPECT_TRUE(outcome.success);
    EXPECT_TRUE(transport_->sent.empty());
    EXPECT_TRUE(outcome.warnings.empty());
}

TEST_F(DeploymentPipelineTest, PlanListsStagesAndHooks) {
    settings_.gates = {{"code-quality", "flake8 app"}};
    auto builder = makeBuilder();
    const std::string plan = PipelineUtils::formatPlan(builder->build(context_.metadata()));
    
    EXPECT_NE(plan.find("Pipeline telco-churn-prediction (5 stages)"), std::string::npos);
    EXPECT_NE(plan.find("1. code-quality  timeout=15m0s  Quality gate: flake8 app"), std::string::npos);
    EXPECT_NE(plan.find("- container: telco-churn-prediction-test-57"), std::string::npos);
    EXPECT_NE(plan.find("- credential: docker-hub-credentials"), std::string::npos);
    EXPECT_NE(plan.find("success=notify-success failure=notify-failure always=cleanup"), std::string::npos);
}

class DeploymentSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();
    }
    
    void TearDown() override {
        ConfigManager::getInstance().reset();
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }
};

TEST_F(DeploymentSettingsTest, DefaultsWithoutConfiguration) {
    DeploymentSettings settings = DeploymentSettings::fromConfig(ConfigManager::getInstance());
    
    EXPECT_EQ(settings.project, "telco-churn-prediction");
    EXPECT_TRUE(settings.gates.empty());
    EXPECT_EQ(settings.test_port, 5001);
    EXPECT_EQ(settings.deploy_port, 5000);
    EXPECT_EQ(settings.health_path, "/health");
    EXPECT_EQ(settings.settle_interval, std::chrono::seconds(10));
    EXPECT_EQ(settings.test_timeout, std::chrono::seconds(30));
    EXPECT_EQ(settings.notify_transport, "log");
    EXPECT_TRUE(settings.push);
}

TEST_F(DeploymentSettingsTest, ReadsEverySection) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
pipeline:
  name: churn-api
gates:
  names: [lint]
  commands: ["flake8 app", "pytest -q"]
  timeout_seconds: 60
image:
  registry: registry.example.com
  repository: ml/churn
registry:
  push: false
test:
  port: 6001
deploy:
  name: churn-staging
  settle_seconds: 0
notify:
  transport: smtp
  recipients: [a@example.com, b@example.com]
cleanup:
  prune_images: false
)"));
    
    DeploymentSettings settings = DeploymentSettings::fromConfig(config);
    
    EXPECT_EQ(settings.project, "churn-api");
    ASSERT_EQ(settings.gates.size(), 2u);
    EXPECT_EQ(settings.gates[0].name, "lint");
    EXPECT_EQ(settings.gates[1].name, "gate-2");
    EXPECT_EQ(settings.gates[1].command, "pytest -q");
    EXPECT_EQ(settings.gate_timeout, std::chrono::seconds(60));
    EXPECT_EQ(settings.registry, "registry.example.com");
    EXPECT_EQ(settings.repository, "ml/churn");
    EXPECT_FALSE(settings.push);
    EXPECT_EQ(settings.test_port, 6001);
    EXPECT_EQ(settings.deploy_name, "churn-staging");
    EXPECT_EQ(settings.settle_interval, std::chrono::seconds(0));
    EXPECT_EQ(settings.notify_transport, "smtp");
    EXPECT_EQ(settings.recipients.size(), 2u);
    EXPECT_FALSE(settings.prune_images);
}

TEST_F(DeploymentSettingsTest, ValidationRulesRejectBadValues) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
deploy:
  port: 70000
  settle_seconds: -1
notify:
  transport: carrier-pigeon
)"));
    config.addValidationRules(DeploymentSettings::validationRules());
    
    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.size(), 3u);
    
    config.set("deploy", "port", ConfigValue(8080));
    config.set("deploy", "settle_seconds", ConfigValue(5));
    config.set("notify", "transport", ConfigValue(std::string("smtp")));
    errors.clear();
    EXPECT_TRUE(config.validate(errors));
}
