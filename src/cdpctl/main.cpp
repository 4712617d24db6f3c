// EN: cdpctl entry point: loads configuration, assembles the deployment pipeline and runs or plans it
// FR: Point d'entrée de cdpctl : charge la configuration, assemble le pipeline de déploiement et l'exécute ou le planifie

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "deploy/container_runtime.hpp"
#include "deploy/health_gate.hpp"
#include "infrastructure/cli/cli_parser.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/deployment_pipeline.hpp"
#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_utils.hpp"

#ifndef CDP_VERSION
#define CDP_VERSION "1.0.0"
#endif

namespace {

constexpr int EXIT_CONFIG_ERROR = 2;

CDP::CLI::CliParser makeParser() {
    CDP::CLI::CliParser parser("cdpctl", {"run", "plan"});
    parser.setVersionInfo(CDP_VERSION);
    parser.addOption({"config", 'c', true, "FILE", "Pipeline configuration (YAML)", ""});
    parser.addOption({"build-number", std::nullopt, true, "N", "Run identifier (default: $BUILD_NUMBER or local)", ""});
    parser.addOption({"branch", std::nullopt, true, "NAME", "Branch (default: $BRANCH_NAME or local)", ""});
    parser.addOption({"revision", std::nullopt, true, "SHA", "Source revision (default: $GIT_COMMIT or unknown)", ""});
    parser.addOption({"build-url", std::nullopt, true, "URL", "Link to this run (default: $BUILD_URL)", "pipeline.build_url"});
    parser.addOption({"report", std::nullopt, true, "FILE", "Write the run outcome as JSON", ""});
    parser.addOption({"log-file", std::nullopt, true, "FILE", "Write NDJSON logs to a file instead of stdout", "logging.file"});
    parser.addOption({"log-level", std::nullopt, true, "LEVEL", "DEBUG, INFO, WARN or ERROR", "logging.level"});
    return parser;
}

// EN: Load file, environment and command line layers, then validate. Prints errors to stderr.
// FR: Charge les couches fichier, environnement et ligne de commande, puis valide. Erreurs sur stderr.
bool loadConfiguration(const CDP::CLI::CliParseResult& args, CDP::ConfigManager& config) {
    config.reset();
    if (args.has("config") && !config.loadFromFile(args.get("config"))) {
        std::cerr << "cdpctl: cannot load configuration " << args.get("config") << std::endl;
        return false;
    }
    config.loadEnvironmentOverrides("CDP_");
    CDP::CLI::CliParser::applyOverrides(args, config);
    
    config.addValidationRules(CDP::Orchestrator::DeploymentSettings::validationRules());
    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            std::cerr << "cdpctl: " << error << std::endl;
        }
        return false;
    }
    return true;
}

bool configureLogging(const CDP::ConfigManager& config) {
    auto& logger = CDP::Logger::getInstance();
    logger.setLogLevel(CDP::Logger::parseLevel(config.getString("logging", "level", "INFO")));
    const std::string file = config.getString("logging", "file");
    if (!file.empty() && !logger.setOutputFile(file)) {
        std::cerr << "cdpctl: cannot open log file " << file << std::endl;
        return false;
    }
    logger.addGlobalMetadata("service", "cdpctl");
    return true;
}

CDP::Orchestrator::BuildMetadata resolveMetadata(const CDP::CLI::CliParseResult& args,
                                                  const CDP::Orchestrator::DeploymentSettings& settings) {
    auto metadata = CDP::Orchestrator::RunContext::metadataFromEnvironment(settings.project);
    metadata.run_id = args.get("build-number", metadata.run_id);
    metadata.branch = args.get("branch", metadata.branch);
    metadata.revision = args.get("revision", metadata.revision);
    if (!settings.build_url.empty()) {
        metadata.build_url = settings.build_url;
    }
    return metadata;
}

void printFailureDiagnostics(const CDP::Orchestrator::RunOutcome& outcome) {
    const auto* failed = outcome.failedStage();
    if (failed == nullptr) {
        return;
    }
    std::cout << "\nStage " << failed->stage << " failed: " << failed->message << "\n";
    if (!failed->output.empty()) {
        std::cout << "---- output of " << failed->stage << " (tail) ----\n"
                  << failed->output;
        if (failed->output.back() != '\n') {
            std::cout << "\n";
        }
        std::cout << "----\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace CDP;
    using namespace CDP::Orchestrator;
    
    const CLI::CliParser parser = makeParser();
    const CLI::CliParseResult args = parser.parse(argc, argv);
    switch (args.status) {
        case CLI::CliParseStatus::HELP_REQUESTED:
            std::cout << parser.generateHelpText();
            return 0;
        case CLI::CliParseStatus::VERSION_REQUESTED:
            std::cout << parser.generateVersionText() << std::endl;
            return 0;
        case CLI::CliParseStatus::SUCCESS:
            break;
        default:
            for (const auto& error : args.errors) {
                std::cerr << "cdpctl: " << error << std::endl;
            }
            std::cerr << parser.generateHelpText();
            return EXIT_CONFIG_ERROR;
    }
    
    auto& config = ConfigManager::getInstance();
    if (!loadConfiguration(args, config) || !configureLogging(config)) {
        return EXIT_CONFIG_ERROR;
    }
    const DeploymentSettings settings = DeploymentSettings::fromConfig(config);
    const BuildMetadata metadata = resolveMetadata(args, settings);
    
    CredentialStore credentials;
    if (!settings.credentials_file.empty() && !credentials.loadFromFile(settings.credentials_file)) {
        std::cerr << "cdpctl: cannot load credentials file " << settings.credentials_file << std::endl;
        return EXIT_CONFIG_ERROR;
    }
    
    PosixProcessRunner process_runner;
    Deploy::DockerCliRuntime::Config runtime_config;
    runtime_config.push_timeout = settings.push_timeout;
    Deploy::DockerCliRuntime runtime(process_runner, runtime_config);
    Deploy::HttpHealthProbe probe;
    
    DeploymentServices services{runtime, process_runner, credentials, probe, nullptr};
    DeploymentPipelineBuilder builder(settings, services);
    const Pipeline pipeline = builder.build(metadata);
    
    if (args.command == "plan") {
        std::cout << PipelineUtils::formatPlan(pipeline);
        return 0;
    }
    
    RunContext context(metadata);
    
    // EN: SIGINT/SIGTERM cancel the run; the in-flight stage unwinds through its own cleanup.
    // FR: SIGINT/SIGTERM annulent l'exécution ; l'étape en cours se termine via son propre nettoyage.
    auto& signals = SignalHandler::getInstance();
    signals.initialize();
    const CancellationToken token = context.cancellationToken();
    signals.registerCallback("cancel-run", [token](int signal_number) {
        LOG_WARN("cdpctl", "Signal " + std::to_string(signal_number) + " received, cancelling run");
        token.cancel();
    });
    
    PipelineOrchestrator orchestrator;
    const RunOutcome outcome = orchestrator.run(pipeline, context);
    
    signals.unregisterCallback("cancel-run");
    signals.shutdown();
    
    std::cout << "\n" << PipelineUtils::formatRunSummary(outcome);
    printFailureDiagnostics(outcome);
    
    const std::string report = args.get("report");
    if (!report.empty() && !PipelineUtils::writeJsonReport(outcome, report)) {
        std::cerr << "cdpctl: cannot write report " << report << std::endl;
    }
    Logger::getInstance().flush();
    return outcome.exitCode();
}
