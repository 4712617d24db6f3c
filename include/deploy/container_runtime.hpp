// EN: Container runtime seam: image build/tag/push and container lifecycle, with a Docker CLI implementation
// FR: Interface de runtime de conteneurs : build/tag/push d'images et cycle de vie, avec implémentation Docker CLI

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/system/cancellation.hpp"
#include "infrastructure/system/process_runner.hpp"

namespace CDP {
namespace Deploy {

// EN: Outcome of one runtime command. value carries the command's product (image id, container id).
// FR: Résultat d'une commande du runtime. value porte le produit de la commande (id d'image, de conteneur).
struct RuntimeResult {
    bool ok = false;
    int exit_code = -1;
    std::string value;
    std::string output;
    
    static RuntimeResult success(std::string value = "", std::string output = "") {
        return RuntimeResult{true, 0, std::move(value), std::move(output)};
    }
    static RuntimeResult failure(std::string output, int exit_code = 1) {
        return RuntimeResult{false, exit_code, "", std::move(output)};
    }
};

// EN: Directory and Dockerfile producing one image
// FR: Répertoire et Dockerfile produisant une image
struct BuildContext {
    std::string directory = ".";
    std::string dockerfile;                         // EN: Empty uses <directory>/Dockerfile / FR: Vide utilise <directory>/Dockerfile
    std::map<std::string, std::string> build_args;
    std::chrono::milliseconds timeout{0};
};

// EN: Container to start
// FR: Conteneur à démarrer
struct InstanceSpec {
    std::string name;
    std::string image;
    int host_port = 0;
    int container_port = 0;
    std::string restart_policy;                     // EN: Empty means runtime default / FR: Vide signifie valeur par défaut
    std::map<std::string, std::string> environment;
};

struct ContainerState {
    std::string id;
    std::string image;
    bool running = false;
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;
    
    // EN: Image operations
    // FR: Opérations sur les images
    virtual RuntimeResult buildImage(const BuildContext& context, const CancellationToken* token) = 0;
    virtual std::optional<std::string> imageIdOf(const std::string& reference) = 0;
    virtual RuntimeResult tagImage(const std::string& source, const std::string& target) = 0;
    virtual RuntimeResult removeImageTag(const std::string& reference) = 0;
    virtual RuntimeResult pruneDanglingImages() = 0;
    
    // EN: Registry operations; the password never reaches argv
    // FR: Opérations de registre ; le mot de passe n'atteint jamais argv
    virtual RuntimeResult login(const std::string& registry, const std::string& username,
                                const std::string& password) = 0;
    virtual RuntimeResult logout(const std::string& registry) = 0;
    virtual RuntimeResult pushImage(const std::string& reference, const CancellationToken* token) = 0;
    
    // EN: Container lifecycle
    // FR: Cycle de vie des conteneurs
    virtual RuntimeResult runContainer(const InstanceSpec& spec) = 0;
    virtual std::optional<ContainerState> inspectContainer(const std::string& name) = 0;
    virtual RuntimeResult stopContainer(const std::string& name) = 0;
    virtual RuntimeResult removeContainer(const std::string& name) = 0;
};

// EN: Runtime driving the docker command line through a ProcessRunner
// FR: Runtime pilotant la ligne de commande docker via un ProcessRunner
class DockerCliRuntime : public ContainerRuntime {
public:
    struct Config {
        std::string binary = "docker";
        std::chrono::milliseconds command_timeout{60000};   // EN: Non-build, non-push commands / FR: Commandes hors build et push
        std::chrono::milliseconds push_timeout{0};
    };
    
    explicit DockerCliRuntime(ProcessRunner& runner);
    DockerCliRuntime(ProcessRunner& runner, Config config);
    
    RuntimeResult buildImage(const BuildContext& context, const CancellationToken* token) override;
    std::optional<std::string> imageIdOf(const std::string& reference) override;
    RuntimeResult tagImage(const std::string& source, const std::string& target) override;
    RuntimeResult removeImageTag(const std::string& reference) override;
    RuntimeResult pruneDanglingImages() override;
    
    RuntimeResult login(const std::string& registry, const std::string& username,
                        const std::string& password) override;
    RuntimeResult logout(const std::string& registry) override;
    RuntimeResult pushImage(const std::string& reference, const CancellationToken* token) override;
    
    RuntimeResult runContainer(const InstanceSpec& spec) override;
    std::optional<ContainerState> inspectContainer(const std::string& name) override;
    RuntimeResult stopContainer(const std::string& name) override;
    RuntimeResult removeContainer(const std::string& name) override;

private:
    ProcessResult invoke(std::vector<std::string> args, std::chrono::milliseconds timeout,
                         const CancellationToken* token = nullptr,
                         std::optional<std::string> stdin_data = std::nullopt);
    static RuntimeResult toResult(const ProcessResult& result, std::string value = "");
    
    ProcessRunner& runner_;
    Config config_;
};

} // namespace Deploy
} // namespace CDP
