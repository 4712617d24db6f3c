// EN: Image build with all-or-nothing tagging, and publication through a scoped registry session
// FR: Construction d'image avec tagging tout-ou-rien, et publication via une session de registre bornée

#pragma once

#include <string>
#include <vector>

#include "deploy/container_runtime.hpp"
#include "orchestrator/credential_store.hpp"

namespace CDP {
namespace Deploy {

// EN: Registry-qualified, tagged identifier of a built image
// FR: Identifiant qualifié par registre et tagué d'une image construite
struct ImageReference {
    std::string registry;                   // EN: Empty means the default registry / FR: Vide signifie le registre par défaut
    std::string repository;
    std::vector<std::string> tags;          // EN: Run-specific tags first, floating tag last / FR: Tags d'exécution d'abord, tag flottant en dernier
    std::string image_id;
    
    // EN: "registry/repository" or "repository"
    // FR: "registre/dépôt" ou "dépôt"
    std::string name() const { return registry.empty() ? repository : registry + "/" + repository; }
    std::string qualified(const std::string& tag) const { return name() + ":" + tag; }
    
    // EN: Qualified reference of the first (run-specific) tag
    // FR: Référence qualifiée du premier tag (propre à l'exécution)
    std::string primary() const { return tags.empty() ? name() : qualified(tags.front()); }
};

// EN: Authenticated registry session, logged out on destruction on every exit path
// FR: Session de registre authentifiée, déconnectée à la destruction sur tous les chemins de sortie
class RegistrySession {
public:
    // EN: Throws PublishFailedError when authentication fails.
    // FR: Lève PublishFailedError si l'authentification échoue.
    RegistrySession(ContainerRuntime& runtime, std::string registry, const Orchestrator::Credential& credential);
    ~RegistrySession();
    
    RegistrySession(const RegistrySession&) = delete;
    RegistrySession& operator=(const RegistrySession&) = delete;
    
    const std::string& registry() const { return registry_; }

private:
    ContainerRuntime& runtime_;
    std::string registry_;
};

class ImageBuilder {
public:
    ImageBuilder(ContainerRuntime& runtime, std::string registry, std::string repository,
                 std::string floating_tag = "latest");
    
    // EN: Builds once, then points every tag at the new image. Throws BuildFailedError;
    //     on failure no tag is left pointing at a new or partial image.
    // FR: Construit une fois, puis pointe chaque tag vers la nouvelle image. Lève BuildFailedError ;
    //     en cas d'échec aucun tag ne reste pointé vers une image nouvelle ou partielle.
    ImageReference build(const BuildContext& context, const std::vector<std::string>& tags,
                         const CancellationToken* token = nullptr);
    
    // EN: Pushes tags in order inside a RegistrySession. Throws PublishFailedError naming
    //     pushed and unpushed tags; pushed tags stay in the registry.
    // FR: Pousse les tags dans l'ordre dans une RegistrySession. Lève PublishFailedError en nommant
    //     les tags poussés et non poussés ; les tags poussés restent dans le registre.
    void publish(const ImageReference& image, const Orchestrator::Credential& credential,
                 const CancellationToken* token = nullptr);
    
    // EN: Requested tags ordered with the floating tag last, duplicates removed
    // FR: Tags demandés ordonnés avec le tag flottant en dernier, doublons retirés
    std::vector<std::string> orderTags(const std::vector<std::string>& tags) const;
    
    const std::string& floatingTag() const { return floating_tag_; }

private:
    ContainerRuntime& runtime_;
    std::string registry_;
    std::string repository_;
    std::string floating_tag_;
};

} // namespace Deploy
} // namespace CDP
