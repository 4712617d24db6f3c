#include "deploy/image_builder.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/pipeline_errors.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace CDP {
namespace Deploy {

using Orchestrator::BuildFailedError;
using Orchestrator::PublishFailedError;

RegistrySession::RegistrySession(ContainerRuntime& runtime, std::string registry,
                                 const Orchestrator::Credential& credential)
    : runtime_(runtime), registry_(std::move(registry)) {
    const std::string target = registry_.empty() ? "default registry" : registry_;
    const RuntimeResult result = runtime_.login(registry_, credential.username(), credential.password());
    if (!result.ok) {
        throw PublishFailedError("Registry authentication failed for " + target + " with credential " +
                                 credential.id + ": " + result.output);
    }
    LOG_INFO("registry", "Logged in to " + target + " as credential " + credential.id);
}

RegistrySession::~RegistrySession() {
    const RuntimeResult result = runtime_.logout(registry_);
    if (!result.ok) {
        LOG_WARN("registry", "Logout failed: " + result.output);
        return;
    }
    LOG_INFO("registry", "Logged out of " + (registry_.empty() ? std::string("default registry") : registry_));
}

ImageBuilder::ImageBuilder(ContainerRuntime& runtime, std::string registry, std::string repository,
                           std::string floating_tag)
    : runtime_(runtime),
      registry_(std::move(registry)),
      repository_(std::move(repository)),
      floating_tag_(std::move(floating_tag)) {}

std::vector<std::string> ImageBuilder::orderTags(const std::vector<std::string>& tags) const {
    std::vector<std::string> ordered;
    bool has_floating = false;
    for (const auto& tag : tags) {
        if (tag.empty() || std::find(ordered.begin(), ordered.end(), tag) != ordered.end()) {
            continue;
        }
        if (tag == floating_tag_) {
            has_floating = true;
            continue;
        }
        ordered.push_back(tag);
    }
    if (has_floating) {
        ordered.push_back(floating_tag_);
    }
    return ordered;
}

ImageReference ImageBuilder::build(const BuildContext& context, const std::vector<std::string>& tags,
                                   const CancellationToken* token) {
    ImageReference image;
    image.registry = registry_;
    image.repository = repository_;
    image.tags = orderTags(tags);
    if (image.tags.empty() || image.tags.front() == floating_tag_) {
        throw BuildFailedError("Build of " + image.name() + " requires a run-specific tag");
    }
    
    LOG_INFO("image_builder", "Building " + image.name() + " from " + context.directory);
    const RuntimeResult built = runtime_.buildImage(context, token);
    if (!built.ok || built.value.empty()) {
        throw BuildFailedError("Build of " + image.name() + " failed: " + built.output);
    }
    image.image_id = built.value;
    
    // EN: Record where each tag pointed so a partial tagging can be undone.
    // FR: Mémorise la cible de chaque tag pour pouvoir annuler un tagging partiel.
    std::vector<std::pair<std::string, std::optional<std::string>>> applied;
    for (const auto& tag : image.tags) {
        const std::string reference = image.qualified(tag);
        std::optional<std::string> previous = runtime_.imageIdOf(reference);
        const RuntimeResult tagged = runtime_.tagImage(image.image_id, reference);
        if (!tagged.ok) {
            LOG_ERROR("image_builder", "Tagging " + reference + " failed, restoring previous tags");
            for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
                const RuntimeResult restored = it->second ? runtime_.tagImage(*it->second, it->first)
                                                          : runtime_.removeImageTag(it->first);
                if (!restored.ok) {
                    LOG_ERROR("image_builder", "Could not restore " + it->first + ": " + restored.output);
                }
            }
            throw BuildFailedError("Tagging " + reference + " failed: " + tagged.output);
        }
        applied.emplace_back(reference, std::move(previous));
    }
    
    LOG_INFO_META("image_builder", "Built " + image.primary(),
                  (std::unordered_map<std::string, std::string>{
                      {"image_id", image.image_id},
                      {"tags", std::to_string(image.tags.size())}}));
    return image;
}

void ImageBuilder::publish(const ImageReference& image, const Orchestrator::Credential& credential,
                           const CancellationToken* token) {
    RegistrySession session(runtime_, image.registry, credential);
    
    std::vector<std::string> pushed;
    for (size_t i = 0; i < image.tags.size(); ++i) {
        const std::string reference = image.qualified(image.tags[i]);
        if (token != nullptr && token->isCancelled()) {
            std::vector<std::string> unpushed(image.tags.begin() + static_cast<long>(i), image.tags.end());
            throw PublishFailedError("Publish of " + image.name() + " cancelled before " + reference,
                                     pushed, unpushed);
        }
        LOG_INFO("image_builder", "Pushing " + reference);
        const RuntimeResult result = runtime_.pushImage(reference, token);
        if (!result.ok) {
            std::vector<std::string> unpushed(image.tags.begin() + static_cast<long>(i), image.tags.end());
            std::string message = "Push of " + reference + " failed";
            if (!pushed.empty()) {
                message += "; already in registry:";
                for (const auto& tag : pushed) {
                    message += " " + tag;
                }
            }
            throw PublishFailedError(message + ": " + result.output, pushed, unpushed);
        }
        pushed.push_back(image.tags[i]);
    }
    LOG_INFO("image_builder", "Published " + std::to_string(pushed.size()) + " tag(s) of " + image.name());
}

} // namespace Deploy
} // namespace CDP
