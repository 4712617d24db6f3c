// EN: In-memory doubles for the container runtime, liveness probe, clock and notification transport
// FR: Doublures en mémoire du runtime de conteneurs, de la sonde, de l'horloge et du transport de notification

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "deploy/container_runtime.hpp"
#include "deploy/health_gate.hpp"
#include "notify/notifier.hpp"

namespace CDP {
namespace Testing {

// EN: Tracks image tags and containers the way a local daemon would
// FR: Suit les tags d'images et les conteneurs comme le ferait un démon local
class FakeContainerRuntime : public Deploy::ContainerRuntime {
public:
    Deploy::RuntimeResult buildImage(const Deploy::BuildContext& context, const CancellationToken*) override {
        calls.push_back("build " + context.directory);
        if (fail_build) {
            return Deploy::RuntimeResult::failure("Step 3/7 : RUN pip install failed", 1);
        }
        return Deploy::RuntimeResult::success(next_image_id, "Successfully built");
    }
    
    std::optional<std::string> imageIdOf(const std::string& reference) override {
        auto it = images.find(reference);
        if (it == images.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    
    Deploy::RuntimeResult tagImage(const std::string& source, const std::string& target) override {
        calls.push_back("tag " + target);
        if (fail_tag_targets.count(target) > 0) {
            return Deploy::RuntimeResult::failure("tag refused");
        }
        auto it = images.find(source);
        images[target] = it != images.end() ? it->second : source;
        return Deploy::RuntimeResult::success();
    }
    
    Deploy::RuntimeResult removeImageTag(const std::string& reference) override {
        calls.push_back("untag " + reference);
        images.erase(reference);
        return Deploy::RuntimeResult::success();
    }
    
    Deploy::RuntimeResult pruneDanglingImages() override {
        calls.push_back("prune");
        return fail_prune ? Deploy::RuntimeResult::failure("prune refused") : Deploy::RuntimeResult::success();
    }
    
    Deploy::RuntimeResult login(const std::string& registry, const std::string& username,
                                const std::string& password) override {
        calls.push_back("login " + username);
        ++logins;
        last_registry = registry;
        last_password = password;
        if (fail_login) {
            return Deploy::RuntimeResult::failure("unauthorized: incorrect username or password");
        }
        return Deploy::RuntimeResult::success();
    }
    
    Deploy::RuntimeResult logout(const std::string&) override {
        calls.push_back("logout");
        ++logouts;
        return Deploy::RuntimeResult::success();
    }
    
    Deploy::RuntimeResult pushImage(const std::string& reference, const CancellationToken*) override {
        calls.push_back("push " + reference);
        if (fail_push.count(reference) > 0) {
            return Deploy::RuntimeResult::failure("denied: requested access to the resource is denied");
        }
        pushed.push_back(reference);
        return Deploy::RuntimeResult::success();
    }
    
    Deploy::RuntimeResult runContainer(const Deploy::InstanceSpec& spec) override {
        calls.push_back("run " + spec.name);
        if (fail_run) {
            return Deploy::RuntimeResult::failure("port is already allocated", 125);
        }
        if (containers.count(spec.name) > 0) {
            return Deploy::RuntimeResult::failure("Conflict. The container name is already in use", 125);
        }
        const std::string id = "cid-" + spec.name + "-" + std::to_string(++containers_started);
        containers[spec.name] = Deploy::ContainerState{id, spec.image, true};
        started.push_back(spec);
        return Deploy::RuntimeResult::success(id);
    }
    
    std::optional<Deploy::ContainerState> inspectContainer(const std::string& name) override {
        auto it = containers.find(name);
        if (it == containers.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    
    Deploy::RuntimeResult stopContainer(const std::string& name) override {
        calls.push_back("stop " + name);
        auto it = containers.find(name);
        if (it == containers.end()) {
            return Deploy::RuntimeResult::failure("No such container: " + name);
        }
        it->second.running = false;
        return Deploy::RuntimeResult::success();
    }
    
    Deploy::RuntimeResult removeContainer(const std::string& name) override {
        calls.push_back("rm " + name);
        if (containers.erase(name) == 0) {
            return Deploy::RuntimeResult::failure("No such container: " + name);
        }
        return Deploy::RuntimeResult::success();
    }
    
    size_t countCalls(const std::string& prefix) const {
        size_t count = 0;
        for (const auto& call : calls) {
            if (call.rfind(prefix, 0) == 0) ++count;
        }
        return count;
    }
    
    // EN: State and failure switches
    // FR: État et commutateurs d'échec
    std::map<std::string, std::string> images;                  // EN: reference -> image id / FR: référence -> id d'image
    std::map<std::string, Deploy::ContainerState> containers;   // EN: name -> state / FR: nom -> état
    std::vector<std::string> calls;
    std::vector<std::string> pushed;
    std::vector<Deploy::InstanceSpec> started;
    std::string next_image_id = "sha256:new";
    std::string last_registry;
    std::string last_password;
    std::set<std::string> fail_tag_targets;
    std::set<std::string> fail_push;
    bool fail_build = false;
    bool fail_login = false;
    bool fail_run = false;
    bool fail_prune = false;
    int logins = 0;
    int logouts = 0;
    int containers_started = 0;
};

// EN: Probe answering through a replaceable handler; 200 by default
// FR: Sonde répondant via un handler remplaçable ; 200 par défaut
class FakeHealthProbe : public Deploy::HealthProbe {
public:
    HttpResponse probe(const std::string& url) override {
        urls.push_back(url);
        if (handler) {
            return handler(url);
        }
        HttpResponse response;
        response.status = 200;
        return response;
    }
    
    static HttpResponse status(long code) {
        HttpResponse response;
        response.status = code;
        return response;
    }
    
    std::function<HttpResponse(const std::string&)> handler;
    std::vector<std::string> urls;
};

// EN: Manual clock advanced only by the sleeper
// FR: Horloge manuelle avancée uniquement par l'attente
struct FakeClock {
    std::chrono::steady_clock::time_point now{};
    std::vector<std::chrono::milliseconds> sleeps;
    
    Deploy::HealthGate::Clock clock() {
        return [this]() { return now; };
    }
    
    Deploy::HealthGate::Sleeper sleeper() {
        return [this](std::chrono::milliseconds duration) {
            sleeps.push_back(duration);
            now += duration;
        };
    }
};

// EN: Keeps every message; throws when asked to
// FR: Conserve chaque message ; lève à la demande
class RecordingTransport : public Notify::NotificationTransport {
public:
    std::string name() const override { return "recording"; }
    
    void send(const Notify::RenderedMessage& message) override {
        if (fail) {
            throw std::runtime_error("relay refused connection");
        }
        sent.push_back(message);
    }
    
    std::vector<Notify::RenderedMessage> sent;
    bool fail = false;
};

} // namespace Testing
} // namespace CDP
