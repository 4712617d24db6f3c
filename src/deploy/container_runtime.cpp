// EN: Docker CLI runtime: each operation is one docker invocation through the process runner
// FR: Runtime Docker CLI : chaque opération est une invocation docker via le lanceur de processus

#include "deploy/container_runtime.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace CDP {
namespace Deploy {

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// EN: Temporary file removed on scope exit
// FR: Fichier temporaire supprimé en sortie de portée
class TempFile {
public:
    TempFile() {
        const char* tmpdir = std::getenv("TMPDIR");
        std::string pattern = std::string(tmpdir != nullptr ? tmpdir : "/tmp") + "/cdp-iid-XXXXXX";
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        const int fd = mkstemp(buffer.data());
        if (fd >= 0) {
            close(fd);
            path_ = buffer.data();
        }
    }
    ~TempFile() {
        if (!path_.empty()) {
            std::remove(path_.c_str());
        }
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    
    const std::string& path() const { return path_; }
    
    std::string read() const {
        std::ifstream file(path_);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return trim(buffer.str());
    }

private:
    std::string path_;
};

} // namespace

DockerCliRuntime::DockerCliRuntime(ProcessRunner& runner) : DockerCliRuntime(runner, Config()) {}

DockerCliRuntime::DockerCliRuntime(ProcessRunner& runner, Config config)
    : runner_(runner), config_(std::move(config)) {}

ProcessResult DockerCliRuntime::invoke(std::vector<std::string> args, std::chrono::milliseconds timeout,
                                       const CancellationToken* token,
                                       std::optional<std::string> stdin_data) {
    ProcessSpec spec;
    spec.argv.reserve(args.size() + 1);
    spec.argv.push_back(config_.binary);
    for (auto& arg : args) {
        spec.argv.push_back(std::move(arg));
    }
    spec.timeout = timeout;
    spec.stdin_data = std::move(stdin_data);
    
    LOG_DEBUG("docker", joinCommandLine(spec.argv));
    ProcessResult result = runner_.run(spec, token);
    if (!result.succeeded()) {
        LOG_DEBUG("docker", "exit " + std::to_string(result.exit_code) + ": " + trim(result.stderr_text));
    }
    return result;
}

RuntimeResult DockerCliRuntime::toResult(const ProcessResult& result, std::string value) {
    RuntimeResult out;
    out.ok = result.succeeded();
    out.exit_code = result.exit_code;
    out.output = result.combinedOutput();
    if (result.timed_out) {
        out.output += "\n[timed out]";
    } else if (result.cancelled) {
        out.output += "\n[cancelled]";
    }
    if (out.ok) {
        out.value = std::move(value);
    }
    return out;
}

RuntimeResult DockerCliRuntime::buildImage(const BuildContext& context, const CancellationToken* token) {
    TempFile iid_file;
    if (iid_file.path().empty()) {
        return RuntimeResult::failure("cannot create image id file");
    }
    
    std::vector<std::string> args = {"build", "--iidfile", iid_file.path()};
    if (!context.dockerfile.empty()) {
        args.push_back("-f");
        args.push_back(context.dockerfile);
    }
    for (const auto& [key, value] : context.build_args) {
        args.push_back("--build-arg");
        args.push_back(key + "=" + value);
    }
    args.push_back(context.directory);
    
    const ProcessResult result = invoke(std::move(args), context.timeout, token);
    return toResult(result, result.succeeded() ? iid_file.read() : "");
}

std::optional<std::string> DockerCliRuntime::imageIdOf(const std::string& reference) {
    const ProcessResult result = invoke({"image", "inspect", "--format", "{{.Id}}", reference},
                                        config_.command_timeout);
    if (!result.succeeded()) {
        return std::nullopt;
    }
    const std::string id = trim(result.stdout_text);
    if (id.empty()) {
        return std::nullopt;
    }
    return id;
}

RuntimeResult DockerCliRuntime::tagImage(const std::string& source, const std::string& target) {
    return toResult(invoke({"tag", source, target}, config_.command_timeout));
}

RuntimeResult DockerCliRuntime::removeImageTag(const std::string& reference) {
    return toResult(invoke({"image", "rm", "--no-prune", reference}, config_.command_timeout));
}

RuntimeResult DockerCliRuntime::pruneDanglingImages() {
    return toResult(invoke({"image", "prune", "-f"}, config_.command_timeout));
}

RuntimeResult DockerCliRuntime::login(const std::string& registry, const std::string& username,
                                      const std::string& password) {
    std::vector<std::string> args = {"login", "-u", username, "--password-stdin"};
    if (!registry.empty()) {
        args.push_back(registry);
    }
    return toResult(invoke(std::move(args), config_.command_timeout, nullptr, password));
}

RuntimeResult DockerCliRuntime::logout(const std::string& registry) {
    std::vector<std::string> args = {"logout"};
    if (!registry.empty()) {
        args.push_back(registry);
    }
    return toResult(invoke(std::move(args), config_.command_timeout));
}

RuntimeResult DockerCliRuntime::pushImage(const std::string& reference, const CancellationToken* token) {
    return toResult(invoke({"push", reference}, config_.push_timeout, token));
}

RuntimeResult DockerCliRuntime::runContainer(const InstanceSpec& spec) {
    std::vector<std::string> args = {"run", "-d", "--name", spec.name};
    if (spec.host_port > 0) {
        const int container_port = spec.container_port > 0 ? spec.container_port : spec.host_port;
        args.push_back("-p");
        args.push_back(std::to_string(spec.host_port) + ":" + std::to_string(container_port));
    }
    if (!spec.restart_policy.empty()) {
        args.push_back("--restart");
        args.push_back(spec.restart_policy);
    }
    for (const auto& [key, value] : spec.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    args.push_back(spec.image);
    
    const ProcessResult result = invoke(std::move(args), config_.command_timeout);
    return toResult(result, trim(result.stdout_text));
}

std::optional<ContainerState> DockerCliRuntime::inspectContainer(const std::string& name) {
    const ProcessResult result = invoke(
        {"container", "inspect", "--format", "{{.Id}}|{{.Config.Image}}|{{.State.Running}}", name},
        config_.command_timeout);
    if (!result.succeeded()) {
        return std::nullopt;
    }
    
    const std::string line = trim(result.stdout_text);
    const auto first = line.find('|');
    const auto second = line.rfind('|');
    if (first == std::string::npos || first == second) {
        LOG_WARN("docker", "Unexpected inspect output for " + name + ": " + line);
        return std::nullopt;
    }
    ContainerState state;
    state.id = line.substr(0, first);
    state.image = line.substr(first + 1, second - first - 1);
    state.running = line.substr(second + 1) == "true";
    return state;
}

RuntimeResult DockerCliRuntime::stopContainer(const std::string& name) {
    return toResult(invoke({"stop", name}, config_.command_timeout));
}

RuntimeResult DockerCliRuntime::removeContainer(const std::string& name) {
    return toResult(invoke({"rm", name}, config_.command_timeout));
}

} // namespace Deploy
} // namespace CDP
