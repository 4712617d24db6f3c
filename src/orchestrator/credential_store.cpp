// EN: Credential store implementation: explicit, YAML-file and environment sources
// FR: Implémentation du magasin de credentials : sources explicites, fichier YAML et environnement

#include "orchestrator/credential_store.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <yaml-cpp/yaml.h>

namespace CDP {
namespace Orchestrator {

std::vector<std::string> Credential::secretValues() const {
    std::vector<std::string> values;
    for (const auto& [name, value] : fields) {
        if (!value.empty()) {
            values.push_back(value);
        }
    }
    return values;
}

void SecretRedactor::addSecret(const std::string& secret) {
    if (secret.empty()) {
        return;
    }
    if (std::find(secrets_.begin(), secrets_.end(), secret) != secrets_.end()) {
        return;
    }
    secrets_.push_back(secret);
    std::stable_sort(secrets_.begin(), secrets_.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

void SecretRedactor::addSecrets(const std::vector<std::string>& secrets) {
    for (const auto& secret : secrets) {
        addSecret(secret);
    }
}

std::string SecretRedactor::redact(const std::string& text) const {
    std::string result = text;
    const std::string mask(MASK);
    for (const auto& secret : secrets_) {
        size_t pos = 0;
        while ((pos = result.find(secret, pos)) != std::string::npos) {
            result.replace(pos, secret.size(), mask);
            pos += mask.size();
        }
    }
    return result;
}

void CredentialStore::registerCredential(const Credential& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    registered_[credential.id] = credential;
}

bool CredentialStore::loadFromFile(const std::string& filename) {
    try {
        YAML::Node root = YAML::LoadFile(filename);
        return loadFromString(YAML::Dump(root));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("credentials", "Failed to read credentials file " + filename + ": " + e.what());
        return false;
    }
}

bool CredentialStore::loadFromString(const std::string& yaml_content) {
    std::map<std::string, Credential> entries;
    try {
        YAML::Node root = YAML::Load(yaml_content);
        if (!root.IsMap()) {
            LOG_ERROR("credentials", "Credentials document must be a map of names");
            return false;
        }
        for (const auto& entry : root) {
            Credential credential;
            credential.id = entry.first.as<std::string>();
            if (!entry.second.IsMap()) {
                LOG_ERROR("credentials", "Credential '" + credential.id + "' must be a map of fields");
                return false;
            }
            for (const auto& field : entry.second) {
                credential.fields[field.first.as<std::string>()] = field.second.as<std::string>();
            }
            entries[credential.id] = credential;
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("credentials", std::string("Failed to parse credentials: ") + e.what());
        return false;
    }
    
    // EN: Secrets become masked as soon as they are loaded, before any lookup can echo them.
    // FR: Les secrets sont masqués dès leur chargement, avant qu'une lecture puisse les afficher.
    for (const auto& [name, credential] : entries) {
        for (const auto& secret : credential.secretValues()) {
            Logger::getInstance().addSecretMask(secret);
        }
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, credential] : entries) {
        file_entries_[name] = std::move(credential);
    }
    LOG_INFO("credentials", "Loaded " + std::to_string(entries.size()) + " credential(s)");
    return true;
}

bool CredentialStore::has(const std::string& name) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (registered_.count(name) > 0 || file_entries_.count(name) > 0) {
            return true;
        }
    }
    return fromEnvironment(name).has_value();
}

Credential CredentialStore::resolve(const std::string& name, SecretRedactor* redactor) const {
    std::optional<Credential> found;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registered_.find(name);
        if (it != registered_.end()) {
            found = it->second;
        } else {
            auto file_it = file_entries_.find(name);
            if (file_it != file_entries_.end()) {
                found = file_it->second;
            }
        }
    }
    if (!found) {
        found = fromEnvironment(name);
    }
    if (!found) {
        LOG_ERROR("credentials", "Credential not found: " + name);
        throw CredentialNotFoundError(name);
    }
    
    const auto secrets = found->secretValues();
    for (const auto& secret : secrets) {
        Logger::getInstance().addSecretMask(secret);
    }
    if (redactor != nullptr) {
        redactor->addSecrets(secrets);
    }
    LOG_INFO("credentials", "Resolved credential " + found->id);
    return *found;
}

void CredentialStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    registered_.clear();
    file_entries_.clear();
}

std::string CredentialStore::environmentPrefix(const std::string& name) {
    std::string prefix;
    prefix.reserve(name.size());
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            prefix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        } else {
            prefix.push_back('_');
        }
    }
    return prefix;
}

std::optional<Credential> CredentialStore::fromEnvironment(const std::string& name) const {
    const std::string prefix = environmentPrefix(name);
    const char* user = std::getenv((prefix + "_USR").c_str());
    const char* password = std::getenv((prefix + "_PSW").c_str());
    if (user == nullptr && password == nullptr) {
        return std::nullopt;
    }
    Credential credential;
    credential.id = name;
    if (user != nullptr) {
        credential.fields["username"] = user;
    }
    if (password != nullptr) {
        credential.fields["password"] = password;
    }
    return credential;
}

} // namespace Orchestrator
} // namespace CDP
