// EN: Named credential resolution and secret redaction for pipeline runs
// FR: Résolution de credentials nommés et masquage des secrets pour les exécutions du pipeline

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "orchestrator/pipeline_errors.hpp"

namespace CDP {
namespace Orchestrator {

// EN: A resolved credential. The id is display-safe, every field value is secret.
// FR: Un credential résolu. L'id est affichable, chaque valeur de champ est secrète.
struct Credential {
    std::string id;
    std::map<std::string, std::string> fields;
    
    std::string username() const { return field("username"); }
    std::string password() const { return field("password"); }
    
    std::string field(const std::string& name) const {
        auto it = fields.find(name);
        return it != fields.end() ? it->second : std::string();
    }
    
    // EN: Non-empty field values, the literals to scrub from any output
    // FR: Valeurs de champs non vides, les littéraux à effacer de toute sortie
    std::vector<std::string> secretValues() const;
};

// EN: Replaces every known secret literal with "****"
// FR: Remplace chaque littéral secret connu par "****"
class SecretRedactor {
public:
    static constexpr const char* MASK = "****";
    
    void addSecret(const std::string& secret);
    void addSecrets(const std::vector<std::string>& secrets);
    
    // EN: Longest secrets are replaced first so overlapping values leave no fragment behind.
    // FR: Les secrets les plus longs sont remplacés d'abord pour ne laisser aucun fragment.
    std::string redact(const std::string& text) const;
    
    size_t size() const { return secrets_.size(); }
    void clear() { secrets_.clear(); }

private:
    std::vector<std::string> secrets_;
};

// EN: Credential sources, consulted in order: explicit registrations, the YAML
//     credentials file, then NAME_USR / NAME_PSW environment bindings.
// FR: Sources de credentials, consultées dans l'ordre : enregistrements explicites,
//     fichier YAML de credentials, puis variables d'environnement NAME_USR / NAME_PSW.
class CredentialStore {
public:
    CredentialStore() = default;
    
    void registerCredential(const Credential& credential);
    
    // EN: Load a YAML map of name -> {field: value}. Returns false on read or parse error.
    // FR: Charge une map YAML nom -> {champ: valeur}. Retourne false en cas d'erreur.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);
    
    bool has(const std::string& name) const;
    
    // EN: Throws CredentialNotFoundError. Resolved secrets are masked in the logger and,
    //     when given, registered with the redactor.
    // FR: Lève CredentialNotFoundError. Les secrets résolus sont masqués dans le logger et,
    //     si fourni, enregistrés dans le redacteur.
    Credential resolve(const std::string& name, SecretRedactor* redactor = nullptr) const;
    
    void clear();
    
    // EN: "docker-hub-credentials" -> "DOCKER_HUB_CREDENTIALS"
    // FR: "docker-hub-credentials" -> "DOCKER_HUB_CREDENTIALS"
    static std::string environmentPrefix(const std::string& name);

private:
    std::optional<Credential> fromEnvironment(const std::string& name) const;
    
    mutable std::mutex mutex_;
    std::map<std::string, Credential> registered_;
    std::map<std::string, Credential> file_entries_;
};

} // namespace Orchestrator
} // namespace CDP
