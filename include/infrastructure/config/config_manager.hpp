#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace CDP {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;
    
    ConfigValue() = default;
    ConfigValue(bool value) : value_(value) {}
    ConfigValue(int value) : value_(value) {}
    ConfigValue(double value) : value_(value) {}
    ConfigValue(const char* value) : value_(std::string(value)) {}
    ConfigValue(const std::string& value) : value_(value) {}
    ConfigValue(const std::vector<std::string>& value) : value_(value) {}
    
    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) throw std::runtime_error("ConfigValue is empty");
        const T* typed = std::get_if<T>(&*value_);
        if (!typed) throw std::runtime_error("ConfigValue type mismatch");
        return *typed;
    }
    
    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) return std::nullopt;
        const T* typed = std::get_if<T>(&*value_);
        if (!typed) return std::nullopt;
        return *typed;
    }
    
    // EN: Get value as specific type or return default if missing or type mismatch.
    // FR: Obtient la valeur comme type spécifique ou retourne défaut si absente ou type incorrect.
    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }
    
    bool isValid() const { return value_.has_value(); }
    
    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;
    
private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;
    
    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    
    // EN: Merge another section into this one.
    // FR: Fusionne une autre section dans celle-ci.
    void merge(const ConfigSection& other, bool overwrite = true);
    
private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing, environment overrides and validation.
// FR: Gestionnaire de configuration principal avec parsing YAML, surcharges d'environnement et validation.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values ("section.key").
    // FR: Structure de règle de validation pour les valeurs de configuration ("section.key").
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };
    
    static ConfigManager& getInstance();
    
    // EN: Load configuration from YAML file (replaces current sections).
    // FR: Charge la configuration depuis un fichier YAML (remplace les sections actuelles).
    bool loadFromFile(const std::string& filename);
    
    // EN: Load configuration from YAML string (replaces current sections).
    // FR: Charge la configuration depuis une chaîne YAML (remplace les sections actuelles).
    bool loadFromString(const std::string& yaml_content);
    
    bool saveToFile(const std::string& filename) const;
    
    // EN: Apply PREFIX_SECTION_KEY=value environment overrides to known sections.
    // FR: Applique les surcharges d'environnement PREFIX_SECTION_KEY=valeur aux sections connues.
    size_t loadEnvironmentOverrides(const std::string& prefix = "CDP_");
    
    void addValidationRules(const std::vector<ValidationRule>& rules);
    
    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;
    
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);
    
    // EN: Typed lookups falling back to a default value.
    // FR: Lectures typées avec repli sur une valeur par défaut.
    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_value = "") const;
    int getInt(const std::string& section, const std::string& key, int default_value) const;
    bool getBool(const std::string& section, const std::string& key, bool default_value) const;
    std::vector<std::string> getList(const std::string& section, const std::string& key) const;
    
    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;
    
    // EN: Reset all configuration data and validation rules.
    // FR: Remet à zéro toutes les données de configuration et les règles.
    void reset();
    
    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;
    
    // EN: Type a plain text value the way an unquoted YAML scalar is typed ("8080" -> int).
    // FR: Type une valeur texte comme un scalaire YAML non quoté ("8080" -> int).
    static ConfigValue parseScalarText(const std::string& text);
    
private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    
    bool loadNode(const YAML::Node& yaml);
    ConfigValue lookupUnlocked(const std::string& section, const std::string& key) const;
    bool validateValue(const std::string& key, const ConfigValue& value, 
                      const ValidationRule& rule, std::string& error) const;
    std::string expandVariables(const std::string& value) const;
    ConfigValue parseYamlValue(const YAML::Node& node) const;
    
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

#define CONFIG_GET(section, key) CDP::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(section, key, value) CDP::ConfigManager::getInstance().set(section, key, CDP::ConfigValue(value))

} // namespace CDP
