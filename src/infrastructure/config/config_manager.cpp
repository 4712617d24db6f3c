// EN: Implementation of the ConfigManager class. YAML configuration parsing, environment overrides and validation.
// FR: Implémentation de la classe ConfigManager. Parsing YAML, surcharges d'environnement et validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

extern char** environ;

namespace CDP {

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }
    
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void ConfigSection::merge(const ConfigSection& other, bool overwrite) {
    for (const auto& [key, value] : other.values_) {
        if (overwrite || !has(key)) {
            set(key, value);
        }
    }
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }
    
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (!loadNode(yaml)) {
            LOG_ERROR("config", "Configuration root must be a map: " + filename);
            return false;
        }
        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (!loadNode(yaml)) {
            LOG_ERROR("config", "Configuration root must be a map");
            return false;
        }
        LOG_DEBUG("config", "Configuration loaded from string");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

// EN: Each top-level map becomes a section; a top-level scalar becomes section.value.
// FR: Chaque map de premier niveau devient une section ; un scalaire devient section.value.
bool ConfigManager::loadNode(const YAML::Node& yaml) {
    if (yaml.IsNull()) {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.clear();
        return true;
    }
    if (!yaml.IsMap()) {
        return false;
    }
    
    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;
        
        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else if (!section.second.IsNull()) {
            config_section.set("value", parseYamlValue(section.second));
        }
        
        loaded[section_name] = config_section;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(loaded);
    return true;
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }
    if (node.IsScalar()) {
        // EN: Quoted scalars stay strings ("5000" is a string, 5000 an int).
        // FR: Les scalaires entre guillemets restent des chaînes.
        if (node.Tag() == "!") {
            return ConfigValue(expandVariables(node.as<std::string>()));
        }
        return parseScalarText(expandVariables(node.as<std::string>()));
    }
    return ConfigValue();
}

ConfigValue ConfigManager::parseScalarText(const std::string& text) {
    if (text == "true" || text == "false") {
        return ConfigValue(text == "true");
    }
    
    if (!text.empty() && text.find_first_not_of("-0123456789") == std::string::npos &&
        text.find('-', 1) == std::string::npos && text != "-") {
        try {
            size_t consumed = 0;
            int int_val = std::stoi(text, &consumed);
            if (consumed == text.size()) {
                return ConfigValue(int_val);
            }
        } catch (const std::exception&) {
            // EN: Out of range for int, keep as string.
            // FR: Hors limites pour int, conservé en chaîne.
        }
        return ConfigValue(text);
    }
    
    if (!text.empty() && text.find_first_not_of("-+.0123456789eE") == std::string::npos &&
        text.find('.') != std::string::npos) {
        try {
            size_t consumed = 0;
            double double_val = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return ConfigValue(double_val);
            }
        } catch (const std::exception&) {
        }
    }
    
    return ConfigValue(text);
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    try {
        YAML::Emitter emitter;
        emitter << YAML::BeginMap;
        
        for (const auto& [section_name, section] : sections_) {
            emitter << YAML::Key << section_name;
            emitter << YAML::Value << YAML::BeginMap;
            
            for (const std::string& key : section.keys()) {
                ConfigValue value = section.get(key);
                emitter << YAML::Key << key << YAML::Value;
                
                if (auto bool_val = value.tryAs<bool>()) {
                    emitter << *bool_val;
                } else if (auto int_val = value.tryAs<int>()) {
                    emitter << *int_val;
                } else if (auto double_val = value.tryAs<double>()) {
                    emitter << *double_val;
                } else if (auto str_val = value.tryAs<std::string>()) {
                    emitter << *str_val;
                } else if (auto array_val = value.tryAs<std::vector<std::string>>()) {
                    emitter << YAML::BeginSeq;
                    for (const auto& item : *array_val) {
                        emitter << item;
                    }
                    emitter << YAML::EndSeq;
                } else {
                    emitter << YAML::Null;
                }
            }
            
            emitter << YAML::EndMap;
        }
        
        emitter << YAML::EndMap;
        
        std::ofstream file(filename);
        if (!file) {
            LOG_ERROR("config", "Cannot open configuration file for writing: " + filename);
            return false;
        }
        file << emitter.c_str();
        return static_cast<bool>(file);
        
    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to save configuration: " + std::string(e.what()));
        return false;
    }
}

// EN: CDP_DEPLOY_PORT=8080 overrides deploy.port. The section is the first segment after the prefix.
// FR: CDP_DEPLOY_PORT=8080 surcharge deploy.port. La section est le premier segment après le préfixe.
size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    size_t applied = 0;
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        if (entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string name = entry.substr(prefix.size(), eq - prefix.size());
        std::string raw_value = entry.substr(eq + 1);
        auto sep = name.find('_');
        if (sep == std::string::npos || sep == 0 || sep + 1 >= name.size()) {
            continue;
        }
        
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string section = name.substr(0, sep);
        std::string key = name.substr(sep + 1);
        
        ConfigValue value;
        if (raw_value.find(',') != std::string::npos) {
            std::vector<std::string> items;
            std::stringstream ss(raw_value);
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (!item.empty()) items.push_back(item);
            }
            value = ConfigValue(items);
        } else {
            value = parseScalarText(raw_value);
        }
        
        set(section, key, value);
        LOG_INFO("config", "Environment override applied: " + section + "." + key);
        ++applied;
    }
    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();
    
    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ? 
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ? 
            rule.key.substr(dot_pos + 1) : rule.key;
        
        ConfigValue value = lookupUnlocked(section_name, key_name);
        
        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }
        
        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }
    
    return errors.empty();
}

ConfigValue ConfigManager::lookupUnlocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookupUnlocked(section, key);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

std::string ConfigManager::getString(const std::string& section, const std::string& key,
                                     const std::string& default_value) const {
    ConfigValue value = get(section, key);
    if (!value.isValid()) {
        return default_value;
    }
    if (auto str = value.tryAs<std::string>()) {
        return *str;
    }
    return value.toString();
}

int ConfigManager::getInt(const std::string& section, const std::string& key, int default_value) const {
    ConfigValue value = get(section, key);
    if (auto int_val = value.tryAs<int>()) {
        return *int_val;
    }
    if (auto str = value.tryAs<std::string>()) {
        try {
            return std::stoi(*str);
        } catch (const std::exception&) {
            LOG_WARN("config", "Ignoring non-numeric value for " + section + "." + key);
        }
    }
    return default_value;
}

bool ConfigManager::getBool(const std::string& section, const std::string& key, bool default_value) const {
    ConfigValue value = get(section, key);
    if (auto bool_val = value.tryAs<bool>()) {
        return *bool_val;
    }
    if (auto str = value.tryAs<std::string>()) {
        if (*str == "1" || *str == "yes" || *str == "on") return true;
        if (*str == "0" || *str == "no" || *str == "off") return false;
    }
    return default_value;
}

std::vector<std::string> ConfigManager::getList(const std::string& section, const std::string& key) const {
    ConfigValue value = get(section, key);
    if (auto list = value.tryAs<std::vector<std::string>>()) {
        return *list;
    }
    if (auto str = value.tryAs<std::string>()) {
        return {*str};
    }
    return {};
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

void ConfigManager::setSection(const std::string& section, const ConfigSection& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section] = config;
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::vector<std::string> names = getSectionNames();
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::ostringstream oss;
    for (const auto& section_name : names) {
        const auto& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value, 
                                 const ValidationRule& rule, std::string& error) const {
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }
    
    if ((rule.type == "int" || rule.type == "double") && 
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }
        
        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }
    
    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }
    
    return true;
}

// EN: Expand ${VAR} references; unknown variables are left as-is.
// FR: Étend les références ${VAR} ; les variables inconnues sont laissées telles quelles.
std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();
    size_t last = 0;
    
    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        result.append(value, last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        result += env_value ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result.append(value, last, std::string::npos);
    return result;
}

} // namespace CDP
