// EN: Command line parsing for cdpctl: subcommand, typed options and configuration overrides
// FR: Analyse de la ligne de commande de cdpctl : sous-commande, options typées et surcharges de configuration

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace CDP {
namespace CLI {

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Invalid option provided / FR: Option invalide fournie
    MISSING_VALUE,          // EN: Required value missing / FR: Valeur requise manquante
    INVALID_COMMAND         // EN: Unknown or missing subcommand / FR: Sous-commande inconnue ou absente
};

// EN: CLI option definition structure
// FR: Structure de définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                          // EN: Long option name without dashes / FR: Nom d'option long sans tirets
    std::optional<char> short_name;
    bool takes_value = true;                        // EN: false for flags / FR: false pour les drapeaux
    std::string value_name = "VALUE";               // EN: Placeholder shown in help / FR: Libellé affiché dans l'aide
    std::string description;
    std::string config_path;                        // EN: "section.key" overridden by the value, empty for none / FR: "section.clé" surchargée par la valeur
};

// EN: CLI parsing result containing the subcommand, parsed options and status
// FR: Résultat d'analyse CLI contenant la sous-commande, les options et le statut
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::string command;
    std::map<std::string, std::string> values;      // EN: long_name -> raw value ("true" for flags) / FR: long_name -> valeur brute
    std::map<std::string, std::string> overrides;   // EN: config_path -> raw value / FR: config_path -> valeur brute
    std::vector<std::string> errors;
    
    bool ok() const { return status == CliParseStatus::SUCCESS; }
    bool has(const std::string& name) const { return values.count(name) > 0; }
    std::string get(const std::string& name, const std::string& default_value = "") const {
        auto it = values.find(name);
        return it != values.end() ? it->second : default_value;
    }
};

class CliParser {
public:
    CliParser(std::string program_name, std::vector<std::string> commands);
    
    void addOption(const CliOptionDefinition& option);
    
    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;
    
    // EN: Writes every override into the configuration, typed like YAML scalars. Returns the count.
    // FR: Écrit chaque surcharge dans la configuration, typée comme un scalaire YAML. Retourne le nombre.
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);
    
    std::string generateHelpText() const;
    void setVersionInfo(const std::string& version) { version_ = version; }
    std::string generateVersionText() const;

private:
    const CliOptionDefinition* find(const std::string& long_name) const;
    const CliOptionDefinition* findShort(char short_name) const;
    
    std::string program_name_;
    std::vector<std::string> commands_;
    std::vector<CliOptionDefinition> options_;
    std::string version_ = "0.0.0";
};

} // namespace CLI
} // namespace CDP
