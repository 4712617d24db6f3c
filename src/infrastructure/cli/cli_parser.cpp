// EN: Implementation of the cdpctl command line parser.
// FR: Implémentation de l'analyseur de ligne de commande de cdpctl.

#include "infrastructure/cli/cli_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace CDP {
namespace CLI {

CliParser::CliParser(std::string program_name, std::vector<std::string> commands)
    : program_name_(std::move(program_name)), commands_(std::move(commands)) {}

void CliParser::addOption(const CliOptionDefinition& option) {
    options_.push_back(option);
}

const CliOptionDefinition* CliParser::find(const std::string& long_name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [&long_name](const CliOptionDefinition& o) { return o.long_name == long_name; });
    return it != options_.end() ? &*it : nullptr;
}

const CliOptionDefinition* CliParser::findShort(char short_name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [short_name](const CliOptionDefinition& o) { return o.short_name == short_name; });
    return it != options_.end() ? &*it : nullptr;
}

CliParseResult CliParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult CliParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;
    
    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];
        
        if (arg == "--help" || arg == "-h") {
            result.status = CliParseStatus::HELP_REQUESTED;
            return result;
        }
        if (arg == "--version" || arg == "-v") {
            result.status = CliParseStatus::VERSION_REQUESTED;
            return result;
        }
        
        if (arg.size() < 2 || arg[0] != '-') {
            if (!result.command.empty()) {
                result.status = CliParseStatus::INVALID_COMMAND;
                result.errors.push_back("Unexpected argument: " + arg);
                return result;
            }
            result.command = arg;
            continue;
        }
        
        // EN: --name, --name=value, -n
        // FR: --nom, --nom=valeur, -n
        const CliOptionDefinition* option = nullptr;
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            std::string name = arg.substr(2);
            const auto eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
            option = find(name);
        } else if (arg.size() == 2) {
            option = findShort(arg[1]);
        }
        if (option == nullptr) {
            result.status = CliParseStatus::INVALID_OPTION;
            result.errors.push_back("Unknown option: " + arg);
            return result;
        }
        
        std::string value = "true";
        if (option->takes_value) {
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < arguments.size()) {
                value = arguments[++i];
            } else {
                result.status = CliParseStatus::MISSING_VALUE;
                result.errors.push_back("Option --" + option->long_name + " requires a value");
                return result;
            }
        } else if (inline_value) {
            result.status = CliParseStatus::INVALID_OPTION;
            result.errors.push_back("Option --" + option->long_name + " does not take a value");
            return result;
        }
        
        result.values[option->long_name] = value;
        if (!option->config_path.empty()) {
            result.overrides[option->config_path] = value;
        }
    }
    
    if (result.command.empty()) {
        result.status = CliParseStatus::INVALID_COMMAND;
        result.errors.push_back("Missing command");
    } else if (std::find(commands_.begin(), commands_.end(), result.command) == commands_.end()) {
        result.status = CliParseStatus::INVALID_COMMAND;
        result.errors.push_back("Unknown command: " + result.command);
    }
    return result;
}

size_t CliParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    size_t applied = 0;
    for (const auto& [path, value] : result.overrides) {
        const auto dot = path.find('.');
        if (dot == std::string::npos) {
            LOG_WARN("cli", "Ignoring override without section: " + path);
            continue;
        }
        config.set(path.substr(0, dot), path.substr(dot + 1), ConfigManager::parseScalarText(value));
        ++applied;
    }
    return applied;
}

std::string CliParser::generateHelpText() const {
    std::ostringstream oss;
    oss << "Usage: " << program_name_ << " COMMAND [OPTIONS]\n\n";
    oss << "Commands:\n";
    for (const auto& command : commands_) {
        oss << "  " << command << "\n";
    }
    oss << "\nOptions:\n";
    for (const auto& option : options_) {
        std::string flag = option.short_name ? std::string("-") + *option.short_name + ", " : "    ";
        flag += "--" + option.long_name;
        if (option.takes_value) {
            flag += " " + option.value_name;
        }
        oss << "  " << std::left << std::setw(30) << flag << option.description << "\n";
    }
    oss << "  " << std::left << std::setw(30) << "-h, --help" << "Show this help\n";
    oss << "  " << std::left << std::setw(30) << "-v, --version" << "Show version\n";
    return oss.str();
}

std::string CliParser::generateVersionText() const {
    return program_name_ + " " + version_;
}

} // namespace CLI
} // namespace CDP
