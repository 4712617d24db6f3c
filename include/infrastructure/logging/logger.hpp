#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace CDP {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Thread-safe singleton logger with NDJSON output, correlation IDs and secret masking.
// FR: Logger singleton thread-safe avec sortie NDJSON, IDs de corrélation et masquage des secrets.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static Logger& getInstance();
    
    // EN: Set the minimum log level.
    // FR: Définit le niveau de log minimum.
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    
    // EN: Set output file for logging (disables console output).
    // FR: Définit le fichier de sortie (désactive la sortie console).
    bool setOutputFile(const std::string& filename);

    // EN: Re-enable console output and close any output file.
    // FR: Réactive la sortie console et ferme le fichier de sortie.
    void resetOutput();
    
    // EN: Set correlation ID for all subsequent log entries.
    // FR: Définit l'ID de corrélation pour toutes les entrées suivantes.
    void setCorrelationId(const std::string& correlation_id);
    
    // EN: Add global metadata that will be included in all log entries.
    // FR: Ajoute des métadonnées globales incluses dans toutes les entrées.
    void addGlobalMetadata(const std::string& key, const std::string& value);

    // EN: Register a literal secret that must never reach the output; replaced by "****".
    // FR: Enregistre un secret littéral qui ne doit jamais atteindre la sortie ; remplacé par "****".
    void addSecretMask(const std::string& secret);
    void clearSecretMasks();

    // EN: Apply the registered secret masks to a string.
    // FR: Applique les masques de secrets enregistrés à une chaîne.
    std::string mask(const std::string& text) const;
    
    // EN: Log a message with specified level.
    // FR: Enregistre un message avec le niveau spécifié.
    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message, 
             const std::unordered_map<std::string, std::string>& metadata);
    
    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);
    
    void debug(const std::string& module, const std::string& message, 
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message, 
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message, 
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message, 
               const std::unordered_map<std::string, std::string>& metadata);
    
    // EN: Flush all pending log entries to output.
    // FR: Vide toutes les entrées en attente vers la sortie.
    void flush();
    
    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Format a log entry as one NDJSON line (public for tests).
    // FR: Formate une entrée de log en une ligne NDJSON (public pour les tests).
    std::string formatAsNDJSON(const LogEntry& entry) const;

    // EN: Parse a textual level ("debug", "INFO", ...); defaults to INFO.
    // FR: Parse un niveau textuel ("debug", "INFO", ...) ; INFO par défaut.
    static LogLevel parseLevel(const std::string& level);

private:
    Logger() = default;
    ~Logger();
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    void writeEntry(const LogEntry& entry);
    std::string maskUnlocked(const std::string& text) const;
    static std::string levelToString(LogLevel level);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string getThreadId();
    
    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::vector<std::string> secret_masks_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define LOG_DEBUG(module, message) CDP::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) CDP::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) CDP::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) CDP::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) CDP::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) CDP::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) CDP::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) CDP::Logger::getInstance().error(module, message, metadata)

} // namespace CDP
