// EN: Implementation of the Logger class. Thread-safe NDJSON logging with correlation IDs and secret masking.
// FR: Implémentation de la classe Logger. Logging NDJSON thread-safe avec IDs de corrélation et masquage des secrets.

#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

#include <nlohmann/json.hpp>

namespace CDP {

namespace {

const char* const kMaskReplacement = "****";

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

// EN: Destructor ensures all logs are flushed.
// FR: Le destructeur assure que tous les logs sont vidés.
Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

// EN: Set output file and disable console output. Returns false if the file cannot be opened.
// FR: Définit le fichier de sortie et désactive la console. Retourne false si le fichier ne peut être ouvert.
bool Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->close();
    }
    log_file_ = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!log_file_->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        log_file_.reset();
        console_output_ = true;
        return false;
    }
    console_output_ = false;
    return true;
}

void Logger::resetOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
        log_file_->close();
        log_file_.reset();
    }
    console_output_ = true;
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_[key] = value;
}

// EN: Masks are kept longest first so a secret containing another one is replaced whole.
// FR: Les masques sont triés du plus long au plus court pour remplacer un secret englobant en entier.
void Logger::addSecretMask(const std::string& secret) {
    if (secret.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(secret_masks_.begin(), secret_masks_.end(), secret) != secret_masks_.end()) {
        return;
    }
    secret_masks_.push_back(secret);
    std::sort(secret_masks_.begin(), secret_masks_.end(),
              [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

void Logger::clearSecretMasks() {
    std::lock_guard<std::mutex> lock(mutex_);
    secret_masks_.clear();
}

std::string Logger::mask(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maskUnlocked(text);
}

std::string Logger::maskUnlocked(const std::string& text) const {
    std::string result = text;
    for (const auto& secret : secret_masks_) {
        size_t pos = 0;
        while ((pos = result.find(secret, pos)) != std::string::npos) {
            result.replace(pos, secret.size(), kMaskReplacement);
            pos += std::char_traits<char>::length(kMaskReplacement);
        }
    }
    return result;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    log(level, module, message, {});
}

// EN: Log message with specified level and metadata.
// FR: Enregistre un message avec le niveau spécifié et des métadonnées.
void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const std::unordered_map<std::string, std::string>& metadata) {
    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) {
            return;
        }
        entry.correlation_id = correlation_id_;
        entry.metadata = metadata;
        for (const auto& [key, value] : global_metadata_) {
            if (entry.metadata.find(key) == entry.metadata.end()) {
                entry.metadata[key] = value;
            }
        }
    }
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.message = message;
    entry.module = module;
    entry.thread_id = getThreadId();
    
    writeEntry(entry);
}

void Logger::debug(const std::string& module, const std::string& message) {
    log(LogLevel::DEBUG, module, message);
}

void Logger::info(const std::string& module, const std::string& message) {
    log(LogLevel::INFO, module, message);
}

void Logger::warn(const std::string& module, const std::string& message) {
    log(LogLevel::WARN, module, message);
}

void Logger::error(const std::string& module, const std::string& message) {
    log(LogLevel::ERROR, module, message);
}

void Logger::debug(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::DEBUG, module, message, metadata);
}

void Logger::info(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::INFO, module, message, metadata);
}

void Logger::warn(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::WARN, module, message, metadata);
}

void Logger::error(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::ERROR, module, message, metadata);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
    }
    if (console_output_) {
        std::cout.flush();
    }
}

// EN: Generate a UUID-like correlation ID for run tracing.
// FR: Génère un ID de corrélation similaire à UUID pour le traçage des exécutions.
std::string Logger::generateCorrelationId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    
    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << "-";
        }
        ss << dis(gen);
    }
    return ss.str();
}

LogLevel Logger::parseLevel(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

// EN: Write log entry to configured output (file or console), masking secrets first.
// FR: Écrit l'entrée de log vers la sortie configurée (fichier ou console), après masquage des secrets.
void Logger::writeEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogEntry masked = entry;
    masked.message = maskUnlocked(entry.message);
    for (auto& [key, value] : masked.metadata) {
        value = maskUnlocked(value);
    }
    std::string ndjson = formatAsNDJSON(masked);
    
    if (log_file_ && log_file_->is_open()) {
        *log_file_ << ndjson << std::endl;
    }
    
    if (console_output_) {
        std::cout << ndjson << std::endl;
    }
}

std::string Logger::formatAsNDJSON(const LogEntry& entry) const {
    nlohmann::json json;
    json["timestamp"] = timestampToISO8601(entry.timestamp);
    json["level"] = levelToString(entry.level);
    json["message"] = entry.message;
    json["module"] = entry.module;
    json["thread_id"] = entry.thread_id;
    
    if (!entry.correlation_id.empty()) {
        json["correlation_id"] = entry.correlation_id;
    }
    
    for (const auto& [key, value] : entry.metadata) {
        if (!json.contains(key)) {
            json[key] = value;
        }
    }
    
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

std::string Logger::timestampToISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

std::string Logger::getThreadId() {
    std::ostringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

} // namespace CDP
