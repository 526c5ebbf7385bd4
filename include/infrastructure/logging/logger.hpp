#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>

namespace VPR {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
// FR: Analyse "debug", "info", "warn"/"warning" ou "error" (insensible à la casse).
std::optional<LogLevel> parseLogLevel(const std::string& value);

// EN: Singleton logger with NDJSON output. Console output goes to stderr so that
//     normalized records written to stdout are never interleaved with log lines.
// FR: Logger singleton avec sortie NDJSON. La sortie console va vers stderr pour que
//     les enregistrements écrits sur stdout ne soient jamais mélangés aux logs.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string run_id;
        std::string module;
        std::unordered_map<std::string, std::string> metadata;
    };

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const { return current_level_; }

    // EN: Set output file for logging (disables console output). Returns false if the file cannot be opened.
    // FR: Définit le fichier de sortie (désactive la sortie console). Retourne false si le fichier ne peut être ouvert.
    bool setOutputFile(const std::string& filename);

    // EN: Redirect console output to another stream (tests capture logs this way).
    // FR: Redirige la sortie console vers un autre flux (les tests capturent les logs ainsi).
    void setConsoleStream(std::ostream& stream);

    // EN: Restore console output on stderr and close any log file.
    // FR: Restaure la sortie console sur stderr et ferme le fichier de log.
    void resetOutput();

    // EN: Set run ID attached to all subsequent entries.
    // FR: Définit l'ID d'exécution attaché à toutes les entrées suivantes.
    void setRunId(const std::string& run_id);

    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

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

    void flush();

    // EN: Generate a new run ID (UUID-like format).
    // FR: Génère un nouvel ID d'exécution (format UUID).
    std::string generateRunId();

    // EN: Format log entry as a single NDJSON line.
    // FR: Formate l'entrée de log en une ligne NDJSON.
    static std::string formatAsNDJSON(const LogEntry& entry);

    static std::string levelToString(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);

    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);

    LogLevel current_level_ = LogLevel::INFO;
    std::string run_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    std::ostream* console_ = nullptr;
    std::mutex mutex_;
    bool console_output_ = true;
};

#define LOG_DEBUG(module, message) VPR::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) VPR::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) VPR::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) VPR::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) VPR::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) VPR::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) VPR::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) VPR::Logger::getInstance().error(module, message, metadata)

} // namespace VPR
