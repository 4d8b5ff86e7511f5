// =================================================================
// include/Rewind/Logger.hpp
// =================================================================
// Header for logging and audit trails of patch operations.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Rewind {

struct UndoResult;
struct IntegrityReport;

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;
    
    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Logging system for debugging and audit trails
 * 
 * Provides structured logging to the console and to rotating log files.
 * Every public method may be called from any thread.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".rewind/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a captured file operation
     * @param operation_type Operation that produced the patch
     * @param file_path Affected file
     * @param patch_number Number assigned to the patch
     */
    void logCapture(const std::string& operation_type, const std::string& file_path, int patch_number);

    /**
     * @brief Log the outcome of an undo request
     * @param request Short description of the request (e.g. "last 3")
     * @param result Result returned to the caller
     */
    void logUndoResult(const std::string& request, const UndoResult& result);

    /**
     * @brief Log the outcome of an integrity pass
     * @param session_id Session that was validated
     * @param report Integrity report
     */
    void logIntegrityReport(const std::string& session_id, const IntegrityReport& report);

    /**
     * @brief Log retention enforcement
     * @param reason Limit that triggered eviction (count, size, age)
     * @param removed_count Number of evicted patches
     */
    void logRetention(const std::string& reason, size_t removed_count);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Parse a level name ("debug", "info", ...)
     * @param name Level name, case insensitive
     * @param fallback Level returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    Logger() = default;
    ~Logger();
    
    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_initialized = false;
    
    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    std::recursive_mutex m_mutex;

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);
    void initializeLocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files);
    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Rewind::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Rewind::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Rewind::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Rewind::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Rewind::Logger::getInstance().critical(component, message)

} // namespace Rewind
