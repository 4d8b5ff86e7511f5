// =================================================================
// src/Rewind/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "Rewind/Logger.hpp"
#include "Rewind/PatchTypes.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace Rewind {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    initializeLocked(log_dir, max_log_size, max_log_files);
    info("Logger", "Logging system initialized", m_log_dir);
}

void Logger::initializeLocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_initialized = true;
    
    ensureLogDirectory();
    
    m_current_log_file.reset();
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logCapture(const std::string& operation_type, const std::string& file_path, int patch_number) {
    std::ostringstream context;
    context << "Patch: " << patch_number << ", ";
    context << "Operation: " << operation_type;
    
    info("PatchManager", "Captured operation on " + file_path, context.str());
}

void Logger::logUndoResult(const std::string& request, const UndoResult& result) {
    std::ostringstream context;
    context << "Request: " << request << ", ";
    context << "Reverted: " << result.reverted_files.size() << ", ";
    context << "Failed: " << result.failed_operations.size();
    
    if (result.success) {
        info("PatchManager", "Undo completed successfully", context.str());
    } else if (result.failed_operations.empty()) {
        info("PatchManager", "Nothing to undo", context.str());
    } else {
        error("PatchManager", "Undo failed", context.str());
    }
    
    for (const auto& failure : result.failed_operations) {
        debug("PatchManager", "Undo failure: " + failure);
    }
}

void Logger::logIntegrityReport(const std::string& session_id, const IntegrityReport& report) {
    std::ostringstream context;
    context << "Session: " << session_id << ", ";
    context << "Corrupted: " << report.corrupted_count << ", ";
    context << "Orphaned: " << report.orphaned_count << ", ";
    context << "Stale temp files: " << report.stale_temp_files_removed;
    
    if (report.corrupted_count == 0 && report.orphaned_count == 0) {
        debug("IntegrityCheck", "Patch storage is consistent", context.str());
        return;
    }
    
    warning("IntegrityCheck", "Quarantined inconsistent patch state", context.str());
    
    if (!report.failed_files.empty()) {
        error("IntegrityCheck", 
              "Some orphaned files could not be quarantined",
              "Files: " + std::to_string(report.failed_files.size()));
    }
}

void Logger::logRetention(const std::string& reason, size_t removed_count) {
    if (removed_count == 0) {
        return;
    }
    info("RetentionPolicy", 
         "Evicted " + std::to_string(removed_count) + " old patches",
         "Limit: " + reason);
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical" || lowered == "crit") return LogLevel::CRITICAL;
    return fallback;
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_initialized) {
        initializeLocked(".rewind/logs", m_max_log_size, m_max_log_files);
    }
    
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }
    
    std::string formatted = formatEntry(entry, true);
    if (entry.level >= LogLevel::WARNING) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }
    
    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }
    
    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline
    
    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;
    
    formatted << formatTimestamp(entry.timestamp) << " ";
    
    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";
    
    formatted << entry.component << ": ";
    formatted << entry.message;
    
    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }
    
    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }
    
    m_current_log_file.reset();
    
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;
    if (!m_current_log_file->is_open()) {
        m_current_log_file.reset();
    }
    
    // Clean up old log files
    std::error_code ec;
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(m_log_dir, ec)) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".log") {
            log_files.push_back(entry.path());
        }
    }
    
    // Newest first
    std::sort(log_files.begin(), log_files.end(),
             [](const std::filesystem::path& a, const std::filesystem::path& b) {
                 std::error_code ea, eb;
                 return std::filesystem::last_write_time(a, ea) > std::filesystem::last_write_time(b, eb);
             });
    
    for (size_t i = m_max_log_files; i < log_files.size(); i++) {
        if (!std::filesystem::remove(log_files[i], ec)) {
            std::cerr << "[WARN] Log rotation failed for " << log_files[i].string() << std::endl;
        }
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;
    
    std::tm local_tm{};
#if defined(_WIN32)
    localtime_s(&local_tm, &time_t);
#else
    localtime_r(&time_t, &local_tm);
#endif
    
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    
    return oss.str();
}

void Logger::ensureLogDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory: " << ec.message() << std::endl;
        // Fall back to current directory
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    
    std::tm local_tm{};
#if defined(_WIN32)
    localtime_s(&local_tm, &time_t);
#else
    localtime_r(&time_t, &local_tm);
#endif
    
    std::ostringstream filename;
    filename << m_log_dir << "/rewind_";
    filename << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    filename << ".log";
    
    return filename.str();
}

} // namespace Rewind
