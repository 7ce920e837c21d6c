// =================================================================
// include/DiffLens/Logger.hpp
// =================================================================
// Header for console and rotating-file logging.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace DiffLens {

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
 * @brief Process-wide logger writing to the console and a rotating log file.
 *
 * Safe to call from the watcher, timer and HTTP threads concurrently.
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
    void initialize(const std::string& log_dir = ".difflens/logs",
                    size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                    size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable the log file; tests run without one.
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of one diff parse
     * @param label Human-readable range label
     * @param file_count Number of files in the response
     * @param duration_ms Parse duration in milliseconds
     */
    void logDiffParsed(const std::string& label, size_t file_count, long duration_ms);

    /**
     * @brief Log the filtering verdict for one filesystem event
     * @param root Watch root the event arrived on
     * @param path Event path
     * @param verdict Why it was kept or dropped
     */
    void logWatchEvent(const std::string& root, const std::string& path, const std::string& verdict);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parses "debug", "info", "warning", "error" or "critical".
     * @return The level, or INFO for anything else.
     */
    static LogLevel levelFromString(const std::string& name);

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
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    std::recursive_mutex m_mutex;

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
    DiffLens::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    DiffLens::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    DiffLens::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    DiffLens::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    DiffLens::Logger::getInstance().critical(component, message)

} // namespace DiffLens
