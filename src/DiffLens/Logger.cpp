// =================================================================
// src/DiffLens/Logger.cpp
// =================================================================
// Implementation for console and rotating-file logging.

#include "DiffLens/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace DiffLens {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_initialized = true;

    if (!m_file_enabled) {
        m_current_log_file.reset();
        return;
    }

    ensureLogDirectory();

    // Create initial log file
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);

    debug("Logger", "Logging system initialized", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_enabled = enabled;
    if (!enabled) {
        m_current_log_file.reset();
    }
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

void Logger::logDiffParsed(const std::string& label, size_t file_count, long duration_ms) {
    std::ostringstream context;
    context << "Files: " << file_count << ", ";
    context << "Duration: " << duration_ms << "ms";

    info("DiffParser", "Parsed " + label, context.str());

    if (duration_ms > 5000) {
        warning("DiffParser", "Slow diff parse", "Duration: " + std::to_string(duration_ms) + "ms");
    }
}

void Logger::logWatchEvent(const std::string& root, const std::string& path, const std::string& verdict) {
    debug("ChangeWatcher", path + ": " + verdict, "Root: " + root);
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
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

LogLevel Logger::levelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_initialized) {
        // Initialize with defaults if not done yet
        initialize();
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    // stdout may carry a patch or JSON; keep log lines on stderr.
    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();

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

    formatted << entry.component << ": " << entry.message;

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

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Sort by modification time (newest first)
        std::sort(log_files.begin(), log_files.end(),
                  [](const std::filesystem::path& a, const std::filesystem::path& b) {
                      return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                  });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }
    } catch (const std::exception& e) {
        // Log rotation failure shouldn't stop the program
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        // Fall back to current directory
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream filename;
    filename << m_log_dir << "/difflens_";
    filename << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    filename << ".log";

    return filename.str();
}

} // namespace DiffLens
