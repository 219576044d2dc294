#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

// Log levels
enum LogLevel {
    LOG_LEVEL_DEBUG = 0,  // only with --verbose
    LOG_LEVEL_INFO = 1,
    LOG_LEVEL_WARN = 2,
    LOG_LEVEL_ERROR = 3
};

// ----------------------------------------------------------
// Logger – "[YYYY-mm-dd HH:MM:SS] LEVEL message" pro Zeile
// ----------------------------------------------------------
class Logger
{
public:
    Logger();

    // Log to an already open stream (std::cerr in the foreground, tests).
    void setOutput(std::ostream& out);

    // Log to a file. Returns false if it cannot be opened.
    bool openFile(const std::string& path, bool truncate);

    void setVerbose(bool verbose) { verbose_ = verbose; }
    bool verbose() const { return verbose_; }

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

private:
    void log(LogLevel level, const std::string& message);
    std::string timestamp() const;
    const char* levelName(LogLevel level) const;

    std::mutex mutex_;
    std::ofstream file_;
    std::ostream* out_;
    std::atomic<bool> verbose_;
};

// Global logger instance
extern Logger logger;

// Convenience macros
#define LOG_DEBUG(msg) logger.debug(msg)
#define LOG_INFO(msg) logger.info(msg)
#define LOG_WARN(msg) logger.warn(msg)
#define LOG_ERROR(msg) logger.error(msg)
