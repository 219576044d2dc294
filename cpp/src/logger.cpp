// cpp/src/logger.cpp
#include "logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// Global logger instance
Logger logger;

Logger::Logger() : out_(&std::cerr), verbose_(false) {}

void Logger::setOutput(std::ostream& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    out_ = &out;
}

bool Logger::openFile(const std::string& path, bool truncate) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();

    file_.open(path, truncate ? std::ios::out | std::ios::trunc : std::ios::out | std::ios::app);
    if (!file_) {
        return false;
    }
    out_ = &file_;
    return true;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level == LOG_LEVEL_DEBUG && !verbose_) return;

    std::string line = "[" + timestamp() + "] " + levelName(level) + " " + message + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << line;
    out_->flush();
}

std::string Logger::timestamp() const {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

const char* Logger::levelName(LogLevel level) const {
    switch (level) {
        case LOG_LEVEL_DEBUG: return "DEBUG";
        case LOG_LEVEL_INFO:  return "INFO ";
        case LOG_LEVEL_WARN:  return "WARN ";
        case LOG_LEVEL_ERROR: return "ERROR";
        default:              return "?????";
    }
}

void Logger::debug(const std::string& message) {
    log(LOG_LEVEL_DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LOG_LEVEL_INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LOG_LEVEL_WARN, message);
}

void Logger::error(const std::string& message) {
    log(LOG_LEVEL_ERROR, message);
}
