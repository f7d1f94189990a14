#include "logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace ipam {

namespace {

std::atomic<LogLevel> current_log_level{LogLevel::Info};
std::atomic<bool> stderr_only{false};

// Serializes writes so lines from request threads stay whole
std::mutex output_mutex;

} // namespace

Logger::Logger(std::string component)
    : component_(std::move(component)) {
}

void Logger::log(LogLevel level, const std::string& message) const {
    if (level == LogLevel::None || level > current_log_level.load()) {
        return;
    }

    // Get current timestamp with millisecond precision
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream line;
    line << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] ";

    std::ostream* output_stream = stderr_only.load() ? &std::cerr : &std::cout;
    switch (level) {
        case LogLevel::Error:
            line << "[ERROR] ";
            output_stream = &std::cerr;
            break;
        case LogLevel::Warning:
            line << "[WARN ] ";
            output_stream = &std::cerr;
            break;
        case LogLevel::Info:
            line << "[INFO ] ";
            break;
        case LogLevel::Debug:
            line << "[DEBUG] ";
            break;
        case LogLevel::None:
            return;
    }
    line << component_ << ": " << message;

    std::lock_guard<std::mutex> lock(output_mutex);
    *output_stream << line.str() << std::endl;
}

void Logger::setLevel(LogLevel level) {
    current_log_level.store(level);
}

LogLevel Logger::getLevel() {
    return current_log_level.load();
}

void Logger::setStderrOnly(bool enabled) {
    stderr_only.store(enabled);
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string value = name;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "debug") {
        return LogLevel::Debug;
    } else if (value == "info") {
        return LogLevel::Info;
    } else if (value == "warning" || value == "warn") {
        return LogLevel::Warning;
    } else if (value == "error") {
        return LogLevel::Error;
    } else if (value == "none") {
        return LogLevel::None;
    }
    throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::None:
            return "NONE";
        default:
            return "UNKNOWN";
    }
}

} // namespace ipam
