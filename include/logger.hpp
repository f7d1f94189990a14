/**
 * @file logger.hpp
 * @brief Process-wide leveled logging for ipam-portmap
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the Logger class used by every component of ipam-portmap
 * to report firewall commands, database failures and saga compensation steps.
 */

#pragma once

#include <string>

namespace ipam {

/**
 * @enum LogLevel
 * @brief Logging levels
 *
 * Controls the verbosity of the application:
 * - None: No logging output
 * - Error: Only error messages
 * - Warning: Errors and warnings
 * - Info: Errors, warnings, and informational messages
 * - Debug: All messages including detailed execution information
 */
enum class LogLevel {
    None,    ///< No logging
    Error,   ///< Error messages only
    Warning, ///< Error and warning messages
    Info,    ///< Informational messages and above
    Debug    ///< All messages including debug information
};

/**
 * @class Logger
 * @brief Named logger writing timestamped lines to stdout/stderr
 *
 * Each component owns a Logger carrying its name. The level is global for the
 * whole process. Error and Warning lines go to stderr, Info and Debug lines to
 * stdout. Lines from concurrent threads are never interleaved.
 */
class Logger {
public:
    /**
     * @brief Construct a logger for a component
     * @param component Name printed in front of every message
     */
    explicit Logger(std::string component);

    void error(const std::string& message) const { log(LogLevel::Error, message); }
    void warning(const std::string& message) const { log(LogLevel::Warning, message); }
    void info(const std::string& message) const { log(LogLevel::Info, message); }
    void debug(const std::string& message) const { log(LogLevel::Debug, message); }

    /**
     * @brief Log a message at the specified level
     * @param level Log level for the message
     * @param message Message content to log
     *
     * Messages above the current global level are dropped.
     */
    void log(LogLevel level, const std::string& message) const;

    /**
     * @brief Set the global logging level
     * @param level Logging level to set
     */
    static void setLevel(LogLevel level);

    /**
     * @brief Get current global logging level
     * @return Current logging level
     */
    static LogLevel getLevel();

    /**
     * @brief Send Info and Debug lines to stderr as well
     * @param enabled true to keep stdout free for command output
     */
    static void setStderrOnly(bool enabled);

    /**
     * @brief Parse a level name ("debug", "info", "warning", "error", "none")
     * @param name Level name, case-insensitive
     * @return Matching LogLevel
     * @throws std::invalid_argument if the name is unknown
     */
    static LogLevel parseLevel(const std::string& name);

    /**
     * @brief Convert LogLevel enum to string representation
     * @param level LogLevel enum value
     * @return Upper case level name
     */
    static std::string levelToString(LogLevel level);

private:
    std::string component_; ///< Component name printed with every line
};

} // namespace ipam
