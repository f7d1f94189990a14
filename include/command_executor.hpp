/**
 * @file command_executor.hpp
 * @brief Command execution engine for ipam-portmap
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the CommandExecutor class which runs the packet filter
 * tooling (iptables, iptables-save) on behalf of the rule store, together with
 * the CommandRunner seam the rule store talks to.
 */

#pragma once

#include <string>
#include <vector>

namespace ipam {

/**
 * @struct CommandResult
 * @brief Structure representing the result of a command execution
 *
 * Contains the exit status and both output streams of a finished command.
 */
struct CommandResult {
    bool success = false;           ///< Whether the command executed without errors
    int exit_code = -1;             ///< Process exit code (0 = success)
    std::string stdout_output;      ///< Standard output from the command
    std::string stderr_output;      ///< Standard error output from the command
    std::string command;            ///< The actual command that was executed

    /**
     * @brief Check if the command executed successfully
     * @return true if exit code is 0 and success flag is true
     */
    bool isSuccess() const {
        return success && exit_code == 0;
    }

    /**
     * @brief Get error message if command failed
     * @return Error message string or empty string if successful
     *
     * Includes the command, exit code, and stderr output when the command fails.
     */
    std::string getErrorMessage() const {
        if (isSuccess()) {
            return "";
        }

        std::string error = "Command failed: " + command;
        error += " (exit code: " + std::to_string(exit_code) + ")";

        if (!stderr_output.empty()) {
            error += "\nError output: " + stderr_output;
        }

        return error;
    }
};

/**
 * @class CommandRunner
 * @brief Abstract interface for running an external command
 *
 * The rule store only ever talks to the packet filter through this interface,
 * which lets tests replace the host firewall with an in-memory one.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command given as an argument vector
     * @param args Command arguments (first is the program, rest are arguments)
     * @return CommandResult describing the finished process
     */
    virtual CommandResult run(const std::vector<std::string>& args) = 0;
};

/**
 * @class CommandExecutor
 * @brief Runs system commands with captured output and logging
 *
 * All methods are static. Arguments are shell-escaped before the command line
 * is handed to popen(); stdout is read from the pipe and stderr is collected
 * through a private temporary file.
 */
class CommandExecutor {
public:
    /**
     * @brief Execute a command given as an argument vector
     * @param args Command arguments (first is the command, rest are arguments)
     * @return CommandResult with execution details
     *
     * An empty vector yields a failed result rather than an exception.
     */
    static CommandResult execute(const std::vector<std::string>& args);

    /**
     * @brief Check if a program can be found on the PATH
     * @param program Program name
     * @return true if the shell can resolve the program
     */
    static bool isAvailable(const std::string& program);

    /**
     * @brief Escape shell argument for safe execution
     * @param arg Argument string to escape
     * @return Argument wrapped in single quotes when it contains shell metacharacters
     */
    static std::string escapeShellArg(const std::string& arg);

    /**
     * @brief Convert vector of arguments to command string
     * @param args Command arguments vector
     * @return Escaped command string
     */
    static std::string argsToCommand(const std::vector<std::string>& args);

private:
    static CommandResult executeInternal(const std::string& command);
};

/**
 * @class SystemCommandRunner
 * @brief CommandRunner that executes on the host through CommandExecutor
 */
class SystemCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& args) override {
        return CommandExecutor::execute(args);
    }
};

} // namespace ipam
