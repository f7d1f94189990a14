#include "command_executor.hpp"
#include "logger.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace ipam {

namespace {

const Logger logger("CommandExecutor");

void stripTrailingNewline(std::string& text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
}

} // namespace

CommandResult CommandExecutor::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        CommandResult result;
        result.success = false;
        result.exit_code = -1;
        result.stderr_output = "No command specified";
        return result;
    }

    return executeInternal(argsToCommand(args));
}

bool CommandExecutor::isAvailable(const std::string& program) {
    // 'command -v' is POSIX and does not print anything we need here
    std::string check = "command -v " + escapeShellArg(program) + " > /dev/null 2>&1";
    return std::system(check.c_str()) == 0;
}

CommandResult CommandExecutor::executeInternal(const std::string& command) {
    CommandResult result;
    result.command = command;

    // Audit trail of every packet filter operation
    logger.info("Executing command: " + command);

    // stderr goes to a private file so it never mixes with the listing on stdout
    char stderr_path[] = "/tmp/ipam-portmap-stderr-XXXXXX";
    int stderr_fd = mkstemp(stderr_path);
    if (stderr_fd < 0) {
        result.exit_code = -1;
        result.stderr_output = "Failed to create temporary file for stderr";
        logger.error(result.stderr_output + " while running: " + command);
        return result;
    }
    close(stderr_fd);

    std::string full_command = command + " 2>" + escapeShellArg(stderr_path);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "r"), pclose);
    if (!pipe) {
        unlink(stderr_path);
        result.exit_code = -1;
        result.stderr_output = "Failed to execute command";
        logger.error("Failed to create pipe for command: " + command);
        return result;
    }

    std::array<char, 4096> buffer;
    std::string output;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        output += buffer.data();
    }

    // pclose() returns the wait status of the shell
    int status = pclose(pipe.release());
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }

    {
        std::ifstream stderr_file(stderr_path);
        std::ostringstream stderr_text;
        stderr_text << stderr_file.rdbuf();
        result.stderr_output = stderr_text.str();
    }
    unlink(stderr_path);

    result.stdout_output = output;
    stripTrailingNewline(result.stdout_output);
    stripTrailingNewline(result.stderr_output);
    result.success = (result.exit_code == 0);

    if (result.success) {
        logger.debug("Command completed successfully (output: " +
                     std::to_string(result.stdout_output.size()) + " bytes)");
    } else {
        logger.error("Command failed with exit code: " + std::to_string(result.exit_code));
        if (!result.stderr_output.empty()) {
            logger.error("Stderr: " + result.stderr_output);
        }
    }

    return result;
}

std::string CommandExecutor::argsToCommand(const std::vector<std::string>& args) {
    std::ostringstream command;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            command << " ";
        }
        command << escapeShellArg(args[i]);
    }
    return command.str();
}

std::string CommandExecutor::escapeShellArg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\r\"'\\$`|&;<>(){}[]?*~#!") == std::string::npos) {
        return arg;
    }

    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\"'\"'";  // End quote, escaped single quote, start quote
        } else {
            escaped += c;
        }
    }
    escaped += "'";

    return escaped;
}

} // namespace ipam
