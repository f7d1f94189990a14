/**
 * @file cli_parser.hpp
 * @brief Command line argument parsing for ipam-portmap
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the CLIParser class responsible for parsing and validating
 * the global options, the command word and the per-command options of the
 * ipam-portmap tool.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ipam {

/**
 * @class CLIParser
 * @brief Command line interface parser for ipam-portmap
 *
 * The command line has the form
 * @code
 * ipam-portmap [GLOBAL OPTIONS] COMMAND [COMMAND OPTIONS]
 * @endcode
 * Both option groups are parsed with getopt_long. Options that do not belong
 * to the selected command are rejected.
 */
class CLIParser {
public:
    /**
     * @enum Command
     * @brief Operation selected by the command word
     */
    enum class Command {
        None,     ///< No command given
        Create,   ///< Create a port mapping
        Destroy,  ///< Destroy a port mapping
        Check,    ///< Check a port mapping for consistency
        Lookup,   ///< List port mapping records
        Addr,     ///< List machine addresses
        Show,     ///< List the firewall rules of a table
        Save      ///< Persist the current firewall rules
    };

    /**
     * @struct Options
     * @brief Container for parsed command line options
     */
    struct Options {
        std::optional<std::filesystem::path> config_file; ///< Path to YAML configuration file
        bool debug = false;         ///< Bypass system validation for testing
        bool verbose = false;       ///< Log at debug level
        bool help = false;          ///< Display help information

        Command command = Command::None;
        std::optional<std::string> addr;
        std::optional<std::string> name;
        std::optional<std::string> component;
        std::optional<std::string> table;
        std::optional<int> port;         ///< Target port (create)
        std::optional<int> conn_port;
        std::optional<int> target_port;  ///< Target port filter (lookup)
        bool raw = false;                ///< Print the unparsed listing (show)
    };

    /**
     * @brief Parse command line arguments into Options structure
     * @param argc Number of command line arguments
     * @param argv Array of command line argument strings
     * @return Parsed options structure
     * @throws std::invalid_argument if parsing or validation fails
     */
    static Options parse(int argc, char* argv[]);

    /**
     * @brief Print usage information to stdout
     * @param program_name Name of the program executable
     */
    static void printUsage(const std::string& program_name);

    /**
     * @brief Map a command word to its Command
     * @throws std::invalid_argument for an unknown word
     */
    static Command commandFromString(const std::string& word);

    static std::string commandToString(Command command);

    /**
     * @brief Whether a command changes the firewall or the record database
     */
    static bool isMutating(Command command);

private:
    static void parseCommandOptions(int argc, char* argv[], Options& options);
    static int parsePort(const std::string& value, const std::string& option);

    /**
     * @brief Validate parsed options for logical consistency
     * @param options The options structure to validate
     * @throws std::invalid_argument if options are missing or inconsistent
     */
    static void validateOptions(const Options& options);
};

} // namespace ipam
