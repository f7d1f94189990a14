#include "cli_parser.hpp"
#include <arpa/inet.h>
#include <getopt.h>
#include <iostream>
#include <set>
#include <stdexcept>

namespace ipam {

namespace {

bool isIpv4Address(const std::string& addr) {
    in_addr parsed{};
    return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
}

// Per-command options; the set holds the long names the command accepts
const std::set<std::string>& allowedOptions(CLIParser::Command command) {
    static const std::set<std::string> none;
    static const std::set<std::string> create = {"addr", "port", "name", "component"};
    static const std::set<std::string> by_port = {"conn-port"};
    static const std::set<std::string> lookup = {"name", "addr", "component", "conn-port", "target-port"};
    static const std::set<std::string> addr = {"name", "addr", "component"};
    static const std::set<std::string> show = {"table", "raw"};

    switch (command) {
        case CLIParser::Command::Create:
            return create;
        case CLIParser::Command::Destroy:
        case CLIParser::Command::Check:
            return by_port;
        case CLIParser::Command::Lookup:
            return lookup;
        case CLIParser::Command::Addr:
            return addr;
        case CLIParser::Command::Show:
            return show;
        default:
            return none;
    }
}

} // namespace

CLIParser::Options CLIParser::parse(int argc, char* argv[]) {
    Options options;

    static struct option long_options[] = {
        {"config",  required_argument, 0, 'c'},  // YAML configuration file
        {"debug",   no_argument,       0, 'd'},  // Skip system validation
        {"verbose", no_argument,       0, 'v'},  // Debug level logging
        {"help",    no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // 0 makes GNU getopt reinitialize, so parse() can be called more than once
    optind = 0;
    int option_index = 0;
    int c;

    // The leading '+' stops at the command word; its options are parsed separately
    while ((c = getopt_long(argc, argv, "+c:dvh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                options.config_file = std::filesystem::path(optarg);
                break;
            case 'd':
                options.debug = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'h':
                options.help = true;
                break;
            case '?':
                // getopt_long already printed the reason to stderr
                throw std::invalid_argument("Unknown option");
            default:
                throw std::invalid_argument("Invalid argument parsing");
        }
    }

    if (optind < argc) {
        options.command = commandFromString(argv[optind]);
        int first = optind;
        parseCommandOptions(argc - first, argv + first, options);
    }

    if (!options.help) {
        validateOptions(options);
    }
    return options;
}

void CLIParser::parseCommandOptions(int argc, char* argv[], Options& options) {
    static struct option long_options[] = {
        {"addr",        required_argument, 0, 'a'},
        {"port",        required_argument, 0, 'p'},
        {"name",        required_argument, 0, 'n'},
        {"component",   required_argument, 0, 'C'},
        {"conn-port",   required_argument, 0, 'P'},
        {"target-port", required_argument, 0, 'T'},
        {"table",       required_argument, 0, 't'},
        {"raw",         no_argument,       0, 'r'},
        {0, 0, 0, 0}
    };

    const std::set<std::string>& allowed = allowedOptions(options.command);
    const std::string command = commandToString(options.command);

    // argv[0] is the command word
    optind = 0;
    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "+a:p:n:C:P:T:t:r", long_options, &option_index)) != -1) {
        if (c == '?') {
            throw std::invalid_argument("Unknown option for command " + command);
        }

        const char* long_name = nullptr;
        for (const struct option* entry = long_options; entry->name; ++entry) {
            if (entry->val == c) {
                long_name = entry->name;
                break;
            }
        }
        if (!long_name || allowed.count(long_name) == 0) {
            throw std::invalid_argument("Option --" + std::string(long_name ? long_name : "?") +
                                        " is not valid for command " + command);
        }

        switch (c) {
            case 'a':
                options.addr = optarg;
                break;
            case 'p':
                options.port = parsePort(optarg, "--port");
                break;
            case 'n':
                options.name = optarg;
                break;
            case 'C':
                options.component = optarg;
                break;
            case 'P':
                options.conn_port = parsePort(optarg, "--conn-port");
                break;
            case 'T':
                options.target_port = parsePort(optarg, "--target-port");
                break;
            case 't':
                options.table = optarg;
                break;
            case 'r':
                options.raw = true;
                break;
            default:
                throw std::invalid_argument("Invalid argument parsing");
        }
    }

    if (optind < argc) {
        throw std::invalid_argument("Unexpected argument for command " + command + ": " + argv[optind]);
    }
}

int CLIParser::parsePort(const std::string& value, const std::string& option) {
    size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " must be a number, supplied: " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(option + " must be a number, supplied: " + value);
    }
    if (port < 1 || port > 65535) {
        throw std::invalid_argument(option + " must be between 1 and 65535, supplied: " + value);
    }
    return port;
}

void CLIParser::validateOptions(const Options& options) {
    switch (options.command) {
        case Command::None:
            throw std::invalid_argument("No action specified");

        case Command::Create:
            if (!options.addr || !options.port || !options.name || !options.component) {
                throw std::invalid_argument("create requires --addr, --port, --name and --component");
            }
            if (!isIpv4Address(*options.addr)) {
                throw std::invalid_argument("--addr must be an IPv4 address, supplied: " + *options.addr);
            }
            break;

        case Command::Destroy:
        case Command::Check:
            if (!options.conn_port) {
                throw std::invalid_argument(commandToString(options.command) + " requires --conn-port");
            }
            break;

        case Command::Addr: {
            int supplied = (options.name ? 1 : 0) + (options.addr ? 1 : 0) + (options.component ? 1 : 0);
            if (supplied > 1) {
                throw std::invalid_argument("addr accepts only one of --name, --addr and --component");
            }
            if (options.addr && !isIpv4Address(*options.addr)) {
                throw std::invalid_argument("--addr must be an IPv4 address, supplied: " + *options.addr);
            }
            break;
        }

        case Command::Show:
            if (!options.table) {
                throw std::invalid_argument("show requires --table nat|filter");
            }
            break;

        case Command::Lookup:
        case Command::Save:
            break;
    }
}

CLIParser::Command CLIParser::commandFromString(const std::string& word) {
    if (word == "create") {
        return Command::Create;
    } else if (word == "destroy") {
        return Command::Destroy;
    } else if (word == "check") {
        return Command::Check;
    } else if (word == "lookup") {
        return Command::Lookup;
    } else if (word == "addr") {
        return Command::Addr;
    } else if (word == "show") {
        return Command::Show;
    } else if (word == "save") {
        return Command::Save;
    }
    throw std::invalid_argument("Unknown command: " + word);
}

std::string CLIParser::commandToString(Command command) {
    switch (command) {
        case Command::Create:
            return "create";
        case Command::Destroy:
            return "destroy";
        case Command::Check:
            return "check";
        case Command::Lookup:
            return "lookup";
        case Command::Addr:
            return "addr";
        case Command::Show:
            return "show";
        case Command::Save:
            return "save";
        default:
            return "none";
    }
}

bool CLIParser::isMutating(Command command) {
    return command == Command::Create || command == Command::Destroy || command == Command::Save;
}

void CLIParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] COMMAND [COMMAND OPTIONS]\n\n";
    std::cout << "Map public connection ports to private machines with iptables\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE  YAML configuration file\n";
    std::cout << "  -d, --debug        Debug mode (bypass system validation)\n";
    std::cout << "  -v, --verbose      Log at debug level\n";
    std::cout << "  -h, --help         Show this help message\n\n";
    std::cout << "Commands:\n";
    std::cout << "  create --addr A --port P --name N --component C\n";
    std::cout << "                     Create a port mapping and print its connection port\n";
    std::cout << "  destroy --conn-port X\n";
    std::cout << "                     Destroy the port mapping of a connection port\n";
    std::cout << "  check --conn-port X\n";
    std::cout << "                     Check that the record and both rules exist\n";
    std::cout << "  lookup [--name N] [--addr A] [--component C] [--conn-port X] [--target-port P]\n";
    std::cout << "                     List port mapping records\n";
    std::cout << "  addr [--name N | --addr A | --component C]\n";
    std::cout << "                     List machine addresses\n";
    std::cout << "  show --table nat|filter [--raw]\n";
    std::cout << "                     List the managed rules of a table\n";
    std::cout << "  save               Write the current rules to the rules file\n\n";
    std::cout << "Exit status:\n";
    std::cout << "  0 ok, 1 server error, 2 bad request, 3 not found\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -c /etc/ipam-portmap.yaml create --addr 10.0.0.5 --port 22 "
              << "--name vm1 --component lab\n";
    std::cout << "  " << program_name << " destroy --conn-port 50042\n";
    std::cout << "  " << program_name << " show --table nat\n";
}

} // namespace ipam
