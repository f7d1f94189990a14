#include <iostream>
#include <memory>
#include <string>
#include <yaml-cpp/yaml.h>
#include "cli_parser.hpp"
#include "command_executor.hpp"
#include "config_parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "portmap_coordinator.hpp"
#include "record_store.hpp"
#include "rule_store.hpp"
#include "system_utils.hpp"

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_SERVER_ERROR = 1;
constexpr int EXIT_BAD_REQUEST = 2;
constexpr int EXIT_NOT_FOUND = 3;

int exitCodeFor(ipam::Status status) {
    switch (status) {
        case ipam::Status::Ok:
            return EXIT_OK;
        case ipam::Status::BadRequest:
            return EXIT_BAD_REQUEST;
        case ipam::Status::NotFound:
            return EXIT_NOT_FOUND;
        case ipam::Status::ServerError:
        default:
            return EXIT_SERVER_ERROR;
    }
}

void emitRoutable(YAML::Emitter& out, const std::optional<bool>& routable) {
    out << YAML::Key << "routable";
    if (routable) {
        out << YAML::Value << *routable;
    } else {
        out << YAML::Value << YAML::Null;
    }
}

void printDocument(const YAML::Emitter& out) {
    std::cout << out.c_str() << std::endl;
}

int printOutcome(const ipam::Outcome& outcome) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "status" << YAML::Value << ipam::statusToString(outcome.status);
    out << YAML::Key << "error" << YAML::Value << outcome.error;
    out << YAML::EndMap;
    printDocument(out);
    return exitCodeFor(outcome.status);
}

int runCreate(const ipam::CLIParser::Options& options, ipam::PortMapCoordinator& coordinator) {
    uint16_t conn_port = coordinator.create(*options.addr, *options.port, *options.name,
                                            *options.component);
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "conn_port" << YAML::Value << conn_port;
    out << YAML::EndMap;
    printDocument(out);
    return EXIT_OK;
}

int runCheck(const ipam::CLIParser::Options& options, ipam::PortMapCoordinator& coordinator) {
    try {
        coordinator.verify(*options.conn_port);
    } catch (const ipam::ConsistencyError& e) {
        return printOutcome({e.what(), e.status()});
    }
    return printOutcome({"", ipam::Status::Ok});
}

int runLookup(const ipam::CLIParser::Options& options, ipam::PortMapCoordinator& coordinator) {
    ipam::RecordFilter filter;
    filter.name = options.name;
    filter.addr = options.addr;
    filter.component = options.component;
    if (options.conn_port) {
        filter.conn_port = static_cast<uint16_t>(*options.conn_port);
    }
    if (options.target_port) {
        filter.target_port = static_cast<uint16_t>(*options.target_port);
    }

    auto records = coordinator.lookupRecords(filter);
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [conn_port, record] : records) {
        out << YAML::Key << conn_port << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "target_addr" << YAML::Value << record.target_addr;
        out << YAML::Key << "target_port" << YAML::Value << record.target_port;
        out << YAML::Key << "target_name" << YAML::Value << record.target_name;
        out << YAML::Key << "target_component" << YAML::Value << record.target_component;
        emitRoutable(out, record.routable);
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    printDocument(out);
    return EXIT_OK;
}

int runAddr(const ipam::CLIParser::Options& options, ipam::PortMapCoordinator& coordinator) {
    ipam::AddressFilter filter;
    filter.name = options.name;
    filter.addr = options.addr;
    filter.component = options.component;

    auto machines = coordinator.lookupAddresses(filter);
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [name, info] : machines) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "addrs" << YAML::Value << YAML::Flow << info.addrs;
        out << YAML::Key << "component" << YAML::Value << info.component;
        emitRoutable(out, info.routable);
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    printDocument(out);
    return EXIT_OK;
}

int runShow(const ipam::CLIParser::Options& options, ipam::RuleStore& rules) {
    if (options.raw) {
        std::cout << rules.showRaw(*options.table) << std::endl;
        return EXIT_OK;
    }

    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& rule : rules.show(*options.table)) {
        out << YAML::BeginMap;
        out << YAML::Key << "position" << YAML::Value << rule.position;
        out << YAML::Key << "table" << YAML::Value << rule.table;
        out << YAML::Key << "target_addr" << YAML::Value << rule.target_addr;
        out << YAML::Key << "target_port" << YAML::Value << rule.target_port;
        if (rule.conn_port) {
            out << YAML::Key << "conn_port" << YAML::Value << *rule.conn_port;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    printDocument(out);
    return EXIT_OK;
}

int runSave(const ipam::Config& config, ipam::RuleStore& rules) {
    rules.saveRules();
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "saved" << YAML::Value << config.firewall.rules_file;
    out << YAML::EndMap;
    printDocument(out);
    return EXIT_OK;
}

int run(const ipam::CLIParser::Options& options, const ipam::Config& config) {
    using Command = ipam::CLIParser::Command;

    ipam::RuleStore rules(config.firewall, std::make_shared<ipam::SystemCommandRunner>());
    if (options.command == Command::Show) {
        return runShow(options, rules);
    }
    if (options.command == Command::Save) {
        return runSave(config, rules);
    }

    ipam::RecordStore records(config.database, config.ports);
    ipam::PortMapCoordinator coordinator(records, rules);

    switch (options.command) {
        case Command::Create:
            return runCreate(options, coordinator);
        case Command::Destroy:
            return printOutcome(coordinator.destroy(*options.conn_port));
        case Command::Check:
            return runCheck(options, coordinator);
        case Command::Lookup:
            return runLookup(options, coordinator);
        case Command::Addr:
            return runAddr(options, coordinator);
        default:
            throw std::invalid_argument("No action specified");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // stdout carries only the YAML result
    ipam::Logger::setStderrOnly(true);

    try {
        auto options = ipam::CLIParser::parse(argc, argv);

        // Help can be shown regardless of system state or privileges
        if (options.help) {
            ipam::CLIParser::printUsage(argv[0]);
            return EXIT_OK;
        }

        ipam::Config config = options.config_file
            ? ipam::ConfigParser::loadFromFile(options.config_file->string())
            : ipam::ConfigParser::loadDefaults();
        ipam::Logger::setLevel(options.verbose ? ipam::LogLevel::Debug
                                               : ipam::Logger::parseLevel(config.logging.level));

        if (ipam::CLIParser::isMutating(options.command)) {
            if (options.debug) {
                std::cerr << "Debug mode: Skipping system validation." << std::endl;
            } else {
                auto errors = ipam::SystemUtils::validateSystemRequirements(config.firewall);
                if (!errors.empty()) {
                    for (const auto& error : errors) {
                        std::cerr << "Error: " << error << std::endl;
                    }
                    std::cerr << "\nSystem validation failed. Use --help for usage information." << std::endl;
                    return EXIT_SERVER_ERROR;
                }
            }
        }

        return run(options, config);

    } catch (const std::invalid_argument& e) {
        // "No action specified" triggers help display
        if (std::string(e.what()) == "No action specified") {
            ipam::CLIParser::printUsage(argv[0]);
        } else {
            std::cerr << "Error: " << e.what() << std::endl;
            std::cerr << "Use --help for usage information." << std::endl;
        }
        return EXIT_BAD_REQUEST;
    } catch (const ipam::CapacityExhausted& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "All connection ports of the configured range are in use." << std::endl;
        return EXIT_SERVER_ERROR;
    } catch (const ipam::CommandError& e) {
        std::cerr << "Firewall command failed: " << e.result().command << std::endl;
        std::cerr << e.what() << std::endl;
        return EXIT_SERVER_ERROR;
    } catch (const std::runtime_error& e) {
        std::cerr << "Runtime error: " << e.what() << std::endl;
        return EXIT_SERVER_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return EXIT_SERVER_ERROR;
    }
}
