#include "config_parser.hpp"
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace ipam {

namespace {

int parseNumber(const char* name, const char* value) {
    try {
        size_t consumed = 0;
        int number = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return number;
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Environment variable ") + name +
                                 " must be a number, supplied: " + value);
    }
}

} // namespace

Config ConfigParser::loadFromFile(const std::string& filename) {
    try {
        // YAML::LoadFile throws YAML::BadFile for unreadable files and
        // YAML::ParserException for syntax errors
        YAML::Node yamlNode = YAML::LoadFile(filename);
        return finalize(yamlNode.IsNull() ? Config{} : yamlNode.as<Config>());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error in " + filename + ": " + std::string(e.what()));
    }
}

Config ConfigParser::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yamlNode = YAML::Load(yaml_content);
        // An empty document has no node at all
        return finalize(yamlNode.IsNull() ? Config{} : yamlNode.as<Config>());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
}

Config ConfigParser::loadDefaults() {
    return finalize(Config{});
}

void ConfigParser::applyEnvironment(Config& config, const EnvLookup& lookup) {
    if (const char* value = lookup("IPAM_DB_PATH")) {
        config.database.path = value;
    }
    if (const char* value = lookup("IPAM_PORT_MIN")) {
        config.ports.min = parseNumber("IPAM_PORT_MIN", value);
    }
    if (const char* value = lookup("IPAM_PORT_MAX")) {
        config.ports.max = parseNumber("IPAM_PORT_MAX", value);
    }
    if (const char* value = lookup("IPAM_INSERT_MAX_TRIES")) {
        config.ports.max_tries = parseNumber("IPAM_INSERT_MAX_TRIES", value);
    }
    if (const char* value = lookup("IPAM_EXTERNAL_IFACE")) {
        config.firewall.external_interface = value;
    }
    if (const char* value = lookup("IPAM_RULES_FILE")) {
        config.firewall.rules_file = value;
    }
    if (const char* value = lookup("IPAM_LOG_LEVEL")) {
        config.logging.level = value;
    }
}

ConfigParser::EnvLookup ConfigParser::defaultLookup() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

Config ConfigParser::finalize(Config config) {
    applyEnvironment(config);

    // Validation runs after the overrides so a bad variable is reported too
    if (!config.isValid()) {
        throw std::runtime_error("Invalid configuration: " + config.getErrorMessage());
    }
    return config;
}

} // namespace ipam
