/**
 * @file config_parser.hpp
 * @brief YAML configuration parsing for ipam-portmap
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the ConfigParser class responsible for parsing YAML
 * configuration files, applying environment overrides and validating the
 * result.
 */

#pragma once

#include "config.hpp"
#include <functional>
#include <string>

namespace ipam {

/**
 * @class ConfigParser
 * @brief YAML configuration loader
 *
 * Provides static methods for loading YAML configuration files and strings
 * into Config objects. Values from the environment take precedence over the
 * file:
 *
 * | Variable              | Config key                   |
 * |-----------------------|------------------------------|
 * | IPAM_DB_PATH          | database.path                |
 * | IPAM_PORT_MIN         | ports.min                    |
 * | IPAM_PORT_MAX         | ports.max                    |
 * | IPAM_INSERT_MAX_TRIES | ports.max_tries              |
 * | IPAM_EXTERNAL_IFACE   | firewall.external_interface  |
 * | IPAM_RULES_FILE       | firewall.rules_file          |
 * | IPAM_LOG_LEVEL        | logging.level                |
 */
class ConfigParser {
public:
    /// Looks up an environment variable; returns nullptr when unset
    using EnvLookup = std::function<const char*(const char*)>;

    /**
     * @brief Load configuration from a YAML file
     * @param filename Path to the YAML configuration file
     * @return Parsed, overridden and validated Config object
     * @throws std::runtime_error if file cannot be read or configuration is invalid
     */
    static Config loadFromFile(const std::string& filename);

    /**
     * @brief Load configuration from a YAML string
     * @param yaml_content YAML content as string
     * @return Parsed, overridden and validated Config object
     * @throws std::runtime_error if YAML is invalid or configuration is invalid
     */
    static Config loadFromString(const std::string& yaml_content);

    /**
     * @brief Build the default configuration with environment overrides applied
     * @return Validated Config object
     * @throws std::runtime_error if an override makes the configuration invalid
     */
    static Config loadDefaults();

    /**
     * @brief Apply environment overrides to a configuration
     * @param config Configuration to modify
     * @param lookup Environment accessor, std::getenv by default
     * @throws std::runtime_error if a numeric variable is not a number
     */
    static void applyEnvironment(Config& config, const EnvLookup& lookup = defaultLookup());

private:
    static EnvLookup defaultLookup();
    static Config finalize(Config config);
};

} // namespace ipam
