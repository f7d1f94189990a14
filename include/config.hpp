/**
 * @file config.hpp
 * @brief Configuration structures and YAML serialization for ipam-portmap
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the configuration system for ipam-portmap: where the
 * port map database lives, which connection ports may be handed out, how the
 * packet filter is driven, and how verbose logging is. It also provides YAML
 * serialization through yaml-cpp template specializations.
 *
 * Every key is optional; the defaults match a stock lab gateway.
 */

#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

namespace ipam {

/**
 * @struct DatabaseConfig
 * @brief Location of the port map record database
 */
struct DatabaseConfig {
    std::string path = "/var/lib/ipam-portmap/ipam.db";  ///< SQLite database file
    int busy_timeout_ms = 5000;  ///< How long a connection waits on a locked database

    bool isValid() const;
    std::string getErrorMessage() const;
};

/**
 * @struct PortRangeConfig
 * @brief Range from which connection ports are drawn
 *
 * Both bounds are inclusive. max_tries bounds the collision retry loop in
 * RecordStore::addRecord.
 */
struct PortRangeConfig {
    int min = 50000;       ///< Lowest connection port handed out
    int max = 50100;       ///< Highest connection port handed out
    int max_tries = 100;   ///< Insert attempts before the range is considered saturated

    bool isValid() const;
    std::string getErrorMessage() const;
};

/**
 * @struct FirewallConfig
 * @brief How the packet filter is driven
 */
struct FirewallConfig {
    std::string external_interface = "ens160";     ///< Interface receiving user connections
    std::string rules_file = "/etc/iptables/rules.v4";  ///< Where saved rules are written
    std::string iptables = "iptables";             ///< iptables binary
    std::string iptables_save = "iptables-save";   ///< iptables-save binary
    bool use_sudo = true;                          ///< Prefix every command with sudo
    int builtin_forward_rules = 2;                 ///< Leading FORWARD rules not owned by us

    bool isValid() const;
    std::string getErrorMessage() const;
};

/**
 * @struct LoggingConfig
 * @brief Logging verbosity
 */
struct LoggingConfig {
    std::string level = "info";  ///< One of debug, info, warning, error, none

    bool isValid() const;
    std::string getErrorMessage() const;
};

/**
 * @struct Config
 * @brief Root configuration structure for ipam-portmap
 */
struct Config {
    DatabaseConfig database;   ///< Record store settings
    PortRangeConfig ports;     ///< Connection port allocation settings
    FirewallConfig firewall;   ///< Rule store settings
    LoggingConfig logging;     ///< Logging settings

    /**
     * @brief Validate the complete configuration
     * @return true if every section is valid
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid configurations
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;
};

} // namespace ipam

// YAML conversion specializations
namespace YAML {

template<>
struct convert<ipam::DatabaseConfig> {
    static Node encode(const ipam::DatabaseConfig& config);
    static bool decode(const Node& node, ipam::DatabaseConfig& config);
};

template<>
struct convert<ipam::PortRangeConfig> {
    static Node encode(const ipam::PortRangeConfig& config);
    static bool decode(const Node& node, ipam::PortRangeConfig& config);
};

template<>
struct convert<ipam::FirewallConfig> {
    static Node encode(const ipam::FirewallConfig& config);
    static bool decode(const Node& node, ipam::FirewallConfig& config);
};

template<>
struct convert<ipam::LoggingConfig> {
    static Node encode(const ipam::LoggingConfig& config);
    static bool decode(const Node& node, ipam::LoggingConfig& config);
};

/**
 * @brief YAML conversion for the root Config struct
 *
 * Missing sections keep their defaults. A section that is present but not a
 * map fails decoding.
 */
template<>
struct convert<ipam::Config> {
    static Node encode(const ipam::Config& config);
    static bool decode(const Node& node, ipam::Config& config);
};

} // namespace YAML
