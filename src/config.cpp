#include "config.hpp"
#include "logger.hpp"
#include <stdexcept>

namespace ipam {

// DatabaseConfig implementation
bool DatabaseConfig::isValid() const {
    return getErrorMessage().empty();
}

std::string DatabaseConfig::getErrorMessage() const {
    if (path.empty()) {
        return "database path must not be empty";
    }
    if (busy_timeout_ms < 0) {
        return "database busy_timeout_ms must not be negative";
    }
    return "";
}

// PortRangeConfig implementation
bool PortRangeConfig::isValid() const {
    return getErrorMessage().empty();
}

std::string PortRangeConfig::getErrorMessage() const {
    if (min < 1 || min > 65535) {
        return "ports.min must be between 1 and 65535";
    }
    if (max < 1 || max > 65535) {
        return "ports.max must be between 1 and 65535";
    }
    if (min > max) {
        return "ports.min (" + std::to_string(min) + ") is greater than ports.max (" +
               std::to_string(max) + ")";
    }
    if (max_tries < 1) {
        return "ports.max_tries must be at least 1";
    }
    return "";
}

// FirewallConfig implementation
bool FirewallConfig::isValid() const {
    return getErrorMessage().empty();
}

std::string FirewallConfig::getErrorMessage() const {
    if (external_interface.empty()) {
        return "firewall.external_interface must not be empty";
    }
    if (rules_file.empty()) {
        return "firewall.rules_file must not be empty";
    }
    if (iptables.empty() || iptables_save.empty()) {
        return "firewall.iptables and firewall.iptables_save must not be empty";
    }
    if (builtin_forward_rules < 0) {
        return "firewall.builtin_forward_rules must not be negative";
    }
    return "";
}

// LoggingConfig implementation
bool LoggingConfig::isValid() const {
    return getErrorMessage().empty();
}

std::string LoggingConfig::getErrorMessage() const {
    try {
        Logger::parseLevel(level);
    } catch (const std::invalid_argument& e) {
        return "logging.level: " + std::string(e.what());
    }
    return "";
}

// Config implementation
bool Config::isValid() const {
    return getErrorMessage().empty();
}

std::string Config::getErrorMessage() const {
    for (const std::string& error : {database.getErrorMessage(),
                                     ports.getErrorMessage(),
                                     firewall.getErrorMessage(),
                                     logging.getErrorMessage()}) {
        if (!error.empty()) {
            return error;
        }
    }
    return "";
}

} // namespace ipam

// YAML conversion implementations
namespace YAML {

using namespace ipam;

namespace {

// Copies node[key] into value when the key is present
template<typename T>
void readOptional(const Node& node, const char* key, T& value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

} // namespace

// DatabaseConfig conversion
Node convert<DatabaseConfig>::encode(const DatabaseConfig& config) {
    Node node;
    node["path"] = config.path;
    node["busy_timeout_ms"] = config.busy_timeout_ms;
    return node;
}

bool convert<DatabaseConfig>::decode(const Node& node, DatabaseConfig& config) {
    if (!node.IsMap()) return false;

    readOptional(node, "path", config.path);
    readOptional(node, "busy_timeout_ms", config.busy_timeout_ms);
    return true;
}

// PortRangeConfig conversion
Node convert<PortRangeConfig>::encode(const PortRangeConfig& config) {
    Node node;
    node["min"] = config.min;
    node["max"] = config.max;
    node["max_tries"] = config.max_tries;
    return node;
}

bool convert<PortRangeConfig>::decode(const Node& node, PortRangeConfig& config) {
    if (!node.IsMap()) return false;

    readOptional(node, "min", config.min);
    readOptional(node, "max", config.max);
    readOptional(node, "max_tries", config.max_tries);
    return true;
}

// FirewallConfig conversion
Node convert<FirewallConfig>::encode(const FirewallConfig& config) {
    Node node;
    node["external_interface"] = config.external_interface;
    node["rules_file"] = config.rules_file;
    node["iptables"] = config.iptables;
    node["iptables_save"] = config.iptables_save;
    node["use_sudo"] = config.use_sudo;
    node["builtin_forward_rules"] = config.builtin_forward_rules;
    return node;
}

bool convert<FirewallConfig>::decode(const Node& node, FirewallConfig& config) {
    if (!node.IsMap()) return false;

    readOptional(node, "external_interface", config.external_interface);
    readOptional(node, "rules_file", config.rules_file);
    readOptional(node, "iptables", config.iptables);
    readOptional(node, "iptables_save", config.iptables_save);
    readOptional(node, "use_sudo", config.use_sudo);
    readOptional(node, "builtin_forward_rules", config.builtin_forward_rules);
    return true;
}

// LoggingConfig conversion
Node convert<LoggingConfig>::encode(const LoggingConfig& config) {
    Node node;
    node["level"] = config.level;
    return node;
}

bool convert<LoggingConfig>::decode(const Node& node, LoggingConfig& config) {
    if (!node.IsMap()) return false;

    readOptional(node, "level", config.level);
    return true;
}

// Config conversion
Node convert<Config>::encode(const Config& config) {
    Node node;
    node["database"] = config.database;
    node["ports"] = config.ports;
    node["firewall"] = config.firewall;
    node["logging"] = config.logging;
    return node;
}

bool convert<Config>::decode(const Node& node, Config& config) {
    // An empty document means "all defaults"
    if (node.IsNull()) return true;
    if (!node.IsMap()) return false;

    readOptional(node, "database", config.database);
    readOptional(node, "ports", config.ports);
    readOptional(node, "firewall", config.firewall);
    readOptional(node, "logging", config.logging);
    return true;
}

} // namespace YAML
