#include <cassert>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "config.hpp"
#include "config_parser.hpp"
#include "logger.hpp"

namespace {

using ipam::Config;
using ipam::ConfigParser;

const char* kVariables[] = {"IPAM_DB_PATH", "IPAM_PORT_MIN", "IPAM_PORT_MAX",
                            "IPAM_INSERT_MAX_TRIES", "IPAM_EXTERNAL_IFACE",
                            "IPAM_RULES_FILE", "IPAM_LOG_LEVEL"};

bool throws_runtime_error(const std::string& yaml) {
    try {
        ConfigParser::loadFromString(yaml);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void test_defaults() {
    Config config = ConfigParser::loadDefaults();
    assert(config.database.path == "/var/lib/ipam-portmap/ipam.db");
    assert(config.ports.min == 50000);
    assert(config.ports.max == 50100);
    assert(config.ports.max_tries == 100);
    assert(config.firewall.external_interface == "ens160");
    assert(config.firewall.rules_file == "/etc/iptables/rules.v4");
    assert(config.firewall.use_sudo);
    assert(config.firewall.builtin_forward_rules == 2);
    assert(config.logging.level == "info");

    // An empty document is all defaults
    assert(ConfigParser::loadFromString("").ports.min == 50000);
}

void test_partial_document() {
    Config config = ConfigParser::loadFromString(
        "database:\n"
        "  path: /tmp/ipam-test.db\n"
        "ports:\n"
        "  min: 40000\n"
        "  max: 40010\n"
        "firewall:\n"
        "  external_interface: eth1\n"
        "  use_sudo: false\n"
        "logging:\n"
        "  level: debug\n");

    assert(config.database.path == "/tmp/ipam-test.db");
    assert(config.ports.min == 40000);
    assert(config.ports.max == 40010);
    assert(config.ports.max_tries == 100);
    assert(config.firewall.external_interface == "eth1");
    assert(!config.firewall.use_sudo);
    assert(config.firewall.iptables == "iptables");
    assert(config.logging.level == "debug");
}

void test_invalid_documents() {
    assert(throws_runtime_error("ports: [1, 2"));
    assert(throws_runtime_error("ports:\n  min: 60000\n  max: 50000\n"));
    assert(throws_runtime_error("ports:\n  min: 0\n"));
    assert(throws_runtime_error("ports:\n  max: 70000\n"));
    assert(throws_runtime_error("ports:\n  max_tries: 0\n"));
    assert(throws_runtime_error("ports:\n  min: lots\n"));
    assert(throws_runtime_error("firewall:\n  external_interface: \"\"\n"));
    assert(throws_runtime_error("logging:\n  level: chatty\n"));
    assert(throws_runtime_error("- just\n- a list\n"));
}

void test_environment_overrides() {
    std::map<std::string, std::string> environment = {
        {"IPAM_DB_PATH", "/srv/ipam.db"},
        {"IPAM_PORT_MIN", "51000"},
        {"IPAM_PORT_MAX", "51999"},
        {"IPAM_INSERT_MAX_TRIES", "7"},
        {"IPAM_EXTERNAL_IFACE", "ens192"},
        {"IPAM_RULES_FILE", "/tmp/rules.v4"},
        {"IPAM_LOG_LEVEL", "warning"},
    };
    auto lookup = [&environment](const char* name) -> const char* {
        auto it = environment.find(name);
        return it == environment.end() ? nullptr : it->second.c_str();
    };

    Config config;
    ConfigParser::applyEnvironment(config, lookup);
    assert(config.database.path == "/srv/ipam.db");
    assert(config.ports.min == 51000);
    assert(config.ports.max == 51999);
    assert(config.ports.max_tries == 7);
    assert(config.firewall.external_interface == "ens192");
    assert(config.firewall.rules_file == "/tmp/rules.v4");
    assert(config.logging.level == "warning");

    environment["IPAM_PORT_MAX"] = "51999x";
    bool threw = false;
    try {
        ConfigParser::applyEnvironment(config, lookup);
    } catch (const std::runtime_error& e) {
        threw = true;
        assert(std::string(e.what()).find("IPAM_PORT_MAX") != std::string::npos);
    }
    assert(threw);
}

void test_environment_applies_after_file() {
    setenv("IPAM_PORT_MIN", "45000", 1);
    Config config = ConfigParser::loadFromString("ports:\n  min: 40000\n  max: 46000\n");
    assert(config.ports.min == 45000);
    assert(config.ports.max == 46000);

    // Overrides are validated as well
    setenv("IPAM_PORT_MIN", "47000", 1);
    assert(throws_runtime_error("ports:\n  min: 40000\n  max: 46000\n"));
    unsetenv("IPAM_PORT_MIN");
}

void test_load_from_file() {
    std::string path = (std::filesystem::temp_directory_path() /
                        ("ipam-portmap-config-" + std::to_string(getpid()) + ".yaml")).string();
    {
        std::ofstream file(path);
        file << "firewall:\n  builtin_forward_rules: 3\n  iptables: /usr/sbin/iptables-legacy\n";
    }
    Config config = ConfigParser::loadFromFile(path);
    assert(config.firewall.builtin_forward_rules == 3);
    assert(config.firewall.iptables == "/usr/sbin/iptables-legacy");
    std::filesystem::remove(path);

    bool threw = false;
    try {
        ConfigParser::loadFromFile(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

void test_encode_decode() {
    Config config;
    config.ports.min = 42000;
    config.firewall.use_sudo = false;

    YAML::Node node;
    node = config;
    Config decoded = node.as<Config>();
    assert(decoded.ports.min == 42000);
    assert(!decoded.firewall.use_sudo);
    assert(decoded.database.path == config.database.path);
}

void test_log_levels() {
    assert(ipam::Logger::parseLevel("DEBUG") == ipam::LogLevel::Debug);
    assert(ipam::Logger::parseLevel("warn") == ipam::LogLevel::Warning);
    assert(ipam::Logger::parseLevel("none") == ipam::LogLevel::None);
    bool threw = false;
    try {
        ipam::Logger::parseLevel("loud");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(ipam::Logger::levelToString(ipam::LogLevel::Error) == "ERROR");
}

} // namespace

int main() {
    for (const char* variable : kVariables) {
        unsetenv(variable);
    }
    ipam::Logger::setLevel(ipam::LogLevel::None);

    test_defaults();
    test_partial_document();
    test_invalid_documents();
    test_environment_overrides();
    test_environment_applies_after_file();
    test_load_from_file();
    test_encode_decode();
    test_log_levels();

    std::cout << "config tests passed\n";
    return 0;
}
