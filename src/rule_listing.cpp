#include "rule_listing.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ipam {

namespace {

const Logger logger("RuleListingParser");

// Returns the text after `prefix` in the first column starting with it
std::optional<std::string> findField(const std::vector<std::string>& columns,
                                     const std::string& prefix) {
    for (const auto& column : columns) {
        if (column.compare(0, prefix.size(), prefix) == 0) {
            return column.substr(prefix.size());
        }
    }
    return std::nullopt;
}

// --numeric prints the protocol by name on some builds and by number on others
bool isTcp(const std::string& protocol) {
    return protocol == "tcp" || protocol == "6";
}

} // namespace

RuleList RuleListingParser::parseNat(const std::string& output) {
    RuleList rules;
    std::istringstream stream(output);
    std::string row;

    while (std::getline(stream, row)) {
        auto columns = splitColumns(row);
        // Skips the "Chain ..." and "num target ..." headers and blank lines
        if (columns.empty() || !isPosition(columns[0])) {
            continue;
        }
        if (columns.size() < 3 || columns[1] != "DNAT" || !isTcp(columns[2])) {
            logger.debug("Skipping PREROUTING rule that is not a tcp DNAT rule: " + row);
            continue;
        }

        auto dport = findField(columns, "dpt:");
        auto destination = findField(columns, "to:");
        if (!dport || !destination) {
            logger.debug("Skipping PREROUTING rule without port mapping: " + row);
            continue;
        }

        // "to:" carries "<addr>:<port>"
        auto colon = destination->rfind(':');
        if (colon == std::string::npos) {
            logger.debug("Skipping PREROUTING rule without target port: " + row);
            continue;
        }
        auto conn_port = parsePort(*dport);
        auto target_port = parsePort(destination->substr(colon + 1));
        if (!conn_port || !target_port) {
            logger.debug("Skipping PREROUTING rule with malformed ports: " + row);
            continue;
        }

        FirewallRule rule;
        rule.table = kNatTable;
        rule.position = columns[0];
        rule.target_addr = destination->substr(0, colon);
        rule.target_port = *target_port;
        rule.conn_port = conn_port;
        rules.push_back(rule);
    }

    return rules;
}

RuleList RuleListingParser::parseFilter(const std::string& output, int builtin_rules) {
    RuleList rules;
    std::istringstream stream(output);
    std::string row;

    while (std::getline(stream, row)) {
        auto columns = splitColumns(row);
        if (columns.empty() || !isPosition(columns[0])) {
            continue;
        }
        // The gateway's own rules always come first in FORWARD
        if (std::stoi(columns[0]) <= builtin_rules) {
            continue;
        }
        // num target prot opt source destination tcp dpt:<port>
        if (columns.size() < 8 || columns[1] != "ACCEPT" || !isTcp(columns[2])) {
            logger.debug("Skipping FORWARD rule that is not a port map rule: " + row);
            continue;
        }

        auto dport = findField(columns, "dpt:");
        std::optional<uint16_t> target_port;
        if (dport) {
            target_port = parsePort(*dport);
        }
        if (!target_port) {
            logger.debug("Skipping FORWARD rule without destination port: " + row);
            continue;
        }

        std::string target_addr = columns[5];
        auto slash = target_addr.find('/');
        if (slash != std::string::npos) {
            target_addr.erase(slash);
        }

        FirewallRule rule;
        rule.table = kFilterTable;
        rule.position = columns[0];
        rule.target_addr = target_addr;
        rule.target_port = *target_port;
        rules.push_back(rule);
    }

    return rules;
}

std::vector<std::string> RuleListingParser::splitColumns(const std::string& row) {
    std::vector<std::string> columns;
    std::istringstream stream(row);
    std::string column;
    while (stream >> column) {
        columns.push_back(column);
    }
    return columns;
}

bool RuleListingParser::isPosition(const std::string& column) {
    return !column.empty() && column.size() <= 9 &&
           std::all_of(column.begin(), column.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<uint16_t> RuleListingParser::parsePort(const std::string& text) {
    if (!isPosition(text)) {
        return std::nullopt;
    }
    int value = std::stoi(text);
    if (value < 1 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

} // namespace ipam
