/**
 * @file rule_listing.hpp
 * @brief Firewall rule model and iptables listing parser for ipam-portmap
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * Port map rules are never stored by ipam-portmap itself. They are always
 * re-derived from the live packet filter by listing a chain with
 * `iptables --numeric -L <chain> -t <table> --line-numbers` and parsing the
 * output with the RuleListingParser below.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ipam {

/// 1-based rule position as printed by iptables --line-numbers
using RuleId = std::string;

/// Table holding the DNAT rules (PREROUTING chain)
inline const std::string kNatTable = "nat";

/// Table holding the ACCEPT rules (FORWARD chain)
inline const std::string kFilterTable = "filter";

/**
 * @struct FirewallRule
 * @brief One port map rule as found in the live rule tables
 *
 * conn_port is only present for rules of the nat table; a filter table
 * FORWARD rule only knows the target it lets traffic through to.
 */
struct FirewallRule {
    std::string table;                  ///< "nat" or "filter"
    RuleId position;                    ///< Position assigned by the rule table
    std::string target_addr;            ///< Private IPv4 address of the target
    uint16_t target_port = 0;           ///< Private port of the target
    std::optional<uint16_t> conn_port;  ///< Public connection port (nat only)

    bool operator==(const FirewallRule& other) const {
        return table == other.table && position == other.position &&
               target_addr == other.target_addr && target_port == other.target_port &&
               conn_port == other.conn_port;
    }
};

/// Rules of one chain, in listing order
using RuleList = std::vector<FirewallRule>;

/**
 * @class RuleListingParser
 * @brief Parser for numeric iptables listings with line numbers
 *
 * Example nat listing:
 * @code
 * Chain PREROUTING (policy ACCEPT)
 * num  target     prot opt source               destination
 * 1    DNAT       tcp  --  0.0.0.0/0            0.0.0.0/0            tcp dpt:6000 to:192.168.1.2:22
 * @endcode
 *
 * Example filter listing (rules 1 and 2 are the gateway's own rules):
 * @code
 * Chain FORWARD (policy ACCEPT)
 * num  target     prot opt source               destination
 * 1    LOG        all  --  0.0.0.0/0            0.0.0.0/0            LOG flags 0 level 4
 * 2    ACCEPT     all  --  0.0.0.0/0            0.0.0.0/0
 * 3    ACCEPT     tcp  --  0.0.0.0/0            192.168.1.2          tcp dpt:22
 * @endcode
 *
 * Rows that do not have the shape of a port map rule are skipped.
 */
class RuleListingParser {
public:
    /**
     * @brief Parse a PREROUTING listing of the nat table
     * @param output Raw listing text
     * @return DNAT rules in listing order
     */
    static RuleList parseNat(const std::string& output);

    /**
     * @brief Parse a FORWARD listing of the filter table
     * @param output Raw listing text
     * @param builtin_rules Number of leading rules that belong to the gateway itself
     * @return ACCEPT rules in listing order, built-in rules excluded
     */
    static RuleList parseFilter(const std::string& output, int builtin_rules = 2);

private:
    static std::vector<std::string> splitColumns(const std::string& row);
    static bool isPosition(const std::string& column);
    static std::optional<uint16_t> parsePort(const std::string& text);
};

} // namespace ipam
