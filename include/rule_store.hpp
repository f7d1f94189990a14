/**
 * @file rule_store.hpp
 * @brief Serialized access to the port map rules of the packet filter
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the RuleStore class, the only component of ipam-portmap
 * that mutates the live nat PREROUTING and filter FORWARD chains.
 */

#pragma once

#include "command_executor.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "rule_listing.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ipam {

/**
 * @class RuleStore
 * @brief Thread-safe manipulation of the nat and filter rule tables
 *
 * A port mapping is realised by two rules:
 * - filter/FORWARD: `-p tcp -d <addr> --dport <port> -j ACCEPT`
 * - nat/PREROUTING: `-i <iface> -p tcp --dport <conn_port> -j DNAT --to <addr>:<port>`
 *
 * Rules are deleted by position, which is only safe while nobody else
 * inserts or deletes rules. Every operation therefore holds a single
 * process-wide recursive mutex. The store is also a BasicLockable so a caller
 * can keep the guard across several calls:
 *
 * @code
 * std::lock_guard<RuleStore> guard(rules);
 * auto nat_id = rules.findRule(addr, port, kNatTable, conn_port);
 * auto filter_id = rules.findRule(addr, port, kFilterTable);
 * rules.deleteRule(nat_id, kNatTable);
 * rules.deleteRule(filter_id, kFilterTable);
 * @endcode
 */
class RuleStore {
public:
    /**
     * @brief Construct a rule store
     * @param config Firewall settings (interface, binaries, rules file)
     * @param runner Command runner used for every packet filter command
     */
    RuleStore(FirewallConfig config, std::shared_ptr<CommandRunner> runner);

    RuleStore(const RuleStore&) = delete;
    RuleStore& operator=(const RuleStore&) = delete;

    // BasicLockable, re-entrant for the owning thread
    void lock() { mutex_.lock(); }
    void unlock() { mutex_.unlock(); }
    bool try_lock() { return mutex_.try_lock(); }

    /**
     * @brief Append the FORWARD rule letting traffic through to a target
     * @param target_addr Private IPv4 address
     * @param target_port Private port
     * @return Position of the new rule in the filter table
     * @throws CommandError if iptables fails
     * @throws RuleNotFound if the new rule cannot be found in the listing afterwards
     */
    RuleId forward(const std::string& target_addr, uint16_t target_port);

    /**
     * @brief Append the PREROUTING rule translating a connection port to a target
     * @param conn_port Public connection port on the external interface
     * @param target_addr Private IPv4 address
     * @param target_port Private port
     * @return Position of the new rule in the nat table
     * @throws CommandError if iptables fails
     * @throws RuleNotFound if the new rule cannot be found in the listing afterwards
     */
    RuleId prerouting(uint16_t conn_port, const std::string& target_addr, uint16_t target_port);

    /**
     * @brief Delete a rule by position
     * @param rule_id Position as returned by findRule()
     * @param table "nat" or "filter"
     * @throws std::invalid_argument if table is not recognized
     * @throws CommandError if iptables fails (e.g. no rule at that position)
     */
    void deleteRule(const RuleId& rule_id, const std::string& table);

    /**
     * @brief Find the position of the first rule for a target
     * @param target_addr Private IPv4 address
     * @param target_port Private port
     * @param table "nat" or "filter"
     * @param conn_port Connection port, required for the nat table
     * @return Position of the first matching rule
     * @throws std::invalid_argument if table is unknown or conn_port is missing for nat
     * @throws RuleNotFound if no rule matches
     *
     * FORWARD rules carry no connection port, so two mappings to the same
     * target share identical filter rules. Such an ambiguous match is logged.
     */
    RuleId findRule(const std::string& target_addr, uint16_t target_port,
                    const std::string& table,
                    std::optional<uint16_t> conn_port = std::nullopt);

    /**
     * @brief List and parse the port map rules of a table
     * @param table "nat" or "filter"
     * @return Rules in listing order; built-in FORWARD rules are excluded
     */
    RuleList show(const std::string& table);

    /**
     * @brief List a table without parsing
     * @param table "nat" or "filter"
     * @return Raw iptables output
     */
    std::string showRaw(const std::string& table);

    /**
     * @brief Persist the kernel rule set so it survives a reboot
     * @throws CommandError if iptables-save fails
     * @throws std::runtime_error if the rules file cannot be written
     */
    void saveRules();

    /**
     * @brief Create both rules of a port mapping
     * @param conn_port Public connection port
     * @param target_port Private port
     * @param target_addr Private IPv4 address
     * @return (forward rule id, prerouting rule id)
     *
     * The FORWARD rule is created first; it is inert without the DNAT rule.
     * If the DNAT rule cannot be created the FORWARD rule is deleted again
     * and the original error is rethrown. On success the rules are saved.
     */
    std::pair<RuleId, RuleId> mapPort(uint16_t conn_port, uint16_t target_port,
                                      const std::string& target_addr);

    const FirewallConfig& config() const { return config_; }

private:
    FirewallConfig config_;
    std::shared_ptr<CommandRunner> runner_;
    std::recursive_mutex mutex_;
    Logger logger_{"RuleStore"};

    static std::string chainFor(const std::string& table);
    std::vector<std::string> iptablesCommand(std::vector<std::string> args) const;
    CommandResult run(const std::vector<std::string>& args);
    std::string listTable(const std::string& table);
    RuleList parse(const std::string& table, const std::string& output) const;
    std::optional<RuleId> locate(const RuleList& rules, const std::string& target_addr,
                                 uint16_t target_port, std::optional<uint16_t> conn_port,
                                 bool last) const;
};

} // namespace ipam
