#include "rule_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace ipam {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string describeTarget(const std::string& target_addr, uint16_t target_port) {
    return target_addr + ":" + std::to_string(target_port);
}

} // namespace

RuleStore::RuleStore(FirewallConfig config, std::shared_ptr<CommandRunner> runner)
    : config_(std::move(config))
    , runner_(std::move(runner)) {
    if (!runner_) {
        throw std::invalid_argument("RuleStore requires a command runner");
    }
}

RuleId RuleStore::forward(const std::string& target_addr, uint16_t target_port) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    run(iptablesCommand({"-A", "FORWARD", "-p", "tcp", "-d", target_addr,
                         "--dport", std::to_string(target_port), "-j", "ACCEPT"}));

    // Appended rules land at the end of the chain, so the new rule is the last match
    auto rule_id = locate(show(kFilterTable), target_addr, target_port, std::nullopt, true);
    if (!rule_id) {
        throw RuleNotFound("Unable to find newly created FORWARD rule for " +
                           describeTarget(target_addr, target_port));
    }
    logger_.info("Created FORWARD rule " + *rule_id + " for " +
                 describeTarget(target_addr, target_port));
    return *rule_id;
}

RuleId RuleStore::prerouting(uint16_t conn_port, const std::string& target_addr,
                             uint16_t target_port) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    run(iptablesCommand({"-A", "PREROUTING", "-t", "nat", "-i", config_.external_interface,
                         "-p", "tcp", "--dport", std::to_string(conn_port),
                         "-j", "DNAT", "--to", describeTarget(target_addr, target_port)}));

    auto rule_id = locate(show(kNatTable), target_addr, target_port, conn_port, true);
    if (!rule_id) {
        throw RuleNotFound("Unable to find newly created PREROUTING rule for port " +
                           std::to_string(conn_port) + " to " +
                           describeTarget(target_addr, target_port));
    }
    logger_.info("Created PREROUTING rule " + *rule_id + " mapping port " +
                 std::to_string(conn_port) + " to " + describeTarget(target_addr, target_port));
    return *rule_id;
}

void RuleStore::deleteRule(const RuleId& rule_id, const std::string& table) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    std::string chain = chainFor(table);
    if (rule_id.empty() ||
        !std::all_of(rule_id.begin(), rule_id.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("Rule id must be a rule position, supplied: " + rule_id);
    }

    run(iptablesCommand({"-t", toLower(table), "-D", chain, rule_id}));
    logger_.info("Deleted rule " + rule_id + " from " + toLower(table) + "/" + chain);
}

RuleId RuleStore::findRule(const std::string& target_addr, uint16_t target_port,
                           const std::string& table, std::optional<uint16_t> conn_port) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    std::string normalized = toLower(table);
    chainFor(normalized);
    if (normalized == kNatTable && !conn_port) {
        throw std::invalid_argument("Must supply conn_port when looking up NAT rules");
    }
    if (normalized == kFilterTable) {
        // FORWARD rules carry no connection port
        conn_port.reset();
    }

    RuleList rules = show(normalized);
    auto first = locate(rules, target_addr, target_port, conn_port, false);
    if (!first) {
        throw RuleNotFound("Unable to find " + normalized + " rule for " +
                           describeTarget(target_addr, target_port));
    }

    auto matches = std::count_if(rules.begin(), rules.end(), [&](const FirewallRule& rule) {
        return rule.target_addr == target_addr && rule.target_port == target_port &&
               rule.conn_port == conn_port;
    });
    if (matches > 1) {
        logger_.warning("Ambiguous " + normalized + " lookup: " + std::to_string(matches) +
                        " rules match " + describeTarget(target_addr, target_port) +
                        ", using rule " + *first);
    }
    return *first;
}

RuleList RuleStore::show(const std::string& table) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    std::string normalized = toLower(table);
    return parse(normalized, listTable(normalized));
}

std::string RuleStore::showRaw(const std::string& table) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    return listTable(toLower(table));
}

void RuleStore::saveRules() {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    std::vector<std::string> args;
    if (config_.use_sudo) {
        args.push_back("sudo");
    }
    args.push_back(config_.iptables_save);
    CommandResult result = run(args);

    std::ofstream rules_file(config_.rules_file, std::ios::out | std::ios::trunc);
    if (!rules_file.is_open()) {
        throw std::runtime_error("Unable to open rules file for writing: " + config_.rules_file);
    }
    rules_file << result.stdout_output << '\n';
    rules_file.flush();
    if (!rules_file) {
        throw std::runtime_error("Failed to write rules file: " + config_.rules_file);
    }
    logger_.debug("Saved firewall rules to " + config_.rules_file);
}

std::pair<RuleId, RuleId> RuleStore::mapPort(uint16_t conn_port, uint16_t target_port,
                                             const std::string& target_addr) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);

    RuleId forward_id = forward(target_addr, target_port);
    RuleId prerouting_id;
    try {
        prerouting_id = prerouting(conn_port, target_addr, target_port);
    } catch (const std::exception& e) {
        logger_.warning("Creating PREROUTING rule for port " + std::to_string(conn_port) +
                        " failed (" + e.what() + "), removing FORWARD rule " + forward_id);
        try {
            deleteRule(forward_id, kFilterTable);
        } catch (const std::exception& undo_error) {
            logger_.error("Failed to remove FORWARD rule " + forward_id + ": " + undo_error.what());
        }
        throw;
    }

    try {
        saveRules();
    } catch (const std::exception& e) {
        // Rules that cannot be persisted are removed so they never outlive their record
        logger_.warning("Saving rules failed (" + std::string(e.what()) + "), removing rules " +
                        prerouting_id + " (nat) and " + forward_id + " (filter)");
        try {
            deleteRule(prerouting_id, kNatTable);
        } catch (const std::exception& undo_error) {
            logger_.error("Failed to remove PREROUTING rule " + prerouting_id + ": " +
                          undo_error.what());
        }
        try {
            deleteRule(forward_id, kFilterTable);
        } catch (const std::exception& undo_error) {
            logger_.error("Failed to remove FORWARD rule " + forward_id + ": " + undo_error.what());
        }
        throw;
    }

    return {forward_id, prerouting_id};
}

std::string RuleStore::chainFor(const std::string& table) {
    std::string normalized = toLower(table);
    if (normalized == kNatTable) {
        return "PREROUTING";
    } else if (normalized == kFilterTable) {
        return "FORWARD";
    }
    throw std::invalid_argument("Param \"table\" must be either \"nat\" or \"filter\", supplied: " +
                                table);
}

std::vector<std::string> RuleStore::iptablesCommand(std::vector<std::string> args) const {
    std::vector<std::string> command;
    if (config_.use_sudo) {
        command.push_back("sudo");
    }
    command.push_back(config_.iptables);
    command.insert(command.end(), args.begin(), args.end());
    return command;
}

CommandResult RuleStore::run(const std::vector<std::string>& args) {
    CommandResult result = runner_->run(args);
    if (!result.isSuccess()) {
        throw CommandError(result);
    }
    return result;
}

std::string RuleStore::listTable(const std::string& table) {
    std::string chain = chainFor(table);
    CommandResult result = run(iptablesCommand({"--numeric", "-L", chain, "-t", table,
                                                "--line-numbers"}));
    return result.stdout_output;
}

RuleList RuleStore::parse(const std::string& table, const std::string& output) const {
    if (table == kNatTable) {
        return RuleListingParser::parseNat(output);
    }
    return RuleListingParser::parseFilter(output, config_.builtin_forward_rules);
}

std::optional<RuleId> RuleStore::locate(const RuleList& rules, const std::string& target_addr,
                                        uint16_t target_port, std::optional<uint16_t> conn_port,
                                        bool last) const {
    std::optional<RuleId> found;
    for (const auto& rule : rules) {
        if (rule.target_addr == target_addr && rule.target_port == target_port &&
            rule.conn_port == conn_port) {
            found = rule.position;
            if (!last) {
                break;
            }
        }
    }
    return found;
}

} // namespace ipam
