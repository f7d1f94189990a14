#include "portmap_coordinator.hpp"
#include <arpa/inet.h>
#include <mutex>
#include <stdexcept>

namespace ipam {

PortMapCoordinator::PortMapCoordinator(RecordStore& records, RuleStore& rules)
    : records_(records)
    , rules_(rules) {
}

uint16_t PortMapCoordinator::create(const std::string& target_addr, int target_port,
                                    const std::string& target_name,
                                    const std::string& target_component) {
    validateAddress(target_addr);
    validatePort(target_port, "target_port");
    auto port = static_cast<uint16_t>(target_port);

    uint16_t conn_port = records_.addRecord(target_addr, port, target_name, target_component);
    try {
        rules_.mapPort(conn_port, port, target_addr);
    } catch (const std::exception& e) {
        logger_.error("Failed to create firewall rules for port " + std::to_string(conn_port) +
                      ": " + e.what());
        logger_.warning("Deleting record of port " + std::to_string(conn_port));
        try {
            records_.deleteRecord(conn_port);
        } catch (const std::exception& undo_error) {
            logger_.error("Failed to delete record of port " + std::to_string(conn_port) + ": " +
                          undo_error.what());
        }
        throw;
    }

    logger_.info("Mapped port " + std::to_string(conn_port) + " to " + target_addr + ":" +
                 std::to_string(port) + " (" + target_name + ")");
    return conn_port;
}

Outcome PortMapCoordinator::destroy(int conn_port) {
    if (conn_port < 1 || conn_port > 65535) {
        return {"Param conn_port must be between 1 and 65535, supplied: " + std::to_string(conn_port),
                Status::BadRequest};
    }
    auto port = static_cast<uint16_t>(conn_port);

    try {
        // Held from the first lookup to the last deletion: positions must not move
        std::lock_guard<RuleStore> guard(rules_);

        Resolution mapping = resolve(port);
        if (!mapping.outcome.isSuccess()) {
            logger_.warning("Not destroying port " + std::to_string(port) + ": " + mapping.outcome.error);
            return mapping.outcome;
        }
        return removePortMap(port, mapping);
    } catch (const std::exception& e) {
        logger_.error("Failed to destroy port map " + std::to_string(port) + ": " + e.what());
        return {e.what(), Status::ServerError};
    }
}

Outcome PortMapCoordinator::inspect(int conn_port) {
    if (conn_port < 1 || conn_port > 65535) {
        return {"Param conn_port must be between 1 and 65535, supplied: " + std::to_string(conn_port),
                Status::BadRequest};
    }

    try {
        std::lock_guard<RuleStore> guard(rules_);
        return resolve(static_cast<uint16_t>(conn_port)).outcome;
    } catch (const std::exception& e) {
        logger_.error("Failed to inspect port map " + std::to_string(conn_port) + ": " + e.what());
        return {e.what(), Status::ServerError};
    }
}

void PortMapCoordinator::verify(int conn_port) {
    Outcome outcome = inspect(conn_port);
    if (!outcome.isSuccess()) {
        throw ConsistencyError(outcome.error, outcome.status);
    }
}

Outcome PortMapCoordinator::consistencyCheck(const std::optional<RuleId>& nat_id,
                                             const std::optional<RuleId>& filter_id,
                                             const std::optional<uint16_t>& target_port,
                                             const std::optional<std::string>& target_addr) {
    bool record_present = target_port.has_value() && *target_port != 0 &&
                          target_addr.has_value() && !target_addr->empty();
    bool rules_present = nat_id.has_value() && !nat_id->empty() &&
                         filter_id.has_value() && !filter_id->empty();

    if (record_present && !rules_present) {
        return {"DB record exist, but no iptable record; contact admin.", Status::ServerError};
    } else if (!record_present && rules_present) {
        return {"iptable record exist, but no DB record; contact admin.", Status::ServerError};
    } else if (!record_present) {
        return {"No such port mapping record", Status::NotFound};
    }
    return {"", Status::Ok};
}

std::map<uint16_t, PortMappingRecord> PortMapCoordinator::lookupRecords(const RecordFilter& filter) {
    return records_.lookupByFilter(filter);
}

std::map<std::string, AddressInfo> PortMapCoordinator::lookupAddresses(const AddressFilter& filter) {
    return records_.lookupAddresses(filter);
}

RuleList PortMapCoordinator::lookupRules(const std::string& table) {
    return rules_.show(table);
}

PortMapCoordinator::Resolution PortMapCoordinator::resolve(uint16_t conn_port) {
    Resolution mapping;
    auto [target_port, target_addr] = records_.getRecord(conn_port);
    mapping.target_port = target_port;
    mapping.target_addr = target_addr;

    if (target_port && target_addr) {
        mapping.nat_id = tryFindRule(*target_addr, *target_port, kNatTable, conn_port);
        mapping.filter_id = tryFindRule(*target_addr, *target_port, kFilterTable, std::nullopt);
    } else {
        // Without a record the target is only known from a DNAT rule for this port
        for (const auto& rule : rules_.show(kNatTable)) {
            if (rule.conn_port == conn_port) {
                mapping.nat_id = rule.position;
                mapping.filter_id = tryFindRule(rule.target_addr, rule.target_port,
                                                kFilterTable, std::nullopt);
                break;
            }
        }
    }

    mapping.outcome = consistencyCheck(mapping.nat_id, mapping.filter_id,
                                       mapping.target_port, mapping.target_addr);
    return mapping;
}

Outcome PortMapCoordinator::removePortMap(uint16_t conn_port, const Resolution& mapping) {
    const std::string& target_addr = *mapping.target_addr;
    uint16_t target_port = *mapping.target_port;

    rules_.deleteRule(*mapping.nat_id, kNatTable);

    try {
        rules_.deleteRule(*mapping.filter_id, kFilterTable);
    } catch (const std::exception& e) {
        logger_.error("Failed to delete FORWARD rule " + *mapping.filter_id + ": " + e.what());
        logger_.warning("Restoring FORWARD rule for " + target_addr + ":" + std::to_string(target_port));
        try {
            rules_.forward(target_addr, target_port);
            rules_.saveRules();
        } catch (const std::exception& undo_error) {
            logger_.error("Failed to restore FORWARD rule: " + std::string(undo_error.what()));
        }
        return {e.what(), Status::ServerError};
    }

    try {
        records_.deleteRecord(conn_port);
    } catch (const std::exception& e) {
        logger_.error("Failed to delete record of port " + std::to_string(conn_port) + ": " + e.what());
        logger_.warning("Restoring firewall rules of port " + std::to_string(conn_port));
        try {
            rules_.mapPort(conn_port, target_port, target_addr);
        } catch (const std::exception& undo_error) {
            logger_.error("Failed to restore firewall rules of port " + std::to_string(conn_port) +
                          ": " + undo_error.what());
        }
        return {e.what(), Status::ServerError};
    }

    // The kernel state is already correct; a stale rules file is only logged
    try {
        rules_.saveRules();
    } catch (const std::exception& e) {
        logger_.error("Failed to save firewall rules after removing port " +
                      std::to_string(conn_port) + ": " + e.what());
    }

    logger_.info("Removed port map " + std::to_string(conn_port) + " to " + target_addr + ":" +
                 std::to_string(target_port));
    return {"", Status::Ok};
}

std::optional<RuleId> PortMapCoordinator::tryFindRule(const std::string& target_addr,
                                                      uint16_t target_port,
                                                      const std::string& table,
                                                      std::optional<uint16_t> conn_port) {
    try {
        return rules_.findRule(target_addr, target_port, table, conn_port);
    } catch (const RuleNotFound&) {
        return std::nullopt;
    }
}

void PortMapCoordinator::validatePort(int port, const std::string& name) {
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("Param " + name + " must be between 1 and 65535, supplied: " +
                                    std::to_string(port));
    }
}

void PortMapCoordinator::validateAddress(const std::string& addr) {
    in_addr parsed{};
    if (inet_pton(AF_INET, addr.c_str(), &parsed) != 1) {
        throw std::invalid_argument("Param target_addr must be an IPv4 address, supplied: " + addr);
    }
}

} // namespace ipam
