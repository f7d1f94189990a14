/**
 * @file portmap_coordinator.hpp
 * @brief Create and destroy port mappings across the record and rule stores
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the PortMapCoordinator class, the entry point used by the
 * request layer. A port mapping lives in three places that fail independently:
 * a database record, a filter/FORWARD rule and a nat/PREROUTING rule. The
 * coordinator runs each multi-step change as a sequence of forward actions
 * with compensating actions on failure.
 *
 * Create order:  record -> FORWARD rule -> PREROUTING rule
 * Destroy order: PREROUTING rule -> FORWARD rule -> record
 *
 * A crash between two steps is not repaired automatically; the next
 * consistency check on that connection port reports it.
 */

#pragma once

#include "errors.hpp"
#include "logger.hpp"
#include "record_store.hpp"
#include "rule_store.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace ipam {

/**
 * @class PortMapCoordinator
 * @brief Keeps a port map record and its two firewall rules consistent
 *
 * The coordinator does not own the stores. It is cheap to construct, so a
 * request typically creates one around its own RecordStore and the shared
 * RuleStore.
 */
class PortMapCoordinator {
public:
    PortMapCoordinator(RecordStore& records, RuleStore& rules);

    /**
     * @brief Create a port mapping
     * @param target_addr Private IPv4 address of the machine
     * @param target_port Private port on the machine
     * @param target_name Human name of the machine
     * @param target_component Category of the machine
     * @return Connection port users connect to
     * @throws std::invalid_argument for a malformed address or port, before any change
     * @throws CapacityExhausted, StoreError if no record could be created
     * @throws CommandError, RuleNotFound if the rules could not be created; the
     *         record has been deleted again
     */
    uint16_t create(const std::string& target_addr, int target_port,
                    const std::string& target_name, const std::string& target_component);

    /**
     * @brief Destroy a port mapping
     * @param conn_port Connection port of the mapping
     * @return Empty error on success, otherwise the failure and its classification
     *
     * Never throws. The record and both rules are looked up and checked for
     * consistency before anything is deleted. If a later step fails, the
     * earlier deletions are compensated (see the file comment) and the
     * original error is reported.
     */
    Outcome destroy(int conn_port);

    /**
     * @brief Check a mapping for consistency without changing anything
     * @param conn_port Connection port of the mapping
     * @return Same classification destroy() would compute before deleting
     */
    Outcome inspect(int conn_port);

    /**
     * @brief Like inspect(), but throws on any inconsistency
     * @param conn_port Connection port of the mapping
     * @throws ConsistencyError carrying the classification
     */
    void verify(int conn_port);

    /**
     * @brief Classify the presence of a record and its rules
     * @param nat_id Position of the nat rule, if found
     * @param filter_id Position of the filter rule, if found
     * @param target_port Target port of the record, if found
     * @param target_addr Target address of the record, if found
     * @return ("", Ok) when both record and rules are present
     */
    static Outcome consistencyCheck(const std::optional<RuleId>& nat_id,
                                    const std::optional<RuleId>& filter_id,
                                    const std::optional<uint16_t>& target_port,
                                    const std::optional<std::string>& target_addr);

    std::map<uint16_t, PortMappingRecord> lookupRecords(const RecordFilter& filter);
    std::map<std::string, AddressInfo> lookupAddresses(const AddressFilter& filter);
    RuleList lookupRules(const std::string& table);

private:
    /// Everything destroy() needs to know about a mapping before deleting it
    struct Resolution {
        std::optional<uint16_t> target_port;
        std::optional<std::string> target_addr;
        std::optional<RuleId> nat_id;
        std::optional<RuleId> filter_id;
        Outcome outcome;
    };

    RecordStore& records_;
    RuleStore& rules_;
    Logger logger_{"PortMapCoordinator"};

    // Caller must hold the rule store guard
    Resolution resolve(uint16_t conn_port);
    Outcome removePortMap(uint16_t conn_port, const Resolution& mapping);
    std::optional<RuleId> tryFindRule(const std::string& target_addr, uint16_t target_port,
                                      const std::string& table, std::optional<uint16_t> conn_port);

    static void validatePort(int port, const std::string& name);
    static void validateAddress(const std::string& addr);
};

} // namespace ipam
