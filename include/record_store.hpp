/**
 * @file record_store.hpp
 * @brief Durable storage of port mapping records
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the RecordStore class which keeps one row per port
 * mapping in an SQLite database:
 *
 * @code
 * CREATE TABLE ipam (conn_port INTEGER PRIMARY KEY NOT NULL, target_addr TEXT,
 *                    target_port INTEGER, target_name TEXT,
 *                    target_component TEXT, routable BOOLEAN);
 * @endcode
 *
 * Uniqueness of conn_port is enforced by the database. Two requests that draw
 * the same random port race on the insert and the loser simply draws again.
 */

#pragma once

#include "config.hpp"
#include "logger.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct sqlite3;

namespace ipam {

/// A bound parameter or a result column: NULL, integer or text
using SqlValue = std::variant<std::monostate, int64_t, std::string>;

/// One result row
using SqlRow = std::vector<SqlValue>;

/**
 * @struct PortMappingRecord
 * @brief One row of the ipam table
 */
struct PortMappingRecord {
    uint16_t conn_port = 0;             ///< Public connection port (unique)
    std::string target_addr;            ///< Private IPv4 address
    uint16_t target_port = 0;           ///< Private port
    std::string target_name;            ///< Human name of the machine
    std::string target_component;       ///< Category of the machine
    std::optional<bool> routable;       ///< Last liveness probe result, if any
};

/**
 * @struct RecordFilter
 * @brief Optional conditions for RecordStore::lookupByFilter
 *
 * Supplied fields are combined with AND; omitted fields match everything.
 */
struct RecordFilter {
    std::optional<std::string> name;
    std::optional<std::string> addr;
    std::optional<std::string> component;
    std::optional<uint16_t> conn_port;
    std::optional<uint16_t> target_port;
};

/**
 * @struct AddressFilter
 * @brief Optional conditions for RecordStore::lookupAddresses
 */
struct AddressFilter {
    std::optional<std::string> name;
    std::optional<std::string> addr;
    std::optional<std::string> component;
};

/**
 * @struct AddressInfo
 * @brief Addresses known for one machine name
 *
 * routable is false when any address of the machine failed its last probe,
 * true when every probed address answered, and empty when none was probed.
 */
struct AddressInfo {
    std::vector<std::string> addrs;     ///< Distinct addresses, sorted
    std::string component;              ///< Category of the machine
    std::optional<bool> routable;       ///< Aggregated liveness
};

/**
 * @class RecordStore
 * @brief SQLite-backed port mapping records
 *
 * Each statement runs in SQLite's autocommit mode, so it either commits as a
 * whole or leaves no trace. Every failure is reported as a StoreError carrying
 * the SQLite extended result code.
 *
 * A RecordStore owns one database connection and is meant to be used by one
 * request at a time; concurrent requests open their own stores.
 */
class RecordStore {
public:
    /// Draws a candidate connection port
    using PortPicker = std::function<uint16_t()>;

    /**
     * @brief Open (and if needed create) the record database
     * @param database Database settings
     * @param ports Connection port range and retry budget
     * @param picker Port generator; uniform over the range when empty
     * @throws StoreError if the database cannot be opened or initialised
     */
    RecordStore(const DatabaseConfig& database, const PortRangeConfig& ports,
                PortPicker picker = nullptr);
    ~RecordStore();

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    /**
     * @brief Run a single parameterized SQL statement
     * @param sql Statement with '?' placeholders
     * @param params Values bound to the placeholders in order
     * @return Result rows (empty for statements that return none)
     * @throws StoreError on any SQLite failure; an open transaction is rolled back
     */
    std::vector<SqlRow> execute(const std::string& sql, const std::vector<SqlValue>& params = {});

    /**
     * @brief Create the record of a new port mapping
     * @param target_addr Private IPv4 address
     * @param target_port Private port
     * @param target_name Human name of the machine
     * @param target_component Category of the machine
     * @return The connection port allocated for the mapping
     * @throws CapacityExhausted if every attempt collided with an existing port
     * @throws StoreError for any failure other than a port collision
     */
    uint16_t addRecord(const std::string& target_addr, uint16_t target_port,
                       const std::string& target_name, const std::string& target_component);

    /**
     * @brief Delete the record of a port mapping; deleting nothing is not an error
     * @param conn_port Connection port of the mapping
     */
    void deleteRecord(uint16_t conn_port);

    /**
     * @brief Look up the target of a connection port
     * @param conn_port Connection port of the mapping
     * @return (target_port, target_addr), both empty when there is no such record
     */
    std::pair<std::optional<uint16_t>, std::optional<std::string>> getRecord(uint16_t conn_port);

    /**
     * @brief Find records matching every supplied filter field
     * @param filter Optional conditions
     * @return Matching records keyed by connection port
     */
    std::map<uint16_t, PortMappingRecord> lookupByFilter(const RecordFilter& filter);

    /**
     * @brief Find the addresses of machines matching every supplied filter field
     * @param filter Optional conditions
     * @return Address information keyed by machine name
     */
    std::map<std::string, AddressInfo> lookupAddresses(const AddressFilter& filter);

    /**
     * @brief Distinct (target_name, target_addr) pairs, the work list of the liveness prober
     */
    std::vector<std::pair<std::string, std::string>> listTargets();

    /**
     * @brief Record the result of a liveness probe
     * @param target_name Machine name
     * @param target_addr Probed address
     * @param routable Whether the address answered
     */
    void setRoutable(const std::string& target_name, const std::string& target_addr, bool routable);

private:
    sqlite3* db_ = nullptr;
    PortRangeConfig ports_;
    PortPicker picker_;
    std::mt19937 engine_;
    std::uniform_int_distribution<int> distribution_;
    Logger logger_{"RecordStore"};

    void createSchema();
    [[noreturn]] void fail(const std::string& context);
};

} // namespace ipam
