#include "record_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <memory>
#include <sqlite3.h>
#include <type_traits>

namespace ipam {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

const char* CREATE_SCHEMA =
    "CREATE TABLE IF NOT EXISTS ipam ("
    "  conn_port INTEGER PRIMARY KEY NOT NULL,"
    "  target_addr TEXT,"
    "  target_port INTEGER,"
    "  target_name TEXT,"
    "  target_component TEXT,"
    "  routable BOOLEAN"
    ");";

const char* RECORD_COLUMNS =
    "SELECT conn_port, target_addr, target_port, target_name, target_component, routable FROM ipam";

int64_t asInteger(const SqlValue& value) {
    if (const auto* number = std::get_if<int64_t>(&value)) {
        return *number;
    }
    return 0;
}

std::string asText(const SqlValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const auto* number = std::get_if<int64_t>(&value)) {
        return std::to_string(*number);
    }
    return "";
}

std::optional<bool> asOptionalBool(const SqlValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return std::nullopt;
    }
    return asInteger(value) != 0;
}

// Appends "<column> = ?" for a supplied filter field
template<typename T>
void addClause(std::vector<std::string>& clauses, std::vector<SqlValue>& params,
               const char* column, const std::optional<T>& value) {
    if (!value) {
        return;
    }
    clauses.push_back(std::string(column) + " = ?");
    if constexpr (std::is_same_v<T, std::string>) {
        params.emplace_back(*value);
    } else {
        params.emplace_back(static_cast<int64_t>(*value));
    }
}

std::string whereClause(const std::vector<std::string>& clauses) {
    std::string where;
    for (size_t i = 0; i < clauses.size(); ++i) {
        where += (i == 0 ? " WHERE " : " AND ") + clauses[i];
    }
    return where;
}

} // namespace

RecordStore::RecordStore(const DatabaseConfig& database, const PortRangeConfig& ports,
                         PortPicker picker)
    : ports_(ports)
    , picker_(std::move(picker))
    , engine_(std::random_device{}())
    , distribution_(ports.min, std::max(ports.min, ports.max)) {
    if (!ports_.isValid()) {
        throw std::invalid_argument("Invalid port range: " + ports_.getErrorMessage());
    }
    if (!picker_) {
        picker_ = [this]() { return static_cast<uint16_t>(distribution_(engine_)); };
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(database.path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        int code = db_ ? sqlite3_extended_errcode(db_) : SQLITE_NOMEM;
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open database " + database.path + ": " + message, code);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, database.busy_timeout_ms);

    try {
        createSchema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

RecordStore::~RecordStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

std::vector<SqlRow> RecordStore::execute(const std::string& sql, const std::vector<SqlValue>& params) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        fail("Failed to prepare statement");
    }
    StatementPtr statement(raw, &sqlite3_finalize);

    for (size_t i = 0; i < params.size(); ++i) {
        int index = static_cast<int>(i + 1);
        int rc = SQLITE_OK;
        if (const auto* number = std::get_if<int64_t>(&params[i])) {
            rc = sqlite3_bind_int64(statement.get(), index, *number);
        } else if (const auto* text = std::get_if<std::string>(&params[i])) {
            rc = sqlite3_bind_text(statement.get(), index, text->c_str(),
                                   static_cast<int>(text->size()), SQLITE_TRANSIENT);
        } else {
            rc = sqlite3_bind_null(statement.get(), index);
        }
        if (rc != SQLITE_OK) {
            fail("Failed to bind parameter " + std::to_string(index));
        }
    }

    std::vector<SqlRow> rows;
    int rc;
    while ((rc = sqlite3_step(statement.get())) == SQLITE_ROW) {
        int columns = sqlite3_column_count(statement.get());
        SqlRow row;
        row.reserve(columns);
        for (int column = 0; column < columns; ++column) {
            switch (sqlite3_column_type(statement.get(), column)) {
                case SQLITE_NULL:
                    row.emplace_back(std::monostate{});
                    break;
                case SQLITE_INTEGER:
                case SQLITE_FLOAT:
                    row.emplace_back(static_cast<int64_t>(sqlite3_column_int64(statement.get(), column)));
                    break;
                default: {
                    const unsigned char* text = sqlite3_column_text(statement.get(), column);
                    row.emplace_back(std::string(text ? reinterpret_cast<const char*>(text) : ""));
                    break;
                }
            }
        }
        rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        fail("Statement failed");
    }
    return rows;
}

uint16_t RecordStore::addRecord(const std::string& target_addr, uint16_t target_port,
                                const std::string& target_name, const std::string& target_component) {
    const std::string sql =
        "INSERT INTO ipam (conn_port, target_addr, target_port, target_name, target_component) "
        "VALUES (?, ?, ?, ?, ?);";

    for (int attempt = 1; attempt <= ports_.max_tries; ++attempt) {
        uint16_t conn_port = picker_();
        try {
            execute(sql, {static_cast<int64_t>(conn_port), target_addr,
                          static_cast<int64_t>(target_port), target_name, target_component});
        } catch (const StoreError& e) {
            if (!e.isUniqueViolation()) {
                throw;
            }
            logger_.debug("Port " + std::to_string(conn_port) + " already in use (attempt " +
                          std::to_string(attempt) + ")");
            continue;
        }
        logger_.info("Allocated port " + std::to_string(conn_port) + " for " + target_name +
                     " (" + target_addr + ":" + std::to_string(target_port) + ")");
        return conn_port;
    }

    throw CapacityExhausted("Failed to create port map after " + std::to_string(ports_.max_tries) +
                            " tries");
}

void RecordStore::deleteRecord(uint16_t conn_port) {
    execute("DELETE FROM ipam WHERE conn_port = ?;", {static_cast<int64_t>(conn_port)});
    logger_.info("Deleted record of port " + std::to_string(conn_port));
}

std::pair<std::optional<uint16_t>, std::optional<std::string>> RecordStore::getRecord(uint16_t conn_port) {
    auto rows = execute("SELECT target_port, target_addr FROM ipam WHERE conn_port = ?;",
                        {static_cast<int64_t>(conn_port)});
    if (rows.empty()) {
        return {std::nullopt, std::nullopt};
    }
    return {static_cast<uint16_t>(asInteger(rows[0][0])), asText(rows[0][1])};
}

std::map<uint16_t, PortMappingRecord> RecordStore::lookupByFilter(const RecordFilter& filter) {
    std::vector<std::string> clauses;
    std::vector<SqlValue> params;
    addClause(clauses, params, "target_name", filter.name);
    addClause(clauses, params, "target_addr", filter.addr);
    addClause(clauses, params, "target_component", filter.component);
    addClause(clauses, params, "conn_port", filter.conn_port);
    addClause(clauses, params, "target_port", filter.target_port);

    std::map<uint16_t, PortMappingRecord> records;
    for (const auto& row : execute(RECORD_COLUMNS + whereClause(clauses) + ";", params)) {
        PortMappingRecord record;
        record.conn_port = static_cast<uint16_t>(asInteger(row[0]));
        record.target_addr = asText(row[1]);
        record.target_port = static_cast<uint16_t>(asInteger(row[2]));
        record.target_name = asText(row[3]);
        record.target_component = asText(row[4]);
        record.routable = asOptionalBool(row[5]);
        records[record.conn_port] = record;
    }
    return records;
}

std::map<std::string, AddressInfo> RecordStore::lookupAddresses(const AddressFilter& filter) {
    std::vector<std::string> clauses;
    std::vector<SqlValue> params;
    addClause(clauses, params, "target_name", filter.name);
    addClause(clauses, params, "target_addr", filter.addr);
    addClause(clauses, params, "target_component", filter.component);

    std::string sql = "SELECT target_name, target_addr, target_component, routable FROM ipam" +
                      whereClause(clauses) + " ORDER BY target_name, target_addr;";

    std::map<std::string, AddressInfo> machines;
    for (const auto& row : execute(sql, params)) {
        std::string name = asText(row[0]);
        std::string addr = asText(row[1]);
        auto routable = asOptionalBool(row[3]);

        auto [it, inserted] = machines.try_emplace(name);
        AddressInfo& info = it->second;
        if (inserted) {
            info.component = asText(row[2]);
        }
        if (std::find(info.addrs.begin(), info.addrs.end(), addr) == info.addrs.end()) {
            info.addrs.push_back(addr);
        }
        if (routable) {
            // One unreachable address marks the whole machine
            info.routable = info.routable.value_or(true) && *routable;
        }
    }
    return machines;
}

std::vector<std::pair<std::string, std::string>> RecordStore::listTargets() {
    std::vector<std::pair<std::string, std::string>> targets;
    for (const auto& row : execute("SELECT DISTINCT target_name, target_addr FROM ipam "
                                   "ORDER BY target_name, target_addr;")) {
        targets.emplace_back(asText(row[0]), asText(row[1]));
    }
    return targets;
}

void RecordStore::setRoutable(const std::string& target_name, const std::string& target_addr,
                              bool routable) {
    // The boolean is written as a literal; name and address stay parameterized
    std::string sql = std::string("UPDATE ipam SET routable = ") + (routable ? "1" : "0") +
                      " WHERE target_name = ? AND target_addr = ?;";
    execute(sql, {target_name, target_addr});
}

void RecordStore::createSchema() {
    execute(CREATE_SCHEMA);
}

void RecordStore::fail(const std::string& context) {
    std::string message = context + ": " + sqlite3_errmsg(db_);
    int code = sqlite3_extended_errcode(db_);

    // A statement that failed inside an explicit transaction must not leave it open
    if (!sqlite3_get_autocommit(db_)) {
        char* rollback_error = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &rollback_error) != SQLITE_OK) {
            logger_.error("Rollback failed: " + std::string(rollback_error ? rollback_error : "unknown"));
        }
        sqlite3_free(rollback_error);
    }

    logger_.debug(message + " (code " + std::to_string(code) + ")");
    throw StoreError(message, code);
}

} // namespace ipam
