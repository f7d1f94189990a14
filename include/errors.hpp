/**
 * @file errors.hpp
 * @brief Exception types and result classification for ipam-portmap
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the exceptions raised by the record store, the rule store
 * and the port map coordinator, plus the Status/Outcome pair handed to the
 * outer request surface. Invalid arguments are reported with the standard
 * std::invalid_argument.
 */

#pragma once

#include "command_executor.hpp"
#include <stdexcept>
#include <string>

namespace ipam {

/**
 * @enum Status
 * @brief Classification of a failed (or successful) request
 *
 * The outer surface maps these onto its own status codes: Ok to success,
 * BadRequest to a caller error, NotFound to a missing mapping and ServerError
 * to anything that needs an administrator.
 */
enum class Status {
    Ok,          ///< Request completed
    BadRequest,  ///< Caller supplied invalid input
    NotFound,    ///< No such port mapping
    ServerError  ///< Store, firewall or consistency failure
};

/**
 * @brief Convert Status enum to string representation
 * @param status Status value
 * @return Lower case status name ("ok", "bad-request", "not-found", "server-error")
 */
std::string statusToString(Status status);

/**
 * @struct Outcome
 * @brief (message, classification) pair reported by coordinator operations
 */
struct Outcome {
    std::string error;            ///< Empty on success
    Status status = Status::Ok;   ///< Classification of the result

    bool isSuccess() const {
        return status == Status::Ok;
    }
};

/**
 * @class StoreError
 * @brief Failure reported by the relational store
 *
 * Carries the SQLite extended result code so callers can tell a uniqueness
 * violation (an expected port collision) apart from a fatal failure.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& message, int code)
        : std::runtime_error(message), code_(code) {}

    /**
     * @brief SQLite extended result code of the failed statement
     */
    int code() const noexcept { return code_; }

    /**
     * @brief Check if the failure is a UNIQUE or PRIMARY KEY constraint violation
     * @return true for SQLITE_CONSTRAINT_UNIQUE and SQLITE_CONSTRAINT_PRIMARYKEY
     */
    bool isUniqueViolation() const noexcept;

private:
    int code_;
};

/**
 * @class CapacityExhausted
 * @brief Every attempt to allocate a connection port collided
 *
 * Raised when the configured port range is saturated, i.e. the maximum number
 * of insert attempts all failed with a uniqueness violation.
 */
class CapacityExhausted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class RuleNotFound
 * @brief No firewall rule matched a lookup
 */
class RuleNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class CommandError
 * @brief A packet filter command exited with a non-zero status
 */
class CommandError : public std::runtime_error {
public:
    explicit CommandError(CommandResult result)
        : std::runtime_error(result.getErrorMessage()), result_(std::move(result)) {}

    const CommandResult& result() const noexcept { return result_; }

private:
    CommandResult result_;
};

/**
 * @class ConsistencyError
 * @brief The port map record and its firewall rules disagree
 *
 * Carries the classification computed by the consistency check, so a missing
 * mapping (NotFound) can be told apart from a half-present one (ServerError).
 */
class ConsistencyError : public std::runtime_error {
public:
    ConsistencyError(const std::string& message, Status status)
        : std::runtime_error(message), status_(status) {}

    Status status() const noexcept { return status_; }

private:
    Status status_;
};

} // namespace ipam
