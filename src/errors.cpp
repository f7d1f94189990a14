#include "errors.hpp"
#include <sqlite3.h>

namespace ipam {

std::string statusToString(Status status) {
    switch (status) {
        case Status::Ok:
            return "ok";
        case Status::BadRequest:
            return "bad-request";
        case Status::NotFound:
            return "not-found";
        case Status::ServerError:
            return "server-error";
        default:
            return "unknown";
    }
}

bool StoreError::isUniqueViolation() const noexcept {
    return code_ == SQLITE_CONSTRAINT_UNIQUE || code_ == SQLITE_CONSTRAINT_PRIMARYKEY;
}

} // namespace ipam
