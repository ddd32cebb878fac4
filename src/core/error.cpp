#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqltrace {

std::string_view error_kind_to_string(DbErrorKind kind) {
    switch (kind) {
        case DbErrorKind::CONFIGURATION:              return "Configuration";
        case DbErrorKind::DATABASE:                   return "Database";
        case DbErrorKind::IO:                         return "Io";
        case DbErrorKind::TLS:                        return "Tls";
        case DbErrorKind::PROTOCOL:                   return "Protocol";
        case DbErrorKind::ROW_NOT_FOUND:              return "RowNotFound";
        case DbErrorKind::TYPE_NOT_FOUND:             return "TypeNotFound";
        case DbErrorKind::COLUMN_INDEX_OUT_OF_BOUNDS: return "ColumnIndexOutOfBounds";
        case DbErrorKind::COLUMN_NOT_FOUND:           return "ColumnNotFound";
        case DbErrorKind::COLUMN_DECODE:              return "ColumnDecode";
        case DbErrorKind::ENCODE:                     return "Encode";
        case DbErrorKind::DECODE:                     return "Decode";
        case DbErrorKind::DRIVER:                     return "Driver";
        case DbErrorKind::POOL_TIMED_OUT:             return "PoolTimedOut";
        case DbErrorKind::POOL_CLOSED:                return "PoolClosed";
        case DbErrorKind::WORKER_CRASHED:             return "WorkerCrashed";
        case DbErrorKind::INVALID_ARGUMENT:           return "InvalidArgument";
    }
    return "Unknown";
}

std::string DbError::to_string() const {
    switch (kind) {
        case DbErrorKind::CONFIGURATION:
            return std::format("error with configuration: {}", message);
        case DbErrorKind::DATABASE:
            return std::format("error returned from database: {}", message);
        case DbErrorKind::IO:
            return std::format("error communicating with database: {}", message);
        case DbErrorKind::TLS:
            return std::format("error occurred while attempting to establish a TLS connection: {}", message);
        case DbErrorKind::PROTOCOL:
            return std::format("encountered unexpected or invalid data: {}", message);
        case DbErrorKind::COLUMN_INDEX_OUT_OF_BOUNDS:
        case DbErrorKind::COLUMN_NOT_FOUND:
        case DbErrorKind::COLUMN_DECODE:
        case DbErrorKind::TYPE_NOT_FOUND:
        case DbErrorKind::ENCODE:
        case DbErrorKind::DECODE:
        case DbErrorKind::ROW_NOT_FOUND:
        case DbErrorKind::POOL_TIMED_OUT:
        case DbErrorKind::POOL_CLOSED:
        case DbErrorKind::WORKER_CRASHED:
        case DbErrorKind::DRIVER:
        case DbErrorKind::INVALID_ARGUMENT:
            break;
    }
    return message;
}

std::string DbError::debug_string() const {
    std::string out = std::format("{} {{ message: \"{}\"", error_kind_to_string(kind),
                                  utils::escape_json(message));
    if (sqlstate) {
        out += std::format(", code: \"{}\"", *sqlstate);
    }
    if (detail) {
        out += std::format(", detail: \"{}\"", utils::escape_json(*detail));
    }
    out += " }";
    return out;
}

} // namespace sqltrace
