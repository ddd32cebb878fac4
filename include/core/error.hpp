#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sqltrace {

/**
 * @brief Error variants reported by the database driver layer
 *
 * The set is closed: every failure surfaced by a connection, pool or
 * transaction maps to exactly one of these.
 */
enum class DbErrorKind {
    CONFIGURATION,
    DATABASE,
    IO,
    TLS,
    PROTOCOL,
    ROW_NOT_FOUND,
    TYPE_NOT_FOUND,
    COLUMN_INDEX_OUT_OF_BOUNDS,
    COLUMN_NOT_FOUND,
    COLUMN_DECODE,
    ENCODE,
    DECODE,
    DRIVER,
    POOL_TIMED_OUT,
    POOL_CLOSED,
    WORKER_CRASHED,
    INVALID_ARGUMENT
};

[[nodiscard]] std::string_view error_kind_to_string(DbErrorKind kind);

/**
 * @brief A driver error value
 *
 * Carried unchanged from the backend to the caller. `sqlstate` is only
 * set for DATABASE errors reported by the server; `detail` holds extra
 * context (column name, index, type name) for the client-side variants.
 */
struct DbError {
    DbErrorKind kind = DbErrorKind::DRIVER;
    std::string message;
    std::optional<std::string> sqlstate;
    std::optional<std::string> detail;

    DbError() = default;
    DbError(DbErrorKind k, std::string msg)
        : kind(k), message(std::move(msg)) {}

    /// Display form, e.g. "error returned from database: relation \"t\" does not exist"
    [[nodiscard]] std::string to_string() const;

    /// Full debug dump of every field
    [[nodiscard]] std::string debug_string() const;

    bool operator==(const DbError&) const = default;

    static DbError database(std::string msg, std::optional<std::string> sqlstate = std::nullopt) {
        DbError e(DbErrorKind::DATABASE, std::move(msg));
        e.sqlstate = std::move(sqlstate);
        return e;
    }

    static DbError row_not_found() {
        return {DbErrorKind::ROW_NOT_FOUND, "no rows returned by a query that expected to return at least one row"};
    }

    static DbError pool_timed_out() {
        return {DbErrorKind::POOL_TIMED_OUT, "pool timed out while waiting for an open connection"};
    }

    static DbError pool_closed() {
        return {DbErrorKind::POOL_CLOSED, "attempted to acquire a connection on a closed pool"};
    }
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(DbError err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    static Result error(DbErrorKind kind, std::string message) {
        return error(DbError(kind, std::move(message)));
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const& { return *value_; }
    T& value() & { return *value_; }
    T value() && { return std::move(*value_); }

    /// Move the value out (caller must have checked is_ok())
    T take_value() { return std::move(*value_); }

    const DbError& error() const { return error_; }
    const std::string& error_message() const { return error_.message; }

    bool operator==(const Result&) const = default;

private:
    bool success_ = false;
    std::optional<T> value_;
    DbError error_;
};

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(DbError err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    static Result error(DbErrorKind kind, std::string message) {
        return error(DbError(kind, std::move(message)));
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const DbError& error() const { return error_; }
    const std::string& error_message() const { return error_.message; }

    bool operator==(const Result&) const = default;

private:
    bool success_ = false;
    DbError error_;
};

} // namespace sqltrace
