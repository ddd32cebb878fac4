#pragma once

#include <string_view>

namespace sqltrace {

/**
 * @brief Span field keys (OpenTelemetry database semantic conventions)
 */
namespace fields {
    inline constexpr std::string_view DB_NAME = "db.name";
    inline constexpr std::string_view DB_OPERATION = "db.operation";
    inline constexpr std::string_view DB_QUERY_TEXT = "db.query.text";
    inline constexpr std::string_view DB_AFFECTED_ROWS = "db.response.affected_rows";
    inline constexpr std::string_view DB_RETURNED_ROWS = "db.response.returned_rows";
    inline constexpr std::string_view DB_STATUS_CODE = "db.response.status_code";
    inline constexpr std::string_view DB_SQL_TABLE = "db.sql.table";
    inline constexpr std::string_view DB_SYSTEM_NAME = "db.system.name";
    inline constexpr std::string_view ERROR_TYPE = "error.type";
    inline constexpr std::string_view ERROR_MESSAGE = "error.message";
    inline constexpr std::string_view ERROR_STACKTRACE = "error.stacktrace";
    inline constexpr std::string_view NET_PEER_NAME = "net.peer.name";
    inline constexpr std::string_view NET_PEER_PORT = "net.peer.port";
    inline constexpr std::string_view OTEL_KIND = "otel.kind";
    inline constexpr std::string_view OTEL_STATUS_CODE = "otel.status_code";
    inline constexpr std::string_view OTEL_STATUS_DESCRIPTION = "otel.status_description";
    inline constexpr std::string_view PEER_SERVICE = "peer.service";
} // namespace fields

/**
 * @brief Span names
 */
namespace ops {
    inline constexpr std::string_view DESCRIBE = "sqlx.describe";
    inline constexpr std::string_view EXECUTE = "sqlx.execute";
    inline constexpr std::string_view EXECUTE_MANY = "sqlx.execute_many";
    inline constexpr std::string_view FETCH = "sqlx.fetch";
    inline constexpr std::string_view FETCH_ALL = "sqlx.fetch_all";
    inline constexpr std::string_view FETCH_MANY = "sqlx.fetch_many";
    inline constexpr std::string_view FETCH_ONE = "sqlx.fetch_one";
    inline constexpr std::string_view FETCH_OPTIONAL = "sqlx.fetch_optional";
    inline constexpr std::string_view PREPARE = "sqlx.prepare";
    inline constexpr std::string_view PREPARE_WITH = "sqlx.prepare_with";

    inline constexpr std::string_view POOL_ACQUIRE = "sqlx.pool.acquire";
    inline constexpr std::string_view POOL_CLOSE = "sqlx.pool.close";
    inline constexpr std::string_view TRANSACTION_BEGIN = "sqlx.transaction.begin";
    inline constexpr std::string_view TRANSACTION_COMMIT = "sqlx.transaction.commit";
    inline constexpr std::string_view TRANSACTION_ROLLBACK = "sqlx.transaction.rollback";
    inline constexpr std::string_view CONNECTION_PING = "sqlx.connection.ping";
} // namespace ops

} // namespace sqltrace
