#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>

namespace sqltrace {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 *
 * Results are streamed in single-row mode; a stream that is dropped
 * early cancels the statement and drains the connection.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    ResultStream<Either> fetch_many(const Query& query) override;
    Result<Describe> describe(const std::string& sql) override;
    Result<Statement> prepare_with(const std::string& sql,
                                   const std::vector<TypeInfo>& parameters) override;

    Result<void> ping() override;
    bool is_connected() const override;
    DatabaseType database_type() const override { return DatabaseType::POSTGRESQL; }
    void close() override;

    /**
     * @brief Build a DbError from a failed result (or the connection state)
     */
    [[nodiscard]] static DbError make_error(PGconn* conn, const PGresult* res);

private:
    /**
     * @brief Prepare the unnamed statement and read back its metadata
     */
    Result<Describe> describe_prepared(const std::string& sql, const std::vector<uint32_t>& param_oids);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb. The URL is handed to
 * libpq unchanged (postgres:// and postgresql:// URIs are both accepted).
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const ConnectOptions& options) override;
};

} // namespace sqltrace
