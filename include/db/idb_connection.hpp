#pragma once

#include "core/database_type.hpp"
#include "db/iexecutor.hpp"
#include <cstddef>
#include <string>

namespace sqltrace {

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*, sqlite3*).
 * Implementations are not thread-safe; exclusivity comes from the pool.
 *
 * Backends implement fetch_many() as the one lazy execution primitive;
 * the remaining executor operations are derived from it here.
 */
class IDbConnection : public IExecutor {
public:
    ~IDbConnection() override = default;

    Result<QueryResult> execute(const Query& query) final;
    ResultStream<QueryResult> execute_many(const Query& query) final;
    ResultStream<Row> fetch(const Query& query) final;
    Result<std::vector<Row>> fetch_all(const Query& query) final;
    Result<Row> fetch_one(const Query& query) final;
    Result<std::optional<Row>> fetch_optional(const Query& query) final;
    Result<Statement> prepare(const std::string& sql) final;

    /**
     * @brief Round-trip to the server to check the connection is usable
     */
    [[nodiscard]] virtual Result<void> ping() = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query);

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    [[nodiscard]] virtual DatabaseType database_type() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;

    /// Open transactions/savepoints on this connection (0 = autocommit)
    [[nodiscard]] size_t transaction_depth() const { return transaction_depth_; }
    void set_transaction_depth(size_t depth) { transaction_depth_ = depth; }

private:
    size_t transaction_depth_ = 0;
};

} // namespace sqltrace
