#pragma once

#include "db/pooled_connection.hpp"
#include "instrument/connection.hpp"
#include "instrument/traced_executor.hpp"
#include <memory>

namespace sqltrace {

class Transaction;

/**
 * @brief Instrumented connection checked out of a Pool
 *
 * Goes back to the pool when destroyed.
 */
class PoolConnection : public TracedExecutor {
public:
    PoolConnection(std::unique_ptr<PooledConnection> conn, SharedAttributes attributes);

    PoolConnection(PoolConnection&&) noexcept = default;
    PoolConnection& operator=(PoolConnection&&) noexcept = default;

    /// Round-trip check, in a sqlx.connection.ping span
    [[nodiscard]] Result<void> ping();

    /**
     * @brief Begin a transaction on this connection, in a
     * sqlx.transaction.begin span
     *
     * The transaction borrows the connection; keep this object alive
     * until it finishes.
     */
    [[nodiscard]] Result<Transaction> begin() &;
    Result<Transaction> begin() && = delete;

    /// Borrowed instrumented view with the same attributes
    [[nodiscard]] Connection as_connection() const&;
    Connection as_connection() const&& = delete;

    /// The undecorated connection, for operations outside the executor surface
    [[nodiscard]] IDbConnection& inner() const { return **conn_; }

protected:
    IExecutor& raw_executor() override { return **conn_; }
    DatabaseType system() const override { return (*conn_)->database_type(); }

private:
    std::unique_ptr<PooledConnection> conn_;
};

} // namespace sqltrace
