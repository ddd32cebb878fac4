#pragma once

#include "db/idb_connection.hpp"
#include "instrument/traced_executor.hpp"

namespace sqltrace {

class Transaction;

/**
 * @brief Instrumented view of a connection owned elsewhere
 *
 * Obtained from Transaction::executor() or PoolConnection::as_connection().
 * The connection must outlive the view.
 */
class Connection : public TracedExecutor {
public:
    Connection(IDbConnection& conn, SharedAttributes attributes);

    /// Round-trip check, in a sqlx.connection.ping span
    [[nodiscard]] Result<void> ping();

    /**
     * @brief Begin a transaction on this connection (a savepoint when one
     * is already open), in a sqlx.transaction.begin span
     */
    [[nodiscard]] Result<Transaction> begin();

    /// The undecorated connection
    [[nodiscard]] IDbConnection& inner() const { return *conn_; }

protected:
    IExecutor& raw_executor() override { return *conn_; }
    DatabaseType system() const override { return conn_->database_type(); }

private:
    IDbConnection* conn_;
};

} // namespace sqltrace
