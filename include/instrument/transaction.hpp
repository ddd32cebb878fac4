#pragma once

#include "db/transaction.hpp"
#include "instrument/connection.hpp"
#include "instrument/traced_executor.hpp"

namespace sqltrace {

/**
 * @brief Instrumented transaction or savepoint
 *
 * Queries run through the transaction itself or through executor().
 * commit() and rollback() each get a lifecycle span; afterwards every
 * query fails with INVALID_ARGUMENT. Dropping an unfinished transaction
 * rolls it back without a span.
 */
class Transaction : public TracedExecutor {
public:
    Transaction(DbTransaction inner, SharedAttributes attributes);

    Transaction(Transaction&&) noexcept = default;
    Transaction& operator=(Transaction&&) noexcept = default;

    /**
     * @brief Instrumented executor running inside this transaction
     *
     * Valid until the transaction finishes; INVALID_ARGUMENT once it has.
     */
    [[nodiscard]] Result<Connection> executor() &;
    Result<Connection> executor() && = delete;

    /// COMMIT (or RELEASE SAVEPOINT), in a sqlx.transaction.commit span
    [[nodiscard]] Result<void> commit();

    /// ROLLBACK (or ROLLBACK TO SAVEPOINT), in a sqlx.transaction.rollback span
    [[nodiscard]] Result<void> rollback();

    /**
     * @brief Open a savepoint inside this transaction, in a
     * sqlx.transaction.begin span
     *
     * The savepoint must finish before this transaction does; it keeps
     * the connection checked out even if this object goes first.
     */
    [[nodiscard]] Result<Transaction> begin() &;
    Result<Transaction> begin() && = delete;

    [[nodiscard]] bool is_open() const { return inner_.is_open(); }

    /// The undecorated driver transaction
    [[nodiscard]] DbTransaction& inner() { return inner_; }

protected:
    IExecutor& raw_executor() override;
    DatabaseType system() const override { return system_; }

private:
    DbTransaction inner_;
    DatabaseType system_;
};

} // namespace sqltrace
