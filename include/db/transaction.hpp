#pragma once

#include "db/idb_connection.hpp"
#include "db/pooled_connection.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace sqltrace {

/**
 * @brief An open transaction or savepoint on one connection
 *
 * Depth 0 on the connection opens a transaction (BEGIN); deeper levels
 * open savepoints. A transaction either owns the pooled connection it
 * runs on (pool-level begin) or borrows a connection that the caller
 * keeps alive (connection-level begin). A savepoint shares ownership
 * with its parent, so the connection stays checked out until both are
 * gone.
 *
 * commit() / rollback() finish the transaction; afterwards it is inert
 * and its share of the connection is released. Finishing while a
 * savepoint opened inside it is still open fails with INVALID_ARGUMENT
 * and leaves the transaction open. Destroying an unfinished
 * transaction rolls it back; a failure on that path is only logged.
 */
class DbTransaction {
public:
    [[nodiscard]] static Result<DbTransaction> begin(std::unique_ptr<PooledConnection> conn);
    [[nodiscard]] static Result<DbTransaction> begin(IDbConnection& conn);

    /// Open a savepoint inside an open transaction
    [[nodiscard]] static Result<DbTransaction> begin_nested(const DbTransaction& parent);

    ~DbTransaction();

    DbTransaction(DbTransaction&& other) noexcept;
    DbTransaction& operator=(DbTransaction&& other) noexcept;

    DbTransaction(const DbTransaction&) = delete;
    DbTransaction& operator=(const DbTransaction&) = delete;

    /// The connection the transaction runs on
    [[nodiscard]] IDbConnection& connection() const { return *conn_; }

    [[nodiscard]] Result<void> commit();
    [[nodiscard]] Result<void> rollback();

    [[nodiscard]] bool is_open() const { return open_; }

    /// Nesting level of this transaction (1 = top level)
    [[nodiscard]] size_t depth() const { return depth_; }

    [[nodiscard]] static std::string begin_sql(size_t depth);
    [[nodiscard]] static std::string commit_sql(size_t depth);
    [[nodiscard]] static std::string rollback_sql(size_t depth);

private:
    DbTransaction(std::shared_ptr<PooledConnection> owned, IDbConnection* conn, size_t depth);

    static Result<DbTransaction> start(std::shared_ptr<PooledConnection> owned, IDbConnection& conn);

    Result<void> finish(const std::string& sql);

    void release();

    std::shared_ptr<PooledConnection> owned_;
    IDbConnection* conn_ = nullptr;
    size_t depth_ = 0;
    bool open_ = false;
};

} // namespace sqltrace
