#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqltrace {

/**
 * @brief A connection checked out of a ConnectionPool
 *
 * Always handed out as std::unique_ptr, so it neither copies nor moves;
 * destruction gives the connection back through the pool's return
 * callback (the pool decides whether it is idled or closed).
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    [[nodiscard]] IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }
    IDbConnection& operator*() const { return *conn_; }

    /**
     * @brief Close the connection now instead of returning it for reuse
     *
     * Used when the connection's session state can no longer be trusted
     * (e.g. an implicit rollback failed).
     */
    void discard();

private:
    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
};

} // namespace sqltrace
