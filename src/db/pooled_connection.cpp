#include "db/pooled_connection.hpp"

namespace sqltrace {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn)
    : conn_(std::move(conn)), return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    if (conn_ && return_fn_) {
        return_fn_(std::move(conn_));
    }
}

void PooledConnection::discard() {
    if (conn_) {
        // The pool sees a closed connection and does not idle it
        conn_->close();
    }
}

} // namespace sqltrace
