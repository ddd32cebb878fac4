#include "db/transaction.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqltrace {

std::string DbTransaction::begin_sql(size_t depth) {
    if (depth == 0) {
        return "BEGIN";
    }
    return std::format("SAVEPOINT sqltrace_savepoint_{}", depth);
}

std::string DbTransaction::commit_sql(size_t depth) {
    if (depth == 1) {
        return "COMMIT";
    }
    return std::format("RELEASE SAVEPOINT sqltrace_savepoint_{}", depth - 1);
}

std::string DbTransaction::rollback_sql(size_t depth) {
    if (depth == 1) {
        return "ROLLBACK";
    }
    return std::format("ROLLBACK TO SAVEPOINT sqltrace_savepoint_{}", depth - 1);
}

DbTransaction::DbTransaction(std::shared_ptr<PooledConnection> owned, IDbConnection* conn, size_t depth)
    : owned_(std::move(owned)), conn_(conn), depth_(depth), open_(true) {}

Result<DbTransaction> DbTransaction::begin(std::unique_ptr<PooledConnection> conn) {
    if (!conn || !conn->get()) {
        return Result<DbTransaction>::error(DbErrorKind::INVALID_ARGUMENT,
                                            "cannot begin a transaction without a connection");
    }
    IDbConnection& raw = **conn;
    return start(std::shared_ptr<PooledConnection>(std::move(conn)), raw);
}

Result<DbTransaction> DbTransaction::begin(IDbConnection& conn) {
    return start(nullptr, conn);
}

Result<DbTransaction> DbTransaction::begin_nested(const DbTransaction& parent) {
    if (!parent.open_ || !parent.conn_) {
        return Result<DbTransaction>::error(DbErrorKind::INVALID_ARGUMENT,
                                            "transaction already finished");
    }
    return start(parent.owned_, *parent.conn_);
}

Result<DbTransaction> DbTransaction::start(std::shared_ptr<PooledConnection> owned, IDbConnection& conn) {
    const size_t depth = conn.transaction_depth();
    auto res = conn.execute(Query(begin_sql(depth)));
    if (res.is_error()) {
        return Result<DbTransaction>::error(res.error());
    }
    conn.set_transaction_depth(depth + 1);
    return Result<DbTransaction>::ok(DbTransaction(std::move(owned), &conn, depth + 1));
}

DbTransaction::~DbTransaction() {
    if (!open_ || !conn_) {
        return;
    }
    auto res = finish(rollback_sql(depth_));
    if (res.is_error()) {
        utils::log::warn(std::format("Implicit rollback of transaction (depth {}) failed: {}",
                                     depth_, error_kind_to_string(res.error().kind)));
    }
}

DbTransaction::DbTransaction(DbTransaction&& other) noexcept
    : owned_(std::move(other.owned_)),
      conn_(other.conn_),
      depth_(other.depth_),
      open_(other.open_) {
    other.conn_ = nullptr;
    other.open_ = false;
}

DbTransaction& DbTransaction::operator=(DbTransaction&& other) noexcept {
    if (this != &other) {
        if (open_ && conn_) {
            auto res = finish(rollback_sql(depth_));
            if (res.is_error()) {
                utils::log::warn(std::format("Implicit rollback of transaction (depth {}) failed: {}",
                                             depth_, error_kind_to_string(res.error().kind)));
            }
        }
        owned_ = std::move(other.owned_);
        conn_ = other.conn_;
        depth_ = other.depth_;
        open_ = other.open_;
        other.conn_ = nullptr;
        other.open_ = false;
    }
    return *this;
}

Result<void> DbTransaction::commit() {
    return finish(commit_sql(depth_));
}

Result<void> DbTransaction::rollback() {
    return finish(rollback_sql(depth_));
}

Result<void> DbTransaction::finish(const std::string& sql) {
    if (!open_ || !conn_) {
        return Result<void>::error(DbErrorKind::INVALID_ARGUMENT, "transaction already finished");
    }
    if (conn_->transaction_depth() != depth_) {
        return Result<void>::error(DbErrorKind::INVALID_ARGUMENT,
            std::format("a savepoint inside this transaction (depth {}) is still open", depth_));
    }

    auto res = conn_->execute(Query(sql));
    // Finished even when the statement fails
    conn_->set_transaction_depth(depth_ - 1);
    open_ = false;
    if (res.is_error() && owned_) {
        // Session state unknown after a failed COMMIT/ROLLBACK
        owned_->discard();
    }
    release();

    if (res.is_error()) {
        return Result<void>::error(res.error());
    }
    return Result<void>::ok();
}

void DbTransaction::release() {
    owned_.reset();
    conn_ = nullptr;
}

} // namespace sqltrace
