#include "instrument/pool_connection.hpp"
#include "instrument/traced_call.hpp"
#include "instrument/transaction.hpp"
#include "tracing/span_fields.hpp"

namespace sqltrace {

PoolConnection::PoolConnection(std::unique_ptr<PooledConnection> conn, SharedAttributes attributes)
    : TracedExecutor(std::move(attributes)), conn_(std::move(conn)) {}

Result<void> PoolConnection::ping() {
    return traced_lifecycle<void>(ops::CONNECTION_PING, *attributes(), system(),
        [this] { return (*conn_)->ping(); });
}

Result<Transaction> PoolConnection::begin() & {
    return traced_lifecycle<Transaction>(ops::TRANSACTION_BEGIN, *attributes(), system(),
        [this]() -> Result<Transaction> {
            auto tx = DbTransaction::begin(**conn_);
            if (tx.is_error()) {
                return Result<Transaction>::error(tx.error());
            }
            return Result<Transaction>::ok(Transaction(tx.take_value(), attributes()));
        });
}

Connection PoolConnection::as_connection() const& {
    return Connection(**conn_, attributes());
}

} // namespace sqltrace
