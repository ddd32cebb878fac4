#include "instrument/connection.hpp"
#include "instrument/traced_call.hpp"
#include "instrument/transaction.hpp"
#include "tracing/span_fields.hpp"

namespace sqltrace {

Connection::Connection(IDbConnection& conn, SharedAttributes attributes)
    : TracedExecutor(std::move(attributes)), conn_(&conn) {}

Result<void> Connection::ping() {
    return traced_lifecycle<void>(ops::CONNECTION_PING, *attributes(), system(),
        [this] { return conn_->ping(); });
}

Result<Transaction> Connection::begin() {
    return traced_lifecycle<Transaction>(ops::TRANSACTION_BEGIN, *attributes(), system(),
        [this]() -> Result<Transaction> {
            auto tx = DbTransaction::begin(*conn_);
            if (tx.is_error()) {
                return Result<Transaction>::error(tx.error());
            }
            return Result<Transaction>::ok(Transaction(tx.take_value(), attributes()));
        });
}

} // namespace sqltrace
