#include "instrument/transaction.hpp"
#include "instrument/traced_call.hpp"
#include "tracing/span_fields.hpp"

namespace sqltrace {

namespace {

DbError finished_error() {
    return {DbErrorKind::INVALID_ARGUMENT, "transaction already finished"};
}

/**
 * @brief Executor behind a committed or rolled-back transaction
 */
class FinishedExecutor : public IExecutor {
public:
    Result<Describe> describe(const std::string&) override {
        return Result<Describe>::error(finished_error());
    }
    Result<QueryResult> execute(const Query&) override {
        return Result<QueryResult>::error(finished_error());
    }
    ResultStream<QueryResult> execute_many(const Query&) override {
        return error_stream<QueryResult>(finished_error());
    }
    ResultStream<Row> fetch(const Query&) override {
        return error_stream<Row>(finished_error());
    }
    Result<std::vector<Row>> fetch_all(const Query&) override {
        return Result<std::vector<Row>>::error(finished_error());
    }
    ResultStream<Either> fetch_many(const Query&) override {
        return error_stream<Either>(finished_error());
    }
    Result<Row> fetch_one(const Query&) override {
        return Result<Row>::error(finished_error());
    }
    Result<std::optional<Row>> fetch_optional(const Query&) override {
        return Result<std::optional<Row>>::error(finished_error());
    }
    Result<Statement> prepare(const std::string&) override {
        return Result<Statement>::error(finished_error());
    }
    Result<Statement> prepare_with(const std::string&, const std::vector<TypeInfo>&) override {
        return Result<Statement>::error(finished_error());
    }
};

IExecutor& finished_executor() {
    static FinishedExecutor instance;
    return instance;
}

} // anonymous namespace

Transaction::Transaction(DbTransaction inner, SharedAttributes attributes)
    : TracedExecutor(std::move(attributes)),
      inner_(std::move(inner)),
      system_(inner_.connection().database_type()) {}

IExecutor& Transaction::raw_executor() {
    if (!inner_.is_open()) {
        return finished_executor();
    }
    return inner_.connection();
}

Result<Connection> Transaction::executor() & {
    if (!inner_.is_open()) {
        return Result<Connection>::error(finished_error());
    }
    return Result<Connection>::ok(Connection(inner_.connection(), attributes()));
}

Result<void> Transaction::commit() {
    return traced_lifecycle<void>(ops::TRANSACTION_COMMIT, *attributes(), system_,
        [this] { return inner_.commit(); });
}

Result<void> Transaction::rollback() {
    return traced_lifecycle<void>(ops::TRANSACTION_ROLLBACK, *attributes(), system_,
        [this] { return inner_.rollback(); });
}

Result<Transaction> Transaction::begin() & {
    return traced_lifecycle<Transaction>(ops::TRANSACTION_BEGIN, *attributes(), system_,
        [this]() -> Result<Transaction> {
            if (!inner_.is_open()) {
                return Result<Transaction>::error(finished_error());
            }
            auto tx = DbTransaction::begin_nested(inner_);
            if (tx.is_error()) {
                return Result<Transaction>::error(tx.error());
            }
            return Result<Transaction>::ok(Transaction(tx.take_value(), attributes()));
        });
}

} // namespace sqltrace
