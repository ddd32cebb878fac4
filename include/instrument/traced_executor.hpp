#pragma once

#include "core/database_type.hpp"
#include "db/iexecutor.hpp"
#include "tracing/attributes.hpp"

namespace sqltrace {

/**
 * @brief IExecutor decorator that wraps every call in a query span
 *
 * Each carrier (Pool, PoolConnection, Connection, Transaction) differs
 * only in how it reaches the undecorated executor; the instrumentation
 * is shared here. Results and errors pass through unchanged.
 *
 * Row counts: fetch_all records the number of rows, fetch_one records 1
 * on success, fetch_optional records 1 or 0.
 */
class TracedExecutor : public IExecutor {
public:
    ~TracedExecutor() override = default;

    Result<Describe> describe(const std::string& sql) override;
    Result<QueryResult> execute(const Query& query) override;
    ResultStream<QueryResult> execute_many(const Query& query) override;
    ResultStream<Row> fetch(const Query& query) override;
    Result<std::vector<Row>> fetch_all(const Query& query) override;
    ResultStream<Either> fetch_many(const Query& query) override;
    Result<Row> fetch_one(const Query& query) override;
    Result<std::optional<Row>> fetch_optional(const Query& query) override;
    Result<Statement> prepare(const std::string& sql) override;
    Result<Statement> prepare_with(const std::string& sql,
                                   const std::vector<TypeInfo>& parameters) override;

    /// The attribute set shared with the pool this carrier came from
    [[nodiscard]] const SharedAttributes& attributes() const { return attributes_; }

protected:
    explicit TracedExecutor(SharedAttributes attributes) : attributes_(std::move(attributes)) {}

    TracedExecutor(const TracedExecutor&) = default;
    TracedExecutor& operator=(const TracedExecutor&) = default;
    TracedExecutor(TracedExecutor&&) noexcept = default;
    TracedExecutor& operator=(TracedExecutor&&) noexcept = default;

    /// The undecorated executor calls are forwarded to
    [[nodiscard]] virtual IExecutor& raw_executor() = 0;

    /// Backend reported in db.system.name
    [[nodiscard]] virtual DatabaseType system() const = 0;

private:
    SharedAttributes attributes_;
};

} // namespace sqltrace
