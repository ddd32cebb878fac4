#pragma once

#include "core/error.hpp"
#include "db/stream.hpp"
#include "db/value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sqltrace {

/**
 * @brief Query-execution capability shared by every executor
 *
 * Implemented by raw driver connections, by the connection pool (one
 * checkout per call) and by the instrumented carriers, so code written
 * against IExecutor runs unchanged on any of them.
 *
 * Streams returned by fetch / fetch_many / execute_many borrow the
 * executor and must not outlive it.
 */
class IExecutor {
public:
    virtual ~IExecutor() = default;

    /// Describe the result columns and parameters of a statement without running it
    [[nodiscard]] virtual Result<Describe> describe(const std::string& sql) = 0;

    /// Execute and return the summed outcome of every statement
    [[nodiscard]] virtual Result<QueryResult> execute(const Query& query) = 0;

    /// One QueryResult per statement
    [[nodiscard]] virtual ResultStream<QueryResult> execute_many(const Query& query) = 0;

    /// Rows of every statement, lazily
    [[nodiscard]] virtual ResultStream<Row> fetch(const Query& query) = 0;

    [[nodiscard]] virtual Result<std::vector<Row>> fetch_all(const Query& query) = 0;

    /// Rows interleaved with per-statement outcomes
    [[nodiscard]] virtual ResultStream<Either> fetch_many(const Query& query) = 0;

    /// First row; ROW_NOT_FOUND when the query returns nothing
    [[nodiscard]] virtual Result<Row> fetch_one(const Query& query) = 0;

    [[nodiscard]] virtual Result<std::optional<Row>> fetch_optional(const Query& query) = 0;

    [[nodiscard]] virtual Result<Statement> prepare(const std::string& sql) = 0;

    [[nodiscard]] virtual Result<Statement> prepare_with(
        const std::string& sql, const std::vector<TypeInfo>& parameters) = 0;
};

} // namespace sqltrace
