#include "instrument/traced_executor.hpp"
#include "instrument/traced_call.hpp"
#include "tracing/span_fields.hpp"

namespace sqltrace {

Result<Describe> TracedExecutor::describe(const std::string& sql) {
    DbSpan span = make_query_span(ops::DESCRIBE, sql, *attributes_, system());
    return run_in_span<Describe>(span, *attributes_, [&] { return raw_executor().describe(sql); });
}

Result<QueryResult> TracedExecutor::execute(const Query& query) {
    DbSpan span = make_query_span(ops::EXECUTE, query.sql, *attributes_, system());
    return run_in_span<QueryResult>(span, *attributes_, [&] { return raw_executor().execute(query); });
}

ResultStream<QueryResult> TracedExecutor::execute_many(const Query& query) {
    return traced_stream<QueryResult>(ops::EXECUTE_MANY, query.sql, attributes_, system(),
                                      [&] { return raw_executor().execute_many(query); });
}

ResultStream<Row> TracedExecutor::fetch(const Query& query) {
    return traced_stream<Row>(ops::FETCH, query.sql, attributes_, system(),
                              [&] { return raw_executor().fetch(query); });
}

Result<std::vector<Row>> TracedExecutor::fetch_all(const Query& query) {
    DbSpan span = make_query_span(ops::FETCH_ALL, query.sql, *attributes_, system());
    auto result = run_in_span<std::vector<Row>>(span, *attributes_,
                                                [&] { return raw_executor().fetch_all(query); });
    if (result.is_ok()) {
        record_returned_rows(span, result.value().size());
    }
    return result;
}

ResultStream<Either> TracedExecutor::fetch_many(const Query& query) {
    return traced_stream<Either>(ops::FETCH_MANY, query.sql, attributes_, system(),
                                 [&] { return raw_executor().fetch_many(query); });
}

Result<Row> TracedExecutor::fetch_one(const Query& query) {
    DbSpan span = make_query_span(ops::FETCH_ONE, query.sql, *attributes_, system());
    auto result = run_in_span<Row>(span, *attributes_, [&] { return raw_executor().fetch_one(query); });
    if (result.is_ok()) {
        record_returned_rows(span, 1);
    }
    return result;
}

Result<std::optional<Row>> TracedExecutor::fetch_optional(const Query& query) {
    DbSpan span = make_query_span(ops::FETCH_OPTIONAL, query.sql, *attributes_, system());
    auto result = run_in_span<std::optional<Row>>(span, *attributes_,
                                                  [&] { return raw_executor().fetch_optional(query); });
    if (result.is_ok()) {
        record_returned_rows(span, result.value().has_value() ? 1 : 0);
    }
    return result;
}

Result<Statement> TracedExecutor::prepare(const std::string& sql) {
    DbSpan span = make_query_span(ops::PREPARE, sql, *attributes_, system());
    return run_in_span<Statement>(span, *attributes_, [&] { return raw_executor().prepare(sql); });
}

Result<Statement> TracedExecutor::prepare_with(const std::string& sql,
                                               const std::vector<TypeInfo>& parameters) {
    DbSpan span = make_query_span(ops::PREPARE_WITH, sql, *attributes_, system());
    return run_in_span<Statement>(span, *attributes_,
                                  [&] { return raw_executor().prepare_with(sql, parameters); });
}

} // namespace sqltrace
