#include <catch2/catch_test_macros.hpp>
#include "mocks/span_capture.hpp"
#include "tracing/outcome_recorder.hpp"
#include "tracing/span_builder.hpp"
#include "tracing/span_fields.hpp"
#include "tracing/span_scope.hpp"

#include <algorithm>

using namespace sqltrace;
using sqltrace::testing::SpanCapture;

namespace {

Attributes full_attributes() {
    Attributes attrs;
    attrs.name = "orders-db";
    attrs.host = "db.internal";
    attrs.port = 6543;
    attrs.database = "orders";
    return attrs;
}

std::vector<std::string> keys_of(const SpanRecord& span) {
    std::vector<std::string> keys;
    for (const auto& f : span.fields) keys.push_back(f.key);
    return keys;
}

} // namespace

// ============================================================================
// Attributes
// ============================================================================

TEST_CASE("Attributes: defaults record everything and identify nothing", "[attributes]") {
    const Attributes attrs;
    CHECK_FALSE(attrs.name);
    CHECK_FALSE(attrs.host);
    CHECK_FALSE(attrs.port);
    CHECK_FALSE(attrs.database);
    CHECK(attrs.record_query_text);
    CHECK(attrs.record_error_details);
}

// ============================================================================
// Query spans
// ============================================================================

TEST_CASE("SpanBuilder: query span declares the full field set in order", "[span][builder]") {
    DbSpan span = make_query_span(ops::FETCH_ALL, "SELECT 1", full_attributes(), DatabaseType::POSTGRESQL);

    const std::vector<std::string> expected = {
        "db.name", "db.operation", "db.query.text", "db.response.affected_rows",
        "db.response.returned_rows", "db.response.status_code", "db.sql.table",
        "db.system.name", "error.type", "error.message", "error.stacktrace",
        "net.peer.name", "net.peer.port", "otel.kind", "otel.status_code",
        "otel.status_description", "peer.service"};
    CHECK(keys_of(span.data()) == expected);
    CHECK(span.data().name == "sqlx.fetch_all");
}

TEST_CASE("SpanBuilder: identifying fields are bound at creation", "[span][builder]") {
    DbSpan span = make_query_span(ops::EXECUTE, "DELETE FROM t", full_attributes(), DatabaseType::MYSQL);
    const auto& rec = span.data();

    CHECK(rec.get_string(fields::DB_NAME) == "orders");
    CHECK(rec.get_string(fields::DB_QUERY_TEXT) == "DELETE FROM t");
    CHECK(rec.get_string(fields::DB_SYSTEM_NAME) == "mysql");
    CHECK(rec.get_string(fields::NET_PEER_NAME) == "db.internal");
    CHECK(rec.get_int(fields::NET_PEER_PORT) == 6543);
    CHECK(rec.get_string(fields::OTEL_KIND) == "client");
    CHECK(rec.get_string(fields::PEER_SERVICE) == "orders-db");
}

TEST_CASE("SpanBuilder: outcome fields start empty", "[span][builder]") {
    DbSpan span = make_query_span(ops::EXECUTE, "SELECT 1", full_attributes(), DatabaseType::POSTGRESQL);
    const auto& rec = span.data();

    for (const auto key : {fields::DB_OPERATION, fields::DB_AFFECTED_ROWS, fields::DB_RETURNED_ROWS,
                           fields::DB_STATUS_CODE, fields::DB_SQL_TABLE, fields::ERROR_TYPE,
                           fields::ERROR_MESSAGE, fields::ERROR_STACKTRACE,
                           fields::OTEL_STATUS_CODE, fields::OTEL_STATUS_DESCRIPTION}) {
        INFO(key);
        CHECK(rec.has_field(key));
        CHECK(rec.get(key) == nullptr);
    }
}

TEST_CASE("SpanBuilder: query text is redacted when recording is off", "[span][builder][redaction]") {
    Attributes attrs = full_attributes();
    attrs.record_query_text = false;

    DbSpan span = make_query_span(ops::EXECUTE, "UPDATE users SET ssn = '123'", attrs,
                                  DatabaseType::POSTGRESQL);
    CHECK(span.data().has_field(fields::DB_QUERY_TEXT));
    CHECK(span.data().get(fields::DB_QUERY_TEXT) == nullptr);
}

TEST_CASE("SpanBuilder: unset attributes leave identifying fields empty", "[span][builder]") {
    DbSpan span = make_query_span(ops::EXECUTE, "SELECT 1", Attributes{}, DatabaseType::SQLITE);
    const auto& rec = span.data();

    CHECK(rec.get(fields::DB_NAME) == nullptr);
    CHECK(rec.get(fields::NET_PEER_NAME) == nullptr);
    CHECK(rec.get(fields::NET_PEER_PORT) == nullptr);
    CHECK(rec.get(fields::PEER_SERVICE) == nullptr);
    CHECK(rec.get_string(fields::DB_SYSTEM_NAME) == "sqlite");
}

// ============================================================================
// Lifecycle spans
// ============================================================================

TEST_CASE("SpanBuilder: lifecycle span has no query fields", "[span][builder]") {
    DbSpan span = make_lifecycle_span(ops::POOL_ACQUIRE, full_attributes(), DatabaseType::POSTGRESQL);
    const auto& rec = span.data();

    CHECK(rec.name == "sqlx.pool.acquire");
    CHECK_FALSE(rec.has_field(fields::DB_QUERY_TEXT));
    CHECK_FALSE(rec.has_field(fields::DB_OPERATION));
    CHECK_FALSE(rec.has_field(fields::DB_RETURNED_ROWS));
    CHECK(rec.has_field(fields::OTEL_STATUS_CODE));
    CHECK(rec.get_string(fields::PEER_SERVICE) == "orders-db");
}

TEST_CASE("DbSpan: recording an undeclared field is a no-op", "[span]") {
    DbSpan span = make_lifecycle_span(ops::POOL_CLOSE, Attributes{}, DatabaseType::POSTGRESQL);
    span.record(fields::DB_RETURNED_ROWS, int64_t{5});
    span.record("custom.field", std::string("x"));
    CHECK_FALSE(span.data().has_field(fields::DB_RETURNED_ROWS));
    CHECK_FALSE(span.data().has_field("custom.field"));
}

// ============================================================================
// Parenting and export
// ============================================================================

TEST_CASE("DbSpan: spans created inside a scope become children", "[span][scope]") {
    SpanCapture capture;
    {
        DbSpan parent = make_lifecycle_span(ops::TRANSACTION_BEGIN, Attributes{}, DatabaseType::POSTGRESQL);
        SpanScope scope(parent);
        DbSpan child = make_query_span(ops::EXECUTE, "SELECT 1", Attributes{}, DatabaseType::POSTGRESQL);

        CHECK(child.trace_id() == parent.trace_id());
        CHECK(child.data().parent_span_id == parent.span_id());
        CHECK(SpanScope::depth() == 1);
    }
    CHECK(SpanScope::depth() == 0);
    CHECK_FALSE(SpanScope::current());
    CHECK(capture.spans().size() == 2);
}

TEST_CASE("DbSpan: spans outside any scope start new traces", "[span][scope]") {
    DbSpan a = make_query_span(ops::EXECUTE, "SELECT 1", Attributes{}, DatabaseType::POSTGRESQL);
    DbSpan b = make_query_span(ops::EXECUTE, "SELECT 1", Attributes{}, DatabaseType::POSTGRESQL);
    CHECK(a.data().parent_span_id.empty());
    CHECK(a.trace_id() != b.trace_id());
}

TEST_CASE("DbSpan: finish exports exactly once", "[span]") {
    SpanCapture capture;
    {
        DbSpan span = make_lifecycle_span(ops::CONNECTION_PING, Attributes{}, DatabaseType::POSTGRESQL);
        span.finish();
        span.finish();
        CHECK(span.is_finished());
    }
    CHECK(capture.spans().size() == 1);
    CHECK(capture.spans().front().end_time >= capture.spans().front().start_time);
}

TEST_CASE("DbSpan: a moved-from span exports nothing", "[span]") {
    SpanCapture capture;
    {
        DbSpan a = make_lifecycle_span(ops::CONNECTION_PING, Attributes{}, DatabaseType::POSTGRESQL);
        DbSpan b = std::move(a);
    }
    CHECK(capture.spans().size() == 1);
}

TEST_CASE("TraceScope: root spans join the remote trace", "[span][scope]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01");
    REQUIRE(ctx);

    TraceScope trace(*ctx);
    DbSpan span = make_query_span(ops::EXECUTE, "SELECT 1", Attributes{}, DatabaseType::POSTGRESQL);
    CHECK(span.trace_id() == "4bf92f3577b34da6a3ce929d0e0e4736");
    CHECK(span.data().parent_span_id == "00f067aa0ba902b7");
}
