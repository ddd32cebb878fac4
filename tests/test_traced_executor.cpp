#include <catch2/catch_test_macros.hpp>
#include "instrument/pool.hpp"
#include "mocks/mock_connection.hpp"
#include "mocks/span_capture.hpp"
#include "tracing/span_builder.hpp"
#include "tracing/span_fields.hpp"

#include <functional>

using namespace sqltrace;
using sqltrace::testing::MockScript;
using sqltrace::testing::SpanCapture;
using sqltrace::testing::make_mock_pool;

namespace {

struct Fixture {
    std::shared_ptr<MockScript> script = std::make_shared<MockScript>();
    Pool pool = PoolBuilder::from_pool(make_mock_pool(script)).with_name("orders-db").build();

    Fixture() {
        script->rows("SELECT v FROM t", {"a", "b"});
        script->rows("SELECT v FROM empty", {});
        script->fail("SELECT broken", DbError::database("syntax error at or near \"broken\"", "42601"));
    }
};

void check_identifying_fields(const SpanRecord& span) {
    CHECK(span.get_string(fields::PEER_SERVICE) == "orders-db");
    CHECK(span.get_string(fields::NET_PEER_NAME) == "db.internal");
    CHECK(span.get_int(fields::NET_PEER_PORT) == 6543);
    CHECK(span.get_string(fields::DB_NAME) == "orders");
    CHECK(span.get_string(fields::DB_SYSTEM_NAME) == "postgresql");
    CHECK(span.get_string(fields::OTEL_KIND) == "client");
}

/// Runs fn against each carrier kind, with a clean capture for each
void for_each_carrier(Fixture& fx, SpanCapture& capture,
                      const std::function<void(IExecutor&, const char*)>& fn) {
    {
        capture.exporter->clear();
        fn(fx.pool, "pool");
    }
    {
        auto conn = fx.pool.acquire();
        REQUIRE(conn.is_ok());
        capture.exporter->clear();
        fn(conn.value(), "pool connection");

        Connection borrowed = conn.value().as_connection();
        capture.exporter->clear();
        fn(borrowed, "connection");
    }
    {
        auto tx = fx.pool.begin();
        REQUIRE(tx.is_ok());
        capture.exporter->clear();
        fn(tx.value(), "transaction");

        auto inner = tx.value().executor();
        REQUIRE(inner.is_ok());
        capture.exporter->clear();
        fn(inner.value(), "transaction executor");
    }
}

} // namespace

// ============================================================================
// Span contents per carrier
// ============================================================================

TEST_CASE("TracedExecutor: fetch_all span on every carrier", "[executor][carrier]") {
    Fixture fx;
    SpanCapture capture;

    for_each_carrier(fx, capture, [&](IExecutor& ex, const char* carrier) {
        INFO(carrier);
        auto rows = ex.fetch_all("SELECT v FROM t");
        REQUIRE(rows.is_ok());
        CHECK(rows.value().size() == 2);

        const auto span = capture.only(ops::FETCH_ALL);
        check_identifying_fields(span);
        CHECK(span.get_string(fields::DB_QUERY_TEXT) == "SELECT v FROM t");
        CHECK(span.get_int(fields::DB_RETURNED_ROWS) == 2);
        CHECK(span.get(fields::OTEL_STATUS_CODE) == nullptr);
        CHECK(span.get(fields::ERROR_TYPE) == nullptr);
    });
}

TEST_CASE("TracedExecutor: errors pass through and are recorded on every carrier", "[executor][carrier]") {
    Fixture fx;
    SpanCapture capture;

    for_each_carrier(fx, capture, [&](IExecutor& ex, const char* carrier) {
        INFO(carrier);
        auto res = ex.execute("SELECT broken");
        REQUIRE(res.is_error());
        CHECK(res.error() == DbError::database("syntax error at or near \"broken\"", "42601"));

        const auto span = capture.only(ops::EXECUTE);
        CHECK(span.get_string(fields::OTEL_STATUS_CODE) == "error");
        CHECK(span.get_string(fields::ERROR_TYPE) == "server");
        CHECK(span.get_string(fields::ERROR_MESSAGE) == res.error().to_string());
        CHECK(span.get_string(fields::ERROR_STACKTRACE) == res.error().debug_string());
    });
}

TEST_CASE("TracedExecutor: results are identical to the undecorated driver", "[executor]") {
    Fixture fx;
    auto conn = fx.pool.acquire();
    REQUIRE(conn.is_ok());

    auto traced = conn.value().fetch_all("SELECT v FROM t");
    auto raw = conn.value().inner().fetch_all("SELECT v FROM t");
    REQUIRE(traced.is_ok());
    REQUIRE(raw.is_ok());
    CHECK(traced.value() == raw.value());

    auto traced_desc = conn.value().describe("SELECT v FROM t");
    auto raw_desc = conn.value().inner().describe("SELECT v FROM t");
    REQUIRE(traced_desc.is_ok());
    CHECK(traced_desc.value() == raw_desc.value());
}

// ============================================================================
// Row counts
// ============================================================================

TEST_CASE("TracedExecutor: fetch_one records one row", "[executor][rows]") {
    Fixture fx;
    SpanCapture capture;

    auto row = fx.pool.fetch_one("SELECT v FROM t");
    REQUIRE(row.is_ok());
    CHECK(row.value().values().front() == "a");
    CHECK(capture.only(ops::FETCH_ONE).get_int(fields::DB_RETURNED_ROWS) == 1);
}

TEST_CASE("TracedExecutor: fetch_one with no rows is a client error", "[executor][rows]") {
    Fixture fx;
    SpanCapture capture;

    auto row = fx.pool.fetch_one("SELECT v FROM empty");
    REQUIRE(row.is_error());
    CHECK(row.error().kind == DbErrorKind::ROW_NOT_FOUND);

    const auto span = capture.only(ops::FETCH_ONE);
    CHECK(span.get_string(fields::ERROR_TYPE) == "client");
    CHECK(span.get(fields::DB_RETURNED_ROWS) == nullptr);
}

TEST_CASE("TracedExecutor: fetch_optional records one or zero", "[executor][rows]") {
    Fixture fx;
    SpanCapture capture;

    auto some = fx.pool.fetch_optional("SELECT v FROM t");
    REQUIRE(some.is_ok());
    CHECK(some.value().has_value());

    auto none = fx.pool.fetch_optional("SELECT v FROM empty");
    REQUIRE(none.is_ok());
    CHECK_FALSE(none.value().has_value());

    const auto spans = capture.exporter->find(ops::FETCH_OPTIONAL);
    REQUIRE(spans.size() == 2);
    CHECK(spans[0].get_int(fields::DB_RETURNED_ROWS) == 1);
    CHECK(spans[1].get_int(fields::DB_RETURNED_ROWS) == 0);
}

TEST_CASE("TracedExecutor: execute and prepare record no row count", "[executor][rows]") {
    Fixture fx;
    SpanCapture capture;

    REQUIRE(fx.pool.execute("SELECT v FROM t").is_ok());
    REQUIRE(fx.pool.prepare("SELECT v FROM t").is_ok());
    REQUIRE(fx.pool.prepare_with("SELECT v FROM t", {TypeInfo(20, "INT8")}).is_ok());
    REQUIRE(fx.pool.describe("SELECT v FROM t").is_ok());

    for (const auto name : {ops::EXECUTE, ops::PREPARE, ops::PREPARE_WITH, ops::DESCRIBE}) {
        INFO(name);
        const auto span = capture.only(name);
        CHECK(span.get(fields::DB_RETURNED_ROWS) == nullptr);
        CHECK(span.get_string(fields::DB_QUERY_TEXT) == "SELECT v FROM t");
    }
}

// ============================================================================
// Streams
// ============================================================================

TEST_CASE("TracedExecutor: driver work for each stream element runs inside the span", "[executor][stream]") {
    Fixture fx;
    SpanCapture capture;
    auto conn = fx.pool.acquire();
    REQUIRE(conn.is_ok());
    fx.script->clear_log();

    auto stream = conn.value().fetch("SELECT v FROM t");
    size_t rows = 0;
    while (auto item = stream.next()) {
        REQUIRE(item->is_ok());
        ++rows;
    }
    CHECK(rows == 2);

    const auto span = capture.only(ops::FETCH);
    const auto scopes = fx.script->scopes();
    REQUIRE(scopes.size() >= 3);
    for (const auto& scope : scopes) {
        REQUIRE(scope.has_value());
        CHECK(scope->span_id == span.span_id);
    }
    CHECK_FALSE(SpanScope::current());
}

TEST_CASE("TracedExecutor: stream span ends when the stream ends", "[executor][stream]") {
    Fixture fx;
    SpanCapture capture;

    auto stream = fx.pool.fetch_many("SELECT v FROM t");
    CHECK(capture.spans().empty());

    auto items = stream.collect();
    REQUIRE(items.is_ok());
    CHECK(items.value().size() == 3);  // two rows plus the statement outcome
    CHECK(capture.exporter->find(ops::FETCH_MANY).size() == 1);
}

TEST_CASE("TracedExecutor: dropped stream leaves a span without outcome", "[executor][stream]") {
    Fixture fx;
    SpanCapture capture;
    {
        auto stream = fx.pool.fetch("SELECT v FROM t");
        auto first = stream.next();
        REQUIRE(first);
        REQUIRE(first->is_ok());
    }

    const auto span = capture.only(ops::FETCH);
    CHECK(span.get(fields::OTEL_STATUS_CODE) == nullptr);
    CHECK(span.get(fields::ERROR_TYPE) == nullptr);
    CHECK(span.get(fields::DB_RETURNED_ROWS) == nullptr);
}

TEST_CASE("TracedExecutor: stream error is recorded on the stream span", "[executor][stream]") {
    Fixture fx;
    SpanCapture capture;

    auto stream = fx.pool.execute_many("SELECT broken");
    auto item = stream.next();
    REQUIRE(item);
    REQUIRE(item->is_error());
    CHECK(item->error().sqlstate == "42601");
    CHECK_FALSE(stream.next());

    const auto span = capture.only(ops::EXECUTE_MANY);
    CHECK(span.get_string(fields::OTEL_STATUS_CODE) == "error");
    CHECK(span.get_string(fields::ERROR_TYPE) == "server");
}

// ============================================================================
// Context propagation
// ============================================================================

TEST_CASE("TracedExecutor: query spans are children of the caller's span", "[executor][scope]") {
    Fixture fx;
    SpanCapture capture;

    DbSpan request = make_lifecycle_span("http.request", Attributes{}, DatabaseType::POSTGRESQL);
    {
        SpanScope scope(request);
        REQUIRE(fx.pool.fetch_all("SELECT v FROM t").is_ok());
    }

    const auto span = capture.only(ops::FETCH_ALL);
    CHECK(span.trace_id == request.trace_id());
    CHECK(span.parent_span_id == request.span_id());
}

TEST_CASE("TracedExecutor: redaction applies to every carrier", "[executor][redaction]") {
    auto script = std::make_shared<MockScript>();
    script->fail("SELECT secret", DbError::database("permission denied for table payroll"));
    Pool pool = PoolBuilder::from_pool(make_mock_pool(script))
        .with_query_text_recording(false)
        .with_error_detail_recording(false)
        .build();
    SpanCapture capture;

    auto conn = pool.acquire();
    REQUIRE(conn.is_ok());
    REQUIRE(conn.value().execute("SELECT secret").is_error());

    const auto span = capture.only(ops::EXECUTE);
    CHECK(span.get(fields::DB_QUERY_TEXT) == nullptr);
    CHECK(span.get(fields::ERROR_MESSAGE) == nullptr);
    CHECK(span.get(fields::ERROR_STACKTRACE) == nullptr);
    CHECK(span.get(fields::OTEL_STATUS_DESCRIPTION) == nullptr);
    CHECK(span.get_string(fields::ERROR_TYPE) == "server");
}
