#pragma once

#include "core/database_type.hpp"
#include "core/error.hpp"
#include "db/stream.hpp"
#include "tracing/attributes.hpp"
#include "tracing/db_span.hpp"
#include "tracing/outcome_recorder.hpp"
#include "tracing/span_builder.hpp"
#include "tracing/span_scope.hpp"
#include <memory>
#include <string_view>
#include <utility>

namespace sqltrace {

/**
 * @brief Run fn inside span and record its error, if any
 *
 * The result is returned untouched.
 */
template<typename T, typename Fn>
[[nodiscard]] Result<T> run_in_span(DbSpan& span, const Attributes& attrs, Fn&& fn) {
    SpanScope scope(span);
    Result<T> result = std::forward<Fn>(fn)();
    if (result.is_error()) {
        record_error(span, result.error(), attrs);
    }
    return result;
}

/**
 * @brief Run a lifecycle operation (acquire, ping, begin, ...) in its own span
 */
template<typename T, typename Fn>
[[nodiscard]] Result<T> traced_lifecycle(std::string_view name, const Attributes& attrs,
                                         DatabaseType system, Fn&& fn) {
    DbSpan span = make_lifecycle_span(name, attrs, system);
    return run_in_span<T>(span, attrs, std::forward<Fn>(fn));
}

/**
 * @brief Stream decorator that re-enters its span for every element
 *
 * The span ends when the inner stream ends, fails, or is dropped; a
 * dropped stream leaves a span without an outcome.
 */
template<typename T>
class TracedStreamSource : public IStreamSource<T> {
public:
    TracedStreamSource(DbSpan span, ResultStream<T> inner, SharedAttributes attrs)
        : span_(std::move(span)), inner_(std::move(inner)), attrs_(std::move(attrs)) {}

    std::optional<Result<T>> next() override {
        std::optional<Result<T>> item;
        {
            SpanScope scope(span_);
            item = inner_.next();
        }
        if (!item) {
            span_.finish();
        } else if (item->is_error()) {
            record_error(span_, item->error(), *attrs_);
            span_.finish();
        }
        return item;
    }

private:
    // Declared first: the span outlives the inner stream
    DbSpan span_;
    ResultStream<T> inner_;
    SharedAttributes attrs_;
};

/**
 * @brief Open a stream inside a new query span and wrap it per element
 */
template<typename T, typename Open>
[[nodiscard]] ResultStream<T> traced_stream(std::string_view name, std::string_view sql,
                                            const SharedAttributes& attrs, DatabaseType system,
                                            Open&& open) {
    DbSpan span = make_query_span(name, sql, *attrs, system);
    ResultStream<T> inner;
    {
        SpanScope scope(span);
        inner = std::forward<Open>(open)();
    }
    return ResultStream<T>(
        std::make_unique<TracedStreamSource<T>>(std::move(span), std::move(inner), attrs));
}

} // namespace sqltrace
