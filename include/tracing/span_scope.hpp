#pragma once

#include "tracing/db_span.hpp"
#include "tracing/trace_context.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace sqltrace {

/**
 * @brief Identity of the span currently entered on this thread
 */
struct ActiveSpan {
    std::string trace_id;
    std::string span_id;
};

/**
 * @brief Enters a span for the lifetime of the scope
 *
 * Spans created while the scope is alive become children of the
 * entered span. Scopes nest and must be exited in reverse order.
 */
class SpanScope {
public:
    explicit SpanScope(const DbSpan& span);
    ~SpanScope();

    SpanScope(const SpanScope&) = delete;
    SpanScope& operator=(const SpanScope&) = delete;

    /// Innermost entered span on this thread, if any
    [[nodiscard]] static std::optional<ActiveSpan> current();

    [[nodiscard]] static size_t depth();
};

/**
 * @brief Continues a remote trace on this thread
 *
 * While alive, root spans join the trace of the given context and take
 * its parent span (the caller's span) as their parent.
 *
 * Usage:
 *   if (auto ctx = TraceContext::parse_traceparent(header)) {
 *       TraceScope trace(*ctx);
 *       pool.fetch_all("SELECT ...");
 *   }
 */
class TraceScope {
public:
    explicit TraceScope(const TraceContext& ctx);
    ~TraceScope();

    TraceScope(const TraceScope&) = delete;
    TraceScope& operator=(const TraceScope&) = delete;
};

} // namespace sqltrace
