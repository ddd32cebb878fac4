#include "tracing/span_scope.hpp"

#include <vector>

namespace sqltrace {

namespace {

std::vector<ActiveSpan>& active_stack() {
    static thread_local std::vector<ActiveSpan> stack;
    return stack;
}

} // anonymous namespace

SpanScope::SpanScope(const DbSpan& span) {
    active_stack().push_back(ActiveSpan{span.trace_id(), span.span_id()});
}

SpanScope::~SpanScope() {
    auto& stack = active_stack();
    if (!stack.empty()) {
        stack.pop_back();
    }
}

std::optional<ActiveSpan> SpanScope::current() {
    const auto& stack = active_stack();
    if (stack.empty()) {
        return std::nullopt;
    }
    return stack.back();
}

size_t SpanScope::depth() {
    return active_stack().size();
}

TraceScope::TraceScope(const TraceContext& ctx) {
    // The remote caller's span is the parent of local root spans
    active_stack().push_back(ActiveSpan{ctx.trace_id, ctx.span_id});
}

TraceScope::~TraceScope() {
    auto& stack = active_stack();
    if (!stack.empty()) {
        stack.pop_back();
    }
}

} // namespace sqltrace
