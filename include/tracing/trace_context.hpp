#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sqltrace {

/**
 * @brief A span identity in W3C traceparent form
 *
 * Incoming: parse the caller's header and enter it with TraceScope so
 * the database spans join the caller's trace. Outgoing: current()
 * describes the database span active on this thread, e.g. to pass it
 * on to the server in a query comment.
 *
 * Header: "00-{trace_id}-{span_id}-{flags}", lower-case hex.
 */
struct TraceContext {
    std::string trace_id;     // 32 hex chars (128-bit)
    std::string span_id;      // 16 hex chars (64-bit)
    uint8_t trace_flags = 0x01;

    [[nodiscard]] bool is_valid() const;
    [[nodiscard]] bool is_sampled() const { return (trace_flags & 0x01) != 0; }

    /// nullopt for a malformed header, an unknown version or a zero id
    [[nodiscard]] static std::optional<TraceContext> parse_traceparent(std::string_view header);

    [[nodiscard]] std::string to_traceparent() const;

    /// Span entered on this thread (SpanScope or TraceScope), if any
    [[nodiscard]] static std::optional<TraceContext> current();
};

namespace trace_ids {

/// Random non-zero 32-hex-char trace id
[[nodiscard]] std::string new_trace_id();

/// Random non-zero 16-hex-char span id
[[nodiscard]] std::string new_span_id();

} // namespace trace_ids

} // namespace sqltrace
