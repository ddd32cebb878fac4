#include "tracing/trace_context.hpp"
#include "tracing/span_scope.hpp"

#include <algorithm>
#include <format>
#include <random>

namespace sqltrace {

namespace {

constexpr size_t kTraceparentSize = 55;  // 2 + 1 + 32 + 1 + 16 + 1 + 2

bool is_lower_hex(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

bool is_zero_id(std::string_view s) {
    return s.find_first_not_of('0') == std::string_view::npos;
}

bool is_id(std::string_view s, size_t width) {
    return s.size() == width && is_lower_hex(s) && !is_zero_id(s);
}

std::string random_id(size_t words) {
    static thread_local std::mt19937_64 gen(std::random_device{}());

    std::string out;
    do {
        out.clear();
        for (size_t i = 0; i < words; ++i) {
            out += std::format("{:016x}", gen());
        }
    } while (is_zero_id(out));
    return out;
}

} // anonymous namespace

namespace trace_ids {

std::string new_trace_id() {
    return random_id(2);
}

std::string new_span_id() {
    return random_id(1);
}

} // namespace trace_ids

bool TraceContext::is_valid() const {
    return is_id(trace_id, 32) && is_id(span_id, 16);
}

std::optional<TraceContext> TraceContext::parse_traceparent(std::string_view header) {
    if (header.size() != kTraceparentSize
        || header[2] != '-' || header[35] != '-' || header[52] != '-') {
        return std::nullopt;
    }
    if (header.substr(0, 2) != "00") {
        return std::nullopt;
    }

    const auto flags = header.substr(53, 2);
    if (!is_lower_hex(flags)) {
        return std::nullopt;
    }

    TraceContext ctx;
    ctx.trace_id = std::string(header.substr(3, 32));
    ctx.span_id = std::string(header.substr(36, 16));
    if (!ctx.is_valid()) {
        return std::nullopt;
    }

    const auto nibble = [](char c) {
        return static_cast<uint8_t>(c <= '9' ? c - '0' : c - 'a' + 10);
    };
    ctx.trace_flags = static_cast<uint8_t>(nibble(flags[0]) << 4 | nibble(flags[1]));
    return ctx;
}

std::string TraceContext::to_traceparent() const {
    return std::format("00-{}-{}-{:02x}", trace_id, span_id, trace_flags);
}

std::optional<TraceContext> TraceContext::current() {
    auto active = SpanScope::current();
    if (!active) {
        return std::nullopt;
    }
    TraceContext ctx;
    ctx.trace_id = std::move(active->trace_id);
    ctx.span_id = std::move(active->span_id);
    return ctx;
}

} // namespace sqltrace
