#include "tracing/db_span.hpp"
#include "tracing/span_scope.hpp"
#include "tracing/tracer.hpp"
#include "tracing/trace_context.hpp"

namespace sqltrace {

bool SpanRecord::has_field(std::string_view key) const {
    for (const auto& f : fields) {
        if (f.key == key) return true;
    }
    return false;
}

const FieldValue* SpanRecord::get(std::string_view key) const {
    for (const auto& f : fields) {
        if (f.key == key) {
            return f.value ? &*f.value : nullptr;
        }
    }
    return nullptr;
}

std::optional<std::string> SpanRecord::get_string(std::string_view key) const {
    const auto* v = get(key);
    if (!v) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(v)) return *s;
    return std::nullopt;
}

std::optional<int64_t> SpanRecord::get_int(std::string_view key) const {
    const auto* v = get(key);
    if (!v) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(v)) return *i;
    return std::nullopt;
}

DbSpan::DbSpan(std::string name, std::vector<SpanField> fields) {
    record_.name = std::move(name);
    record_.fields = std::move(fields);
    record_.span_id = trace_ids::new_span_id();

    if (auto parent = SpanScope::current()) {
        record_.trace_id = std::move(parent->trace_id);
        record_.parent_span_id = std::move(parent->span_id);
    } else {
        record_.trace_id = trace_ids::new_trace_id();
    }

    record_.start_time = std::chrono::system_clock::now();
}

DbSpan::~DbSpan() {
    finish();
}

DbSpan::DbSpan(DbSpan&& other) noexcept
    : record_(std::move(other.record_)), finished_(other.finished_) {
    other.finished_ = true;
}

DbSpan& DbSpan::operator=(DbSpan&& other) noexcept {
    if (this != &other) {
        finish();
        record_ = std::move(other.record_);
        finished_ = other.finished_;
        other.finished_ = true;
    }
    return *this;
}

void DbSpan::record(std::string_view key, FieldValue value) {
    if (finished_) {
        return;
    }
    for (auto& f : record_.fields) {
        if (f.key == key) {
            f.value = std::move(value);
            return;
        }
    }
}

void DbSpan::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    record_.end_time = std::chrono::system_clock::now();
    Tracer::instance().submit(record_);
}

} // namespace sqltrace
