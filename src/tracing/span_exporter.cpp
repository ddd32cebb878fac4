#include "tracing/span_exporter.hpp"
#include "core/utils.hpp"

#include <format>
#include <iostream>

namespace sqltrace {

// ============================================================================
// InMemorySpanExporter
// ============================================================================

void InMemorySpanExporter::export_span(const SpanRecord& span) {
    std::lock_guard lock(mutex_);
    spans_.push_back(span);
}

std::vector<SpanRecord> InMemorySpanExporter::spans() const {
    std::lock_guard lock(mutex_);
    return spans_;
}

std::vector<SpanRecord> InMemorySpanExporter::find(std::string_view name) const {
    std::lock_guard lock(mutex_);
    std::vector<SpanRecord> out;
    for (const auto& s : spans_) {
        if (s.name == name) out.push_back(s);
    }
    return out;
}

size_t InMemorySpanExporter::size() const {
    std::lock_guard lock(mutex_);
    return spans_.size();
}

void InMemorySpanExporter::clear() {
    std::lock_guard lock(mutex_);
    spans_.clear();
}

// ============================================================================
// JsonSpanExporter
// ============================================================================

JsonSpanExporter::JsonSpanExporter(const std::string& output_file)
    : to_stderr_(output_file.empty()) {
    if (!to_stderr_) {
        file_.open(output_file, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            utils::log::error(std::format("Failed to open span output file: {}", output_file));
        }
    }
}

JsonSpanExporter::~JsonSpanExporter() {
    flush();
}

bool JsonSpanExporter::is_open() const {
    return to_stderr_ || file_.is_open();
}

nlohmann::json JsonSpanExporter::to_json(const SpanRecord& span) {
    nlohmann::json fields = nlohmann::json::object();
    for (const auto& f : span.fields) {
        if (!f.value) {
            fields[f.key] = nullptr;
            continue;
        }
        std::visit([&](const auto& v) { fields[f.key] = v; }, *f.value);
    }

    nlohmann::json j;
    j["name"] = span.name;
    j["trace_id"] = span.trace_id;
    j["span_id"] = span.span_id;
    j["parent_span_id"] = span.parent_span_id.empty() ? nlohmann::json(nullptr)
                                                      : nlohmann::json(span.parent_span_id);
    j["start_time"] = utils::format_timestamp(span.start_time);
    j["end_time"] = utils::format_timestamp(span.end_time);
    j["duration_us"] = span.duration_us();
    j["fields"] = std::move(fields);
    return j;
}

void JsonSpanExporter::export_span(const SpanRecord& span) {
    std::string line;
    try {
        line = to_json(span).dump();
    } catch (const nlohmann::json::exception& e) {
        // Invalid UTF-8 in a recorded value
        utils::log::warn(std::format("Dropping span '{}': {}", span.name, e.what()));
        return;
    }

    std::lock_guard lock(mutex_);
    if (to_stderr_) {
        std::cerr << line << '\n';
    } else if (file_.is_open()) {
        file_ << line << '\n';
    }
}

void JsonSpanExporter::flush() {
    std::lock_guard lock(mutex_);
    if (to_stderr_) {
        std::cerr.flush();
    } else if (file_.is_open()) {
        file_.flush();
    }
}

Result<std::shared_ptr<ISpanExporter>> create_span_exporter(
    std::string_view kind, const std::string& output_file) {

    using R = Result<std::shared_ptr<ISpanExporter>>;
    const auto lower = utils::to_lower(kind);

    if (lower == "none" || lower.empty()) {
        return R::ok(nullptr);
    }
    if (lower == "json") {
        auto exporter = std::make_shared<JsonSpanExporter>(output_file);
        if (!exporter->is_open()) {
            return R::error(DbErrorKind::CONFIGURATION,
                std::format("cannot open span output file '{}'", output_file));
        }
        return R::ok(std::move(exporter));
    }
    return R::error(DbErrorKind::CONFIGURATION,
        std::format("unknown span exporter '{}' (expected none or json)", kind));
}

} // namespace sqltrace
