#pragma once

#include "core/error.hpp"
#include "tracing/db_span.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sqltrace {

/**
 * @brief Destination for finished spans
 *
 * export_span() may be called concurrently from any thread and must not
 * throw.
 */
class ISpanExporter {
public:
    virtual ~ISpanExporter() = default;

    virtual void export_span(const SpanRecord& span) = 0;

    virtual void flush() {}
};

/**
 * @brief Keeps every finished span in memory (tests, inspection)
 */
class InMemorySpanExporter : public ISpanExporter {
public:
    void export_span(const SpanRecord& span) override;

    /// Snapshot of the spans exported so far, in finish order
    [[nodiscard]] std::vector<SpanRecord> spans() const;

    /// Spans with the given name, in finish order
    [[nodiscard]] std::vector<SpanRecord> find(std::string_view name) const;

    [[nodiscard]] size_t size() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<SpanRecord> spans_;
};

/**
 * @brief Writes one JSON object per finished span (JSONL)
 *
 * Output goes to the given file (appended) or, with an empty path, to
 * stderr. Empty fields are written as null.
 */
class JsonSpanExporter : public ISpanExporter {
public:
    explicit JsonSpanExporter(const std::string& output_file = "");
    ~JsonSpanExporter() override;

    void export_span(const SpanRecord& span) override;
    void flush() override;

    [[nodiscard]] bool is_open() const;

    [[nodiscard]] static nlohmann::json to_json(const SpanRecord& span);

private:
    std::mutex mutex_;
    std::ofstream file_;
    bool to_stderr_;
};

/**
 * @brief Build an exporter by kind name
 * @param kind "none" (returns nullptr) or "json"
 * @param output_file JSON output path; empty = stderr
 * @return CONFIGURATION error for an unknown kind or an unwritable file
 */
[[nodiscard]] Result<std::shared_ptr<ISpanExporter>> create_span_exporter(
    std::string_view kind, const std::string& output_file);

} // namespace sqltrace
