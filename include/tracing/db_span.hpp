#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sqltrace {

using FieldValue = std::variant<std::string, int64_t, bool>;

/**
 * @brief One declared span field; empty value = not recorded (yet)
 */
struct SpanField {
    std::string key;
    std::optional<FieldValue> value;
};

/**
 * @brief Finished (or in-flight) span data as handed to exporters
 */
struct SpanRecord {
    std::string name;
    std::string trace_id;        // 32 hex chars
    std::string span_id;         // 16 hex chars
    std::string parent_span_id;  // empty for a root span
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::vector<SpanField> fields;  // declaration order

    [[nodiscard]] bool has_field(std::string_view key) const;

    /// Recorded value, or nullptr when undeclared or still empty
    [[nodiscard]] const FieldValue* get(std::string_view key) const;

    [[nodiscard]] std::optional<std::string> get_string(std::string_view key) const;
    [[nodiscard]] std::optional<int64_t> get_int(std::string_view key) const;

    /// Duration in microseconds
    [[nodiscard]] uint64_t duration_us() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                end_time - start_time).count());
    }
};

/**
 * @brief A span under construction
 *
 * The field set is fixed when the span is created. record() fills a
 * declared field and silently ignores an undeclared one. The parent is
 * whatever span is active on this thread at creation time (see
 * SpanScope); with none, a new trace starts.
 *
 * finish() stamps the end time and hands the record to the Tracer; it
 * runs at most once and is implied by destruction. A span destroyed
 * before its outcome was recorded is exported as-is.
 */
class DbSpan {
public:
    DbSpan(std::string name, std::vector<SpanField> fields);
    ~DbSpan();

    DbSpan(DbSpan&& other) noexcept;
    DbSpan& operator=(DbSpan&& other) noexcept;

    DbSpan(const DbSpan&) = delete;
    DbSpan& operator=(const DbSpan&) = delete;

    void record(std::string_view key, FieldValue value);

    void finish();

    [[nodiscard]] bool is_finished() const { return finished_; }

    [[nodiscard]] const SpanRecord& data() const { return record_; }

    [[nodiscard]] const std::string& trace_id() const { return record_.trace_id; }
    [[nodiscard]] const std::string& span_id() const { return record_.span_id; }

private:
    SpanRecord record_;
    bool finished_ = false;
};

} // namespace sqltrace
