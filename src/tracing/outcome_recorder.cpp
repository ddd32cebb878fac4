#include "tracing/outcome_recorder.hpp"
#include "tracing/span_fields.hpp"

namespace sqltrace {

std::string_view error_type_to_string(ErrorType type) {
    switch (type) {
        case ErrorType::CLIENT: return "client";
        case ErrorType::SERVER: return "server";
    }
    return "server";
}

ErrorType classify_error(const DbError& error) {
    switch (error.kind) {
        case DbErrorKind::COLUMN_INDEX_OUT_OF_BOUNDS:
        case DbErrorKind::COLUMN_DECODE:
        case DbErrorKind::COLUMN_NOT_FOUND:
        case DbErrorKind::DECODE:
        case DbErrorKind::ENCODE:
        case DbErrorKind::ROW_NOT_FOUND:
        case DbErrorKind::TYPE_NOT_FOUND:
            return ErrorType::CLIENT;
        default:
            return ErrorType::SERVER;
    }
}

void record_error(DbSpan& span, const DbError& error, const Attributes& attrs) {
    span.record(fields::OTEL_STATUS_CODE, std::string("error"));
    span.record(fields::ERROR_TYPE, std::string(error_type_to_string(classify_error(error))));

    if (!attrs.record_error_details) {
        return;
    }

    const std::string message = error.to_string();
    span.record(fields::OTEL_STATUS_DESCRIPTION, message);
    span.record(fields::ERROR_MESSAGE, message);
    span.record(fields::ERROR_STACKTRACE, error.debug_string());
}

void record_returned_rows(DbSpan& span, size_t rows) {
    span.record(fields::DB_RETURNED_ROWS, static_cast<int64_t>(rows));
}

} // namespace sqltrace
