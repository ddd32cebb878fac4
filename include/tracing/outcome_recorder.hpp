#pragma once

#include "core/error.hpp"
#include "tracing/attributes.hpp"
#include "tracing/db_span.hpp"
#include <cstddef>
#include <string_view>

namespace sqltrace {

/**
 * @brief Error bucket reported in error.type
 */
enum class ErrorType {
    CLIENT,  // The query or the caller's access pattern is at fault
    SERVER   // Everything else
};

[[nodiscard]] std::string_view error_type_to_string(ErrorType type);

/**
 * @brief Fixed partition of the driver error kinds
 *
 * CLIENT: COLUMN_INDEX_OUT_OF_BOUNDS, COLUMN_DECODE, COLUMN_NOT_FOUND,
 * DECODE, ENCODE, ROW_NOT_FOUND, TYPE_NOT_FOUND. SERVER: the rest.
 */
[[nodiscard]] ErrorType classify_error(const DbError& error);

/**
 * @brief Fill the error fields of a span
 *
 * Always sets otel.status_code = "error" and error.type. With error
 * details enabled also sets error.message and otel.status_description
 * (display form) and error.stacktrace (debug form).
 */
void record_error(DbSpan& span, const DbError& error, const Attributes& attrs);

void record_returned_rows(DbSpan& span, size_t rows);

} // namespace sqltrace
