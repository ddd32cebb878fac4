#pragma once

#include "core/database_type.hpp"
#include "tracing/attributes.hpp"
#include "tracing/db_span.hpp"
#include <string_view>

namespace sqltrace {

/**
 * @brief Span for an executor call carrying SQL
 *
 * Declares the full field set. Identifying fields come from the
 * attributes, db.query.text is bound only when query text recording is
 * on, and the row-count, status and error fields are left for the
 * outcome recorder.
 */
[[nodiscard]] DbSpan make_query_span(std::string_view name,
                                     std::string_view sql,
                                     const Attributes& attrs,
                                     DatabaseType system);

/**
 * @brief Span for a lifecycle operation (acquire, close, ping, begin,
 * commit, rollback)
 *
 * Same field set without db.operation, db.query.text, db.response.* and
 * db.sql.table.
 */
[[nodiscard]] DbSpan make_lifecycle_span(std::string_view name,
                                         const Attributes& attrs,
                                         DatabaseType system);

} // namespace sqltrace
