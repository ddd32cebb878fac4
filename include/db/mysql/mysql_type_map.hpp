#pragma once

#include "db/value.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <string>

namespace sqltrace {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL field types to the upper-case type names reported in
 * column metadata.
 */
class MysqlTypeMap {
public:
    /**
     * @brief Map MySQL field type to its SQL type name
     * @param field_type MySQL enum_field_types value
     * @param flags Field flags (UNSIGNED_FLAG, BINARY_FLAG)
     */
    [[nodiscard]] static std::string field_type_to_name(enum_field_types field_type, unsigned int flags = 0);

    [[nodiscard]] static TypeInfo build_type_info(enum_field_types field_type, unsigned int flags = 0);
};

} // namespace sqltrace
