#pragma once

#include "db/value.hpp"
#include <cstdint>
#include <string>

namespace sqltrace {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps between PG type names and OIDs. Names are the upper-case
 * catalog names reported in column metadata (INT4, TEXT, ...).
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL type name to its OID
     * @param type_name Catalog or SQL-standard type name (case-insensitive)
     * @return Type OID, or 0 if unknown
     */
    [[nodiscard]] static uint32_t type_name_to_oid(const std::string& type_name);

    /**
     * @brief Map OID to the catalog type name
     * @return Upper-case name, or "OID <n>" for types outside the builtin set
     */
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);

    [[nodiscard]] static TypeInfo build_type_info(uint32_t oid);
};

} // namespace sqltrace
