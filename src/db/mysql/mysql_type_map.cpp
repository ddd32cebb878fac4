#include "db/mysql/mysql_type_map.hpp"

namespace sqltrace {

std::string MysqlTypeMap::field_type_to_name(enum_field_types field_type, unsigned int flags) {
    const bool is_unsigned = (flags & UNSIGNED_FLAG) != 0;
    const bool is_binary = (flags & BINARY_FLAG) != 0;

    switch (field_type) {
        case MYSQL_TYPE_TINY:
            return is_unsigned ? "TINYINT UNSIGNED" : "TINYINT";
        case MYSQL_TYPE_SHORT:
            return is_unsigned ? "SMALLINT UNSIGNED" : "SMALLINT";
        case MYSQL_TYPE_INT24:
            return is_unsigned ? "MEDIUMINT UNSIGNED" : "MEDIUMINT";
        case MYSQL_TYPE_LONG:
            return is_unsigned ? "INT UNSIGNED" : "INT";
        case MYSQL_TYPE_LONGLONG:
            return is_unsigned ? "BIGINT UNSIGNED" : "BIGINT";
        case MYSQL_TYPE_FLOAT:
            return "FLOAT";
        case MYSQL_TYPE_DOUBLE:
            return "DOUBLE";
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return "DECIMAL";
        case MYSQL_TYPE_STRING:
            return is_binary ? "BINARY" : "CHAR";
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
            return is_binary ? "VARBINARY" : "VARCHAR";
        case MYSQL_TYPE_TINY_BLOB:
            return is_binary ? "TINYBLOB" : "TINYTEXT";
        case MYSQL_TYPE_BLOB:
            return is_binary ? "BLOB" : "TEXT";
        case MYSQL_TYPE_MEDIUM_BLOB:
            return is_binary ? "MEDIUMBLOB" : "MEDIUMTEXT";
        case MYSQL_TYPE_LONG_BLOB:
            return is_binary ? "LONGBLOB" : "LONGTEXT";
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return "DATE";
        case MYSQL_TYPE_TIME:
            return "TIME";
        case MYSQL_TYPE_DATETIME:
            return "DATETIME";
        case MYSQL_TYPE_TIMESTAMP:
            return "TIMESTAMP";
        case MYSQL_TYPE_YEAR:
            return "YEAR";
        case MYSQL_TYPE_JSON:
            return "JSON";
        case MYSQL_TYPE_BIT:
            return "BIT";
        case MYSQL_TYPE_ENUM:
            return "ENUM";
        case MYSQL_TYPE_SET:
            return "SET";
        case MYSQL_TYPE_GEOMETRY:
            return "GEOMETRY";
        case MYSQL_TYPE_NULL:
            return "NULL";
        default:
            return "UNKNOWN";
    }
}

TypeInfo MysqlTypeMap::build_type_info(enum_field_types field_type, unsigned int flags) {
    return TypeInfo(static_cast<uint32_t>(field_type), field_type_to_name(field_type, flags));
}

} // namespace sqltrace
