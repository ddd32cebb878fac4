#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace sqltrace {

uint32_t PgTypeMap::type_name_to_oid(const std::string& type_name) {
    static const std::unordered_map<std::string, uint32_t> TYPE_OIDS = {
        {"integer", 23},    {"int4", 23},
        {"smallint", 21},   {"int2", 21},
        {"bigint", 20},     {"int8", 20},
        {"real", 700},      {"float4", 700},
        {"double precision", 701}, {"float8", 701},
        {"text", 25},
        {"varchar", 1043},  {"character varying", 1043},
        {"char", 1042},     {"character", 1042}, {"bpchar", 1042},
        {"name", 19},
        {"boolean", 16},    {"bool", 16},
        {"date", 1082},
        {"time", 1083},     {"time without time zone", 1083},
        {"timetz", 1266},   {"time with time zone", 1266},
        {"timestamp", 1114},{"timestamp without time zone", 1114},
        {"timestamptz", 1184}, {"timestamp with time zone", 1184},
        {"numeric", 1700},  {"decimal", 1700},
        {"uuid", 2950},
        {"json", 114},      {"jsonb", 3802},
        {"bytea", 17},
        {"inet", 869},      {"cidr", 650},
        {"macaddr", 829},
        {"interval", 1186},
        {"oid", 26},
        {"money", 790},
        {"xml", 142},
        {"void", 2278},
        {"unknown", 705},
    };

    auto it = TYPE_OIDS.find(utils::to_lower(type_name));
    return it != TYPE_OIDS.end() ? it->second : 0;
}

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    static const std::unordered_map<uint32_t, std::string> OID_NAMES = {
        {16, "BOOL"},
        {17, "BYTEA"},
        {19, "NAME"},
        {20, "INT8"},
        {21, "INT2"},
        {23, "INT4"},
        {25, "TEXT"},
        {26, "OID"},
        {114, "JSON"},
        {142, "XML"},
        {650, "CIDR"},
        {700, "FLOAT4"},
        {701, "FLOAT8"},
        {705, "UNKNOWN"},
        {790, "MONEY"},
        {829, "MACADDR"},
        {869, "INET"},
        {1042, "BPCHAR"},
        {1043, "VARCHAR"},
        {1082, "DATE"},
        {1083, "TIME"},
        {1114, "TIMESTAMP"},
        {1184, "TIMESTAMPTZ"},
        {1186, "INTERVAL"},
        {1266, "TIMETZ"},
        {1700, "NUMERIC"},
        {2278, "VOID"},
        {2950, "UUID"},
        {3802, "JSONB"},
    };

    auto it = OID_NAMES.find(oid);
    return it != OID_NAMES.end() ? it->second : std::format("OID {}", oid);
}

TypeInfo PgTypeMap::build_type_info(uint32_t oid) {
    return TypeInfo(oid, oid_to_type_name(oid));
}

} // namespace sqltrace
