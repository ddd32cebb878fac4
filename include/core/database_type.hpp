#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <unordered_map>

namespace sqltrace {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view SQLITE = "sqlite";
    inline constexpr std::string_view SQLITE3 = "sqlite3";
}

enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
    SQLITE,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        case DatabaseType::SQLITE: return keys::SQLITE;
        default: return "unknown";
    }
}

/**
 * @brief Value of the `db.system.name` span field for a backend
 */
[[nodiscard]] inline std::string_view database_system_name(DatabaseType type) {
    return database_type_to_string(type);
}

/**
 * @brief File-based backends have no network peer (no host/port in their options)
 */
[[nodiscard]] inline bool is_file_based(DatabaseType type) {
    return type == DatabaseType::SQLITE;
}

/**
 * @brief Server port used when a URL names none
 */
[[nodiscard]] inline std::optional<uint16_t> default_port(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return 5432;
        case DatabaseType::MYSQL: return 3306;
        default: return std::nullopt;
    }
}

[[nodiscard]] inline std::optional<DatabaseType> parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::SQLITE,     DatabaseType::SQLITE},
        {keys::SQLITE3,    DatabaseType::SQLITE}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback (only if direct lookup fails)
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) { return std::tolower(a) == std::tolower(b); });
            if (match) return value;
        }
    }

    return std::nullopt;
}

} // namespace sqltrace
