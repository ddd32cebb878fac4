#pragma once

#include "core/error.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sqltrace {

/**
 * @brief A bound query argument
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

/**
 * @brief Backend type descriptor (PG OID, MySQL field type, SQLite decltype)
 */
struct TypeInfo {
    uint32_t vendor_type_id = 0;
    std::string name;

    TypeInfo() = default;
    TypeInfo(uint32_t id, std::string n) : vendor_type_id(id), name(std::move(n)) {}

    bool operator==(const TypeInfo&) const = default;
};

struct ColumnInfo {
    std::string name;
    size_t ordinal = 0;
    TypeInfo type;

    bool operator==(const ColumnInfo&) const = default;
};

using ColumnList = std::vector<ColumnInfo>;

/**
 * @brief SQL text plus its bound arguments
 *
 * Implicitly constructible from a string so plain statements can be
 * passed directly: `conn.execute("DELETE FROM t")`.
 */
struct Query {
    std::string sql;
    std::vector<Value> arguments;

    Query() = default;
    Query(std::string s) : sql(std::move(s)) {}
    Query(const char* s) : sql(s) {}

    Query& bind(Value v) & {
        arguments.emplace_back(std::move(v));
        return *this;
    }

    Query&& bind(Value v) && {
        arguments.emplace_back(std::move(v));
        return std::move(*this);
    }
};

[[nodiscard]] inline Query query(std::string sql) {
    return Query(std::move(sql));
}

/**
 * @brief Outcome of a statement that does not return rows
 */
struct QueryResult {
    uint64_t rows_affected = 0;
    std::optional<int64_t> last_insert_id;

    bool operator==(const QueryResult&) const = default;
};

/**
 * @brief One result row
 *
 * Column metadata is shared by every row of the same result. Cells are
 * kept in text form; NULL is an empty optional.
 */
class Row {
public:
    Row() = default;
    Row(std::shared_ptr<const ColumnList> columns,
        std::vector<std::optional<std::string>> values);

    [[nodiscard]] size_t size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }

    [[nodiscard]] const ColumnList& columns() const;
    [[nodiscard]] const std::vector<std::optional<std::string>>& values() const { return values_; }

    /// Raw cell by position (COLUMN_INDEX_OUT_OF_BOUNDS when out of range)
    [[nodiscard]] Result<std::optional<std::string>> try_get(size_t index) const;

    /// Raw cell by column name (COLUMN_NOT_FOUND when absent)
    [[nodiscard]] Result<std::optional<std::string>> try_get(std::string_view name) const;

    /// Decoded cell; COLUMN_DECODE when the text does not convert or is NULL.
    /// Supported: int64_t, double, bool, std::string.
    template<typename T>
    [[nodiscard]] Result<T> try_get_as(size_t index) const;

    template<typename T>
    [[nodiscard]] Result<T> try_get_as(std::string_view name) const {
        auto idx = index_of(name);
        if (idx.is_error()) return Result<T>::error(idx.error());
        return try_get_as<T>(idx.value());
    }

    [[nodiscard]] Result<size_t> index_of(std::string_view name) const;

    bool operator==(const Row& other) const;

private:
    std::shared_ptr<const ColumnList> columns_;
    std::vector<std::optional<std::string>> values_;
};

template<> Result<int64_t> Row::try_get_as<int64_t>(size_t index) const;
template<> Result<double> Row::try_get_as<double>(size_t index) const;
template<> Result<bool> Row::try_get_as<bool>(size_t index) const;
template<> Result<std::string> Row::try_get_as<std::string>(size_t index) const;

/**
 * @brief Either a statement outcome or a row (what fetch_many yields)
 */
using Either = std::variant<QueryResult, Row>;

/**
 * @brief Result of describing a statement without executing it
 */
struct Describe {
    ColumnList columns;
    std::vector<TypeInfo> parameters;
    std::vector<std::optional<bool>> nullable;

    bool operator==(const Describe&) const = default;
};

/**
 * @brief A statement prepared on the server (metadata only)
 */
struct Statement {
    std::string sql;
    std::vector<TypeInfo> parameters;
    ColumnList columns;

    bool operator==(const Statement&) const = default;
};

} // namespace sqltrace
