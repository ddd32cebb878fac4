#include "db/value.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqltrace {

namespace {

const ColumnList& empty_columns() {
    static const ColumnList empty;
    return empty;
}

DbError decode_error(size_t index, std::string_view expected, std::string_view got) {
    DbError err(DbErrorKind::COLUMN_DECODE,
        std::format("error occurred while decoding column {}: expected {}, got \"{}\"",
                    index, expected, got));
    err.detail = std::format("index={}", index);
    return err;
}

DbError unexpected_null(size_t index) {
    DbError err(DbErrorKind::COLUMN_DECODE,
        std::format("error occurred while decoding column {}: unexpected null", index));
    err.detail = std::format("index={}", index);
    return err;
}

} // anonymous namespace

Row::Row(std::shared_ptr<const ColumnList> columns,
         std::vector<std::optional<std::string>> values)
    : columns_(std::move(columns)), values_(std::move(values)) {}

const ColumnList& Row::columns() const {
    return columns_ ? *columns_ : empty_columns();
}

Result<std::optional<std::string>> Row::try_get(size_t index) const {
    if (index >= values_.size()) {
        DbError err(DbErrorKind::COLUMN_INDEX_OUT_OF_BOUNDS,
            std::format("column index out of bounds: the len is {}, but the index is {}",
                        values_.size(), index));
        err.detail = std::format("index={} len={}", index, values_.size());
        return Result<std::optional<std::string>>::error(std::move(err));
    }
    return Result<std::optional<std::string>>::ok(values_[index]);
}

Result<std::optional<std::string>> Row::try_get(std::string_view name) const {
    auto idx = index_of(name);
    if (idx.is_error()) {
        return Result<std::optional<std::string>>::error(idx.error());
    }
    return try_get(idx.value());
}

Result<size_t> Row::index_of(std::string_view name) const {
    const auto& cols = columns();
    for (size_t i = 0; i < cols.size(); ++i) {
        if (cols[i].name == name) {
            return Result<size_t>::ok(i);
        }
    }
    DbError err(DbErrorKind::COLUMN_NOT_FOUND, std::format("no column found for name: {}", name));
    err.detail = std::string(name);
    return Result<size_t>::error(std::move(err));
}

template<>
Result<int64_t> Row::try_get_as<int64_t>(size_t index) const {
    auto cell = try_get(index);
    if (cell.is_error()) return Result<int64_t>::error(cell.error());
    if (!cell.value()) return Result<int64_t>::error(unexpected_null(index));

    const auto parsed = utils::try_parse_int<int64_t>(*cell.value());
    if (!parsed) return Result<int64_t>::error(decode_error(index, "integer", *cell.value()));
    return Result<int64_t>::ok(*parsed);
}

template<>
Result<double> Row::try_get_as<double>(size_t index) const {
    auto cell = try_get(index);
    if (cell.is_error()) return Result<double>::error(cell.error());
    if (!cell.value()) return Result<double>::error(unexpected_null(index));

    const auto parsed = utils::try_parse_double(*cell.value());
    if (!parsed) return Result<double>::error(decode_error(index, "double", *cell.value()));
    return Result<double>::ok(*parsed);
}

template<>
Result<bool> Row::try_get_as<bool>(size_t index) const {
    auto cell = try_get(index);
    if (cell.is_error()) return Result<bool>::error(cell.error());
    if (!cell.value()) return Result<bool>::error(unexpected_null(index));

    // PG renders booleans as t/f, MySQL and SQLite as 1/0
    const auto text = utils::to_lower(*cell.value());
    if (text == "t" || text == "true" || text == "1") return Result<bool>::ok(true);
    if (text == "f" || text == "false" || text == "0") return Result<bool>::ok(false);
    return Result<bool>::error(decode_error(index, "boolean", *cell.value()));
}

template<>
Result<std::string> Row::try_get_as<std::string>(size_t index) const {
    auto cell = try_get(index);
    if (cell.is_error()) return Result<std::string>::error(cell.error());
    if (!cell.value()) return Result<std::string>::error(unexpected_null(index));
    return Result<std::string>::ok(*cell.value());
}

bool Row::operator==(const Row& other) const {
    return columns() == other.columns() && values_ == other.values_;
}

} // namespace sqltrace
