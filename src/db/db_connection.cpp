#include "db/idb_connection.hpp"

#include <type_traits>

namespace sqltrace {

namespace {

/**
 * @brief Keeps only one alternative of the Either items produced by fetch_many
 */
template<typename T>
class SelectSource : public IStreamSource<T> {
public:
    explicit SelectSource(ResultStream<Either> inner) : inner_(std::move(inner)) {}

    std::optional<Result<T>> next() override {
        while (auto item = inner_.next()) {
            if (item->is_error()) {
                return Result<T>::error(item->error());
            }
            if (auto* value = std::get_if<T>(&item->value())) {
                return Result<T>::ok(std::move(*value));
            }
        }
        return std::nullopt;
    }

private:
    ResultStream<Either> inner_;
};

} // anonymous namespace

Result<QueryResult> IDbConnection::execute(const Query& query) {
    auto stream = fetch_many(query);
    QueryResult total;
    while (auto item = stream.next()) {
        if (item->is_error()) {
            return Result<QueryResult>::error(item->error());
        }
        if (const auto* done = std::get_if<QueryResult>(&item->value())) {
            total.rows_affected += done->rows_affected;
            if (done->last_insert_id) {
                total.last_insert_id = done->last_insert_id;
            }
        }
    }
    return Result<QueryResult>::ok(total);
}

ResultStream<QueryResult> IDbConnection::execute_many(const Query& query) {
    return ResultStream<QueryResult>(
        std::make_unique<SelectSource<QueryResult>>(fetch_many(query)));
}

ResultStream<Row> IDbConnection::fetch(const Query& query) {
    return ResultStream<Row>(std::make_unique<SelectSource<Row>>(fetch_many(query)));
}

Result<std::vector<Row>> IDbConnection::fetch_all(const Query& query) {
    return fetch(query).collect();
}

Result<Row> IDbConnection::fetch_one(const Query& query) {
    auto opt = fetch_optional(query);
    if (opt.is_error()) {
        return Result<Row>::error(opt.error());
    }
    if (!opt.value()) {
        return Result<Row>::error(DbError::row_not_found());
    }
    return Result<Row>::ok(std::move(*opt.value()));
}

Result<std::optional<Row>> IDbConnection::fetch_optional(const Query& query) {
    auto stream = fetch(query);
    auto first = stream.next();
    if (!first) {
        return Result<std::optional<Row>>::ok(std::nullopt);
    }
    if (first->is_error()) {
        return Result<std::optional<Row>>::error(first->error());
    }
    return Result<std::optional<Row>>::ok(first->take_value());
}

Result<Statement> IDbConnection::prepare(const std::string& sql) {
    return prepare_with(sql, {});
}

bool IDbConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }
    if (health_check_query.empty()) {
        return ping().is_ok();
    }
    return execute(Query(health_check_query)).is_ok();
}

} // namespace sqltrace
