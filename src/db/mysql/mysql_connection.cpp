#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <type_traits>

namespace sqltrace {

namespace {

// CR_SERVER_GONE_ERROR, CR_SERVER_LOST
constexpr unsigned int kServerGone = 2006;
constexpr unsigned int kServerLost = 2013;

DbError closed_error() {
    return {DbErrorKind::IO, "connection is closed"};
}

std::shared_ptr<const ColumnList> read_columns(MYSQL_RES* res) {
    auto columns = std::make_shared<ColumnList>();
    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);
    columns->reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        columns->push_back(ColumnInfo{
            fields[i].name,
            i,
            MysqlTypeMap::build_type_info(fields[i].type, fields[i].flags)});
    }
    return columns;
}

/**
 * @brief Walks the result sets of one (possibly multi-statement) query
 */
class MysqlResultSource : public IStreamSource<Either> {
public:
    explicit MysqlResultSource(MYSQL* conn) : conn_(conn) {}

    ~MysqlResultSource() override {
        if (state_ == State::DONE) {
            return;
        }
        // mysql_free_result on an unbuffered result reads the remaining rows
        if (res_) {
            mysql_free_result(res_);
            res_ = nullptr;
        } else if (state_ == State::LOAD) {
            if (MYSQL_RES* pending = mysql_store_result(conn_)) {
                mysql_free_result(pending);
            }
        }
        drain_remaining();
    }

    std::optional<Result<Either>> next() override {
        while (state_ != State::DONE) {
            switch (state_) {
                case State::LOAD: {
                    res_ = mysql_use_result(conn_);
                    if (res_) {
                        columns_ = read_columns(res_);
                        state_ = State::ROWS;
                        continue;
                    }
                    if (mysql_field_count(conn_) != 0) {
                        return fail();
                    }
                    QueryResult done;
                    done.rows_affected = static_cast<uint64_t>(mysql_affected_rows(conn_));
                    if (const auto id = mysql_insert_id(conn_); id != 0) {
                        done.last_insert_id = static_cast<int64_t>(id);
                    }
                    state_ = State::ADVANCE;
                    return Result<Either>::ok(done);
                }

                case State::ROWS: {
                    MYSQL_ROW row = mysql_fetch_row(res_);
                    if (row) {
                        const unsigned long* lengths = mysql_fetch_lengths(res_);
                        std::vector<std::optional<std::string>> values;
                        values.reserve(columns_->size());
                        for (size_t i = 0; i < columns_->size(); ++i) {
                            if (row[i]) {
                                values.emplace_back(std::string(row[i], lengths[i]));
                            } else {
                                values.emplace_back(std::nullopt);
                            }
                        }
                        return Result<Either>::ok(Row(columns_, std::move(values)));
                    }
                    if (mysql_errno(conn_) != 0) {
                        mysql_free_result(res_);
                        res_ = nullptr;
                        return fail();
                    }
                    mysql_free_result(res_);
                    res_ = nullptr;
                    columns_.reset();
                    state_ = State::ADVANCE;
                    return Result<Either>::ok(QueryResult{});
                }

                case State::ADVANCE: {
                    const int status = mysql_next_result(conn_);
                    if (status < 0) {
                        state_ = State::DONE;
                        return std::nullopt;
                    }
                    if (status > 0) {
                        state_ = State::DONE;
                        return Result<Either>::error(MysqlConnection::make_error(conn_));
                    }
                    state_ = State::LOAD;
                    continue;
                }

                case State::DONE:
                    break;
            }
        }
        return std::nullopt;
    }

private:
    enum class State { LOAD, ROWS, ADVANCE, DONE };

    std::optional<Result<Either>> fail() {
        DbError err = MysqlConnection::make_error(conn_);
        drain_remaining();
        return Result<Either>::error(std::move(err));
    }

    void drain_remaining() {
        while (mysql_next_result(conn_) == 0) {
            if (MYSQL_RES* res = mysql_store_result(conn_)) {
                mysql_free_result(res);
            }
        }
        state_ = State::DONE;
    }

    MYSQL* conn_;
    MYSQL_RES* res_ = nullptr;
    std::shared_ptr<const ColumnList> columns_;
    State state_ = State::LOAD;
};

} // anonymous namespace

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbError MysqlConnection::make_error(MYSQL* conn) {
    if (!conn) {
        return closed_error();
    }
    const unsigned int code = mysql_errno(conn);
    std::string message = mysql_error(conn);

    // 2xxx codes come from the client library itself
    if (code == kServerGone || code == kServerLost || (code >= 2000 && code < 3000)) {
        return {DbErrorKind::IO, std::move(message)};
    }

    const char* state = mysql_sqlstate(conn);
    return DbError::database(std::move(message),
        state ? std::optional<std::string>(state) : std::nullopt);
}

Result<std::string> MysqlConnection::interpolate(const Query& query) const {
    if (query.arguments.empty()) {
        return Result<std::string>::ok(query.sql);
    }

    const std::string& sql = query.sql;
    std::string out;
    out.reserve(sql.size() + query.arguments.size() * 8);

    size_t next_arg = 0;
    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];

        // Quoted strings and identifiers are copied verbatim
        if (c == '\'' || c == '"' || c == '`') {
            const size_t start = i++;
            while (i < sql.size() && sql[i] != c) {
                if (sql[i] == '\\' && c != '`' && i + 1 < sql.size()) ++i;
                ++i;
            }
            out.append(sql, start, std::min(i + 1, sql.size()) - start);
            ++i;
            continue;
        }

        // -- and # comments run to end of line
        if ((c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') || c == '#') {
            const size_t end = sql.find('\n', i);
            const size_t stop = (end == std::string::npos) ? sql.size() : end;
            out.append(sql, i, stop - i);
            i = stop;
            continue;
        }

        if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            const size_t end = sql.find("*/", i + 2);
            const size_t stop = (end == std::string::npos) ? sql.size() : end + 2;
            out.append(sql, i, stop - i);
            i = stop;
            continue;
        }

        if (c != '?') {
            out.push_back(c);
            ++i;
            continue;
        }

        if (next_arg >= query.arguments.size()) {
            return Result<std::string>::error(DbErrorKind::ENCODE,
                std::format("query has more placeholders than the {} arguments bound",
                            query.arguments.size()));
        }

        const auto& arg = query.arguments[next_arg++];
        std::optional<DbError> encode_error;
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                out += "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                out += v ? "TRUE" : "FALSE";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                out += std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    encode_error = DbError(DbErrorKind::ENCODE,
                        std::format("argument {} is not a finite number", next_arg));
                    return;
                }
                out += std::format("{}", v);
            } else {
                std::string escaped(v.size() * 2 + 1, '\0');
                const auto len = mysql_real_escape_string(conn_, escaped.data(), v.data(),
                                                          static_cast<unsigned long>(v.size()));
                escaped.resize(len);
                out += '\'';
                out += escaped;
                out += '\'';
            }
        }, arg);

        if (encode_error) {
            return Result<std::string>::error(std::move(*encode_error));
        }
        ++i;
    }

    if (next_arg != query.arguments.size()) {
        return Result<std::string>::error(DbErrorKind::ENCODE,
            std::format("query has {} placeholders but {} arguments were bound",
                        next_arg, query.arguments.size()));
    }

    return Result<std::string>::ok(std::move(out));
}

ResultStream<Either> MysqlConnection::fetch_many(const Query& query) {
    if (!conn_) {
        return error_stream<Either>(closed_error());
    }

    auto sql = interpolate(query);
    if (sql.is_error()) {
        return error_stream<Either>(sql.error());
    }

    const auto& text = sql.value();
    if (mysql_real_query(conn_, text.data(), static_cast<unsigned long>(text.size())) != 0) {
        return error_stream<Either>(make_error(conn_));
    }

    return ResultStream<Either>(std::make_unique<MysqlResultSource>(conn_));
}

Result<Describe> MysqlConnection::describe(const std::string& sql) {
    if (!conn_) {
        return Result<Describe>::error(closed_error());
    }

    MYSQL_STMT* stmt = mysql_stmt_init(conn_);
    if (!stmt) {
        return Result<Describe>::error(make_error(conn_));
    }

    if (mysql_stmt_prepare(stmt, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        const unsigned int code = mysql_stmt_errno(stmt);
        std::string message = mysql_stmt_error(stmt);
        std::string state = mysql_stmt_sqlstate(stmt);
        mysql_stmt_close(stmt);
        if (code >= 2000 && code < 3000) {
            return Result<Describe>::error(DbErrorKind::IO, std::move(message));
        }
        return Result<Describe>::error(DbError::database(std::move(message), std::move(state)));
    }

    Describe out;
    const unsigned long nparams = mysql_stmt_param_count(stmt);
    out.parameters.assign(nparams, TypeInfo(static_cast<uint32_t>(MYSQL_TYPE_NULL), "NULL"));

    if (MYSQL_RES* meta = mysql_stmt_result_metadata(stmt)) {
        const unsigned int num_fields = mysql_num_fields(meta);
        MYSQL_FIELD* fields = mysql_fetch_fields(meta);
        for (unsigned int i = 0; i < num_fields; ++i) {
            out.columns.push_back(ColumnInfo{
                fields[i].name, i, MysqlTypeMap::build_type_info(fields[i].type, fields[i].flags)});
            out.nullable.emplace_back((fields[i].flags & NOT_NULL_FLAG) == 0);
        }
        mysql_free_result(meta);
    }

    mysql_stmt_close(stmt);
    return Result<Describe>::ok(std::move(out));
}

Result<Statement> MysqlConnection::prepare_with(const std::string& sql,
                                                const std::vector<TypeInfo>& parameters) {
    auto desc = describe(sql);
    if (desc.is_error()) {
        return Result<Statement>::error(desc.error());
    }
    auto& d = desc.value();

    // MySQL does not take parameter type hints; keep the caller's when they line up
    std::vector<TypeInfo> params = (parameters.size() == d.parameters.size())
        ? parameters : std::move(d.parameters);

    return Result<Statement>::ok(Statement{sql, std::move(params), std::move(d.columns)});
}

Result<void> MysqlConnection::ping() {
    if (!conn_) {
        return Result<void>::error(closed_error());
    }
    if (mysql_ping(conn_) != 0) {
        return Result<void>::error(make_error(conn_));
    }
    return Result<void>::ok();
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> MysqlConnectionFactory::create(const ConnectOptions& options) {
    using R = Result<std::unique_ptr<IDbConnection>>;

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        return R::error(DbErrorKind::IO, "mysql_init failed");
    }

    // Set connection timeout (5 seconds)
    unsigned int timeout = 5;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    // Set character set to UTF-8
    const auto charset = options.param("charset").value_or("utf8mb4");
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, charset.c_str());

    const std::string host = options.host.value_or("localhost");
    const std::string database = options.database.value_or("");
    const auto socket = options.param("socket");

    MYSQL* result = mysql_real_connect(
        conn,
        host.c_str(),
        options.user.empty() ? nullptr : options.user.c_str(),
        options.password.empty() ? nullptr : options.password.c_str(),
        database.empty() ? nullptr : database.c_str(),
        options.port.value_or(3306),
        socket ? socket->c_str() : nullptr,
        CLIENT_MULTI_STATEMENTS
    );

    if (!result) {
        DbError err = MysqlConnection::make_error(conn);
        mysql_close(conn);
        return R::error(std::move(err));
    }

    return R::ok(std::make_unique<MysqlConnection>(conn));
}

} // namespace sqltrace
