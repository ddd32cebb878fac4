#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"

#include <format>
#include <type_traits>

namespace sqltrace {

std::atomic<uint64_t> SqliteConnectionFactory::next_memory_id_{0};

namespace {

DbError closed_error() {
    return {DbErrorKind::IO, "connection is closed"};
}

std::string declared_type(sqlite3_stmt* stmt, int col) {
    const char* decl = sqlite3_column_decltype(stmt, col);
    return decl ? utils::to_upper(decl) : "NULL";
}

std::shared_ptr<const ColumnList> read_columns(sqlite3_stmt* stmt) {
    auto columns = std::make_shared<ColumnList>();
    const int ncols = sqlite3_column_count(stmt);
    columns->reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        columns->push_back(ColumnInfo{
            name ? name : "",
            static_cast<size_t>(i),
            TypeInfo(0, declared_type(stmt, i))});
    }
    return columns;
}

/// Bind one value at a 1-based parameter index
int bind_value(sqlite3_stmt* stmt, int index, const Value& value) {
    return std::visit([&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, bool>) {
            return sqlite3_bind_int(stmt, index, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else {
            return sqlite3_bind_text(stmt, index, v.data(), static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
        }
    }, value);
}

/**
 * @brief Prepares and steps the statements of one query text in turn
 */
class SqliteStatementSource : public IStreamSource<Either> {
public:
    SqliteStatementSource(sqlite3* db, Query query)
        : db_(db), query_(std::move(query)) {}

    ~SqliteStatementSource() override {
        finalize();
    }

    std::optional<Result<Either>> next() override {
        while (!done_) {
            if (!stmt_) {
                auto prepared = prepare_next();
                if (prepared.is_error()) {
                    done_ = true;
                    return Result<Either>::error(prepared.error());
                }
                if (!stmt_) {
                    continue;
                }
            }

            const int rc = sqlite3_step(stmt_);
            if (rc == SQLITE_ROW) {
                std::vector<std::optional<std::string>> values;
                values.reserve(columns_->size());
                for (int i = 0; i < static_cast<int>(columns_->size()); ++i) {
                    if (sqlite3_column_type(stmt_, i) == SQLITE_NULL) {
                        values.emplace_back(std::nullopt);
                        continue;
                    }
                    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
                    const int bytes = sqlite3_column_bytes(stmt_, i);
                    values.emplace_back(std::string(text ? text : "", static_cast<size_t>(bytes)));
                }
                return Result<Either>::ok(Row(columns_, std::move(values)));
            }

            if (rc == SQLITE_DONE) {
                QueryResult done;
                if (sqlite3_stmt_readonly(stmt_) == 0) {
                    done.rows_affected = static_cast<uint64_t>(sqlite3_changes64(db_));
                    if (done.rows_affected > 0) {
                        done.last_insert_id = sqlite3_last_insert_rowid(db_);
                    }
                }
                finalize();
                return Result<Either>::ok(done);
            }

            DbError err = SqliteConnection::make_error(db_);
            finalize();
            done_ = true;
            return Result<Either>::error(std::move(err));
        }
        return std::nullopt;
    }

private:
    /**
     * @brief Prepare the statement at offset_; leaves stmt_ null when the
     * remaining text has no statement (whitespace or a trailing comment)
     */
    Result<void> prepare_next() {
        const std::string& sql = query_.sql;
        if (offset_ >= sql.size()) {
            done_ = true;
            return Result<void>::ok();
        }

        const char* start = sql.data() + offset_;
        const char* tail = nullptr;
        const int rc = sqlite3_prepare_v2(db_, start, static_cast<int>(sql.size() - offset_),
                                          &stmt_, &tail);
        if (rc != SQLITE_OK) {
            finalize();
            return Result<void>::error(SqliteConnection::make_error(db_));
        }

        offset_ = tail ? static_cast<size_t>(tail - sql.data()) : sql.size();
        if (!stmt_) {
            if (!tail || tail == start) {
                done_ = true;
            }
            return Result<void>::ok();
        }

        const int nparams = sqlite3_bind_parameter_count(stmt_);
        if (next_arg_ + static_cast<size_t>(nparams) > query_.arguments.size()) {
            const auto provided = query_.arguments.size();
            finalize();
            return Result<void>::error(DbErrorKind::ENCODE,
                std::format("statement expects {} more arguments but only {} were bound",
                            nparams, provided - next_arg_));
        }
        for (int i = 1; i <= nparams; ++i) {
            if (bind_value(stmt_, i, query_.arguments[next_arg_++]) != SQLITE_OK) {
                DbError err = SqliteConnection::make_error(db_);
                finalize();
                return Result<void>::error(std::move(err));
            }
        }

        columns_ = read_columns(stmt_);
        return Result<void>::ok();
    }

    void finalize() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    sqlite3* db_;
    Query query_;
    size_t offset_ = 0;
    size_t next_arg_ = 0;
    sqlite3_stmt* stmt_ = nullptr;
    std::shared_ptr<const ColumnList> columns_;
    bool done_ = false;
};

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbError SqliteConnection::make_error(sqlite3* db) {
    if (!db) {
        return closed_error();
    }
    return DbError::database(sqlite3_errmsg(db), std::to_string(sqlite3_extended_errcode(db)));
}

ResultStream<Either> SqliteConnection::fetch_many(const Query& query) {
    if (!db_) {
        return error_stream<Either>(closed_error());
    }
    return ResultStream<Either>(std::make_unique<SqliteStatementSource>(db_, query));
}

Result<Describe> SqliteConnection::describe(const std::string& sql) {
    if (!db_) {
        return Result<Describe>::error(closed_error());
    }

    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        DbError err = make_error(db_);
        sqlite3_finalize(stmt);
        return Result<Describe>::error(std::move(err));
    }
    if (!stmt) {
        return Result<Describe>::ok(Describe{});
    }

    Describe out;
    out.columns = *read_columns(stmt);
    out.parameters.assign(static_cast<size_t>(sqlite3_bind_parameter_count(stmt)), TypeInfo(0, "NULL"));
    out.nullable.assign(out.columns.size(), std::nullopt);
    sqlite3_finalize(stmt);

    return Result<Describe>::ok(std::move(out));
}

Result<Statement> SqliteConnection::prepare_with(const std::string& sql,
                                                 const std::vector<TypeInfo>& parameters) {
    auto desc = describe(sql);
    if (desc.is_error()) {
        return Result<Statement>::error(desc.error());
    }
    auto& d = desc.value();

    std::vector<TypeInfo> params = (parameters.size() == d.parameters.size())
        ? parameters : std::move(d.parameters);

    return Result<Statement>::ok(Statement{sql, std::move(params), std::move(d.columns)});
}

Result<void> SqliteConnection::ping() {
    if (!db_) {
        return Result<void>::error(closed_error());
    }
    char* error_msg = nullptr;
    if (sqlite3_exec(db_, "SELECT 1", nullptr, nullptr, &error_msg) != SQLITE_OK) {
        DbError err = make_error(db_);
        sqlite3_free(error_msg);
        return Result<void>::error(std::move(err));
    }
    return Result<void>::ok();
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

SqliteConnectionFactory::~SqliteConnectionFactory() {
    if (memory_anchor_) {
        sqlite3_close_v2(memory_anchor_);
        memory_anchor_ = nullptr;
    }
}

Result<sqlite3*> SqliteConnectionFactory::open(const std::string& path, int flags) {
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        DbError err = db ? SqliteConnection::make_error(db)
                         : DbError(DbErrorKind::IO, sqlite3_errstr(rc));
        if (db) {
            sqlite3_close_v2(db);
        }
        return Result<sqlite3*>::error(std::move(err));
    }
    return Result<sqlite3*>::ok(db);
}

Result<std::unique_ptr<IDbConnection>> SqliteConnectionFactory::create(const ConnectOptions& options) {
    using R = Result<std::unique_ptr<IDbConnection>>;

    std::string path;
    int flags = SQLITE_OPEN_FULLMUTEX;

    if (options.in_memory()) {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI;

        std::lock_guard lock(mutex_);
        if (!memory_anchor_) {
            memory_uri_ = std::format("file:sqltrace-memory-{}?mode=memory&cache=shared",
                                      next_memory_id_.fetch_add(1));
            auto anchor = open(memory_uri_, flags);
            if (anchor.is_error()) {
                return R::error(anchor.error());
            }
            memory_anchor_ = anchor.value();
        }
        path = memory_uri_;
    } else {
        const auto mode = options.param("mode").value_or("rw");
        if (mode == "ro") {
            flags |= SQLITE_OPEN_READONLY;
        } else if (mode == "rwc") {
            flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        } else if (mode == "rw") {
            flags |= SQLITE_OPEN_READWRITE;
        } else {
            return R::error(DbErrorKind::CONFIGURATION,
                std::format("unknown sqlite open mode '{}'", mode));
        }
        if (options.filename.starts_with("file:")) {
            flags |= SQLITE_OPEN_URI;
        }
        path = options.filename;
    }

    auto db = open(path, flags);
    if (db.is_error()) {
        return R::error(db.error());
    }

    auto conn = std::make_unique<SqliteConnection>(db.value());

    sqlite3_busy_timeout(db.value(), 5000);
    auto fk = conn->execute(Query("PRAGMA foreign_keys = ON"));
    if (fk.is_error()) {
        return R::error(fk.error());
    }

    return R::ok(std::move(conn));
}

} // namespace sqltrace
