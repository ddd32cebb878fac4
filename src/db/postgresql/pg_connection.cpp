#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>
#include <type_traits>

namespace sqltrace {

namespace {

std::string strip_trailing_newline(const char* msg) {
    std::string s = msg ? msg : "";
    while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

DbError closed_error() {
    return {DbErrorKind::IO, "connection is closed"};
}

/**
 * @brief Text-format parameter values for PQsendQueryParams
 */
std::vector<std::optional<std::string>> encode_arguments(const std::vector<Value>& args) {
    std::vector<std::optional<std::string>> out;
    out.reserve(args.size());
    for (const auto& arg : args) {
        std::visit([&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                out.emplace_back(std::nullopt);
            } else if constexpr (std::is_same_v<T, bool>) {
                out.emplace_back(v ? "t" : "f");
            } else if constexpr (std::is_same_v<T, std::string>) {
                out.emplace_back(v);
            } else {
                out.emplace_back(std::format("{}", v));
            }
        }, arg);
    }
    return out;
}

std::shared_ptr<const ColumnList> read_columns(const PGresult* res) {
    auto columns = std::make_shared<ColumnList>();
    const int ncols = PQnfields(res);
    columns->reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) {
        columns->push_back(ColumnInfo{
            PQfname(res, i),
            static_cast<size_t>(i),
            PgTypeMap::build_type_info(static_cast<uint32_t>(PQftype(res, i)))});
    }
    return columns;
}

uint64_t command_tuples(PGresult* res) {
    const char* affected = PQcmdTuples(res);
    if (!affected || *affected == '\0') {
        return 0;
    }
    return utils::try_parse_int<uint64_t>(affected).value_or(0);
}

/**
 * @brief Pulls single-row results off the connection as the stream advances
 */
class PgResultSource : public IStreamSource<Either> {
public:
    explicit PgResultSource(PGconn* conn) : conn_(conn) {}

    ~PgResultSource() override {
        if (done_) {
            return;
        }
        // Abandoned early: stop the server and discard what is in flight
        if (PGcancel* cancel = PQgetCancel(conn_)) {
            std::array<char, 256> errbuf{};
            if (!PQcancel(cancel, errbuf.data(), static_cast<int>(errbuf.size()))) {
                utils::log::warn(std::format("Failed to cancel abandoned PostgreSQL query: {}",
                                             errbuf.data()));
            }
            PQfreeCancel(cancel);
        }
        drain();
    }

    std::optional<Result<Either>> next() override {
        while (!done_) {
            PGresult* res = PQgetResult(conn_);
            if (!res) {
                done_ = true;
                return std::nullopt;
            }

            switch (PQresultStatus(res)) {
                case PGRES_SINGLE_TUPLE: {
                    if (!columns_) {
                        columns_ = read_columns(res);
                    }
                    std::vector<std::optional<std::string>> values;
                    values.reserve(columns_->size());
                    for (int j = 0; j < PQnfields(res); ++j) {
                        if (PQgetisnull(res, 0, j)) {
                            values.emplace_back(std::nullopt);
                        } else {
                            values.emplace_back(std::string(PQgetvalue(res, 0, j),
                                                            static_cast<size_t>(PQgetlength(res, 0, j))));
                        }
                    }
                    PQclear(res);
                    return Result<Either>::ok(Row(columns_, std::move(values)));
                }

                case PGRES_TUPLES_OK:
                case PGRES_COMMAND_OK: {
                    // End of one statement; the next one gets fresh columns
                    columns_.reset();
                    QueryResult done{command_tuples(res), std::nullopt};
                    PQclear(res);
                    return Result<Either>::ok(done);
                }

                case PGRES_EMPTY_QUERY:
                    PQclear(res);
                    continue;

                case PGRES_COPY_IN: {
                    PQclear(res);
                    if (PQputCopyEnd(conn_, "COPY FROM STDIN is not supported") != 1) {
                        utils::log::warn("Failed to abort PostgreSQL COPY FROM STDIN");
                    }
                    drain();
                    return Result<Either>::error(DbErrorKind::PROTOCOL,
                                                 "COPY is not supported through the query interface");
                }

                case PGRES_COPY_OUT:
                case PGRES_COPY_BOTH: {
                    PQclear(res);
                    char* buf = nullptr;
                    while (PQgetCopyData(conn_, &buf, 0) > 0) {
                        PQfreemem(buf);
                    }
                    drain();
                    return Result<Either>::error(DbErrorKind::PROTOCOL,
                                                 "COPY is not supported through the query interface");
                }

                default: {
                    DbError err = PgConnection::make_error(conn_, res);
                    PQclear(res);
                    drain();
                    return Result<Either>::error(std::move(err));
                }
            }
        }
        return std::nullopt;
    }

private:
    void drain() {
        while (PGresult* res = PQgetResult(conn_)) {
            PQclear(res);
        }
        done_ = true;
    }

    PGconn* conn_;
    std::shared_ptr<const ColumnList> columns_;
    bool done_ = false;
};

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbError PgConnection::make_error(PGconn* conn, const PGresult* res) {
    if (conn == nullptr || PQstatus(conn) == CONNECTION_BAD) {
        return {DbErrorKind::IO, strip_trailing_newline(conn ? PQerrorMessage(conn) : "connection is closed")};
    }
    if (res == nullptr) {
        return {DbErrorKind::PROTOCOL, strip_trailing_newline(PQerrorMessage(conn))};
    }

    const char* primary = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY);
    const char* sqlstate = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    std::string message = primary ? primary : strip_trailing_newline(PQresultErrorMessage(res));

    return DbError::database(std::move(message),
        sqlstate ? std::optional<std::string>(sqlstate) : std::nullopt);
}

ResultStream<Either> PgConnection::fetch_many(const Query& query) {
    if (!conn_) {
        return error_stream<Either>(closed_error());
    }

    int sent = 0;
    if (query.arguments.empty()) {
        // Simple protocol: allows several statements in one string
        sent = PQsendQuery(conn_, query.sql.c_str());
    } else {
        const auto encoded = encode_arguments(query.arguments);
        std::vector<const char*> values;
        values.reserve(encoded.size());
        for (const auto& v : encoded) {
            values.push_back(v ? v->c_str() : nullptr);
        }
        sent = PQsendQueryParams(conn_, query.sql.c_str(),
                                 static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    }

    if (!sent) {
        return error_stream<Either>(make_error(conn_, nullptr));
    }

    if (!PQsetSingleRowMode(conn_)) {
        utils::log::warn("PostgreSQL single-row mode unavailable; rows will be buffered");
    }

    return ResultStream<Either>(std::make_unique<PgResultSource>(conn_));
}

Result<Describe> PgConnection::describe_prepared(const std::string& sql,
                                                 const std::vector<uint32_t>& param_oids) {
    if (!conn_) {
        return Result<Describe>::error(closed_error());
    }

    std::vector<Oid> oids(param_oids.begin(), param_oids.end());
    PGresult* prep = PQprepare(conn_, "", sql.c_str(), static_cast<int>(oids.size()),
                               oids.empty() ? nullptr : oids.data());
    if (!prep || PQresultStatus(prep) != PGRES_COMMAND_OK) {
        DbError err = make_error(conn_, prep);
        PQclear(prep);
        return Result<Describe>::error(std::move(err));
    }
    PQclear(prep);

    PGresult* desc = PQdescribePrepared(conn_, "");
    if (!desc || PQresultStatus(desc) != PGRES_COMMAND_OK) {
        DbError err = make_error(conn_, desc);
        PQclear(desc);
        return Result<Describe>::error(std::move(err));
    }

    Describe out;
    out.columns = *read_columns(desc);
    const int nparams = PQnparams(desc);
    out.parameters.reserve(static_cast<size_t>(nparams));
    for (int i = 0; i < nparams; ++i) {
        out.parameters.push_back(
            PgTypeMap::build_type_info(static_cast<uint32_t>(PQparamtype(desc, i))));
    }
    // Nullability needs a catalog lookup; report unknown
    out.nullable.assign(out.columns.size(), std::nullopt);
    PQclear(desc);

    return Result<Describe>::ok(std::move(out));
}

Result<Describe> PgConnection::describe(const std::string& sql) {
    return describe_prepared(sql, {});
}

Result<Statement> PgConnection::prepare_with(const std::string& sql,
                                             const std::vector<TypeInfo>& parameters) {
    std::vector<uint32_t> oids;
    oids.reserve(parameters.size());
    for (const auto& p : parameters) {
        oids.push_back(p.vendor_type_id != 0 ? p.vendor_type_id : PgTypeMap::type_name_to_oid(p.name));
    }

    auto desc = describe_prepared(sql, oids);
    if (desc.is_error()) {
        return Result<Statement>::error(desc.error());
    }
    auto& d = desc.value();
    return Result<Statement>::ok(Statement{sql, std::move(d.parameters), std::move(d.columns)});
}

Result<void> PgConnection::ping() {
    if (!conn_) {
        return Result<void>::error(closed_error());
    }

    PGresult* res = PQexec(conn_, "");
    if (!res || PQresultStatus(res) != PGRES_EMPTY_QUERY) {
        DbError err = make_error(conn_, res);
        PQclear(res);
        return Result<void>::error(std::move(err));
    }
    PQclear(res);
    return Result<void>::ok();
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(const ConnectOptions& options) {
    using R = Result<std::unique_ptr<IDbConnection>>;

    PGconn* conn = PQconnectdb(options.url.c_str());

    if (!conn) {
        return R::error(DbErrorKind::IO, "failed to allocate PostgreSQL connection");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        DbError err(DbErrorKind::IO, strip_trailing_newline(PQerrorMessage(conn)));
        PQfinish(conn);
        return R::error(std::move(err));
    }

    return R::ok(std::make_unique<PgConnection>(conn));
}

} // namespace sqltrace
