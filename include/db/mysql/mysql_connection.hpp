#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <mysql/mysql.h>
#include <string>

namespace sqltrace {

/**
 * @brief MySQL connection implementing IDbConnection
 *
 * Wraps MYSQL* handle (MariaDB Connector/C or libmysqlclient).
 * All MySQL C API calls are encapsulated here.
 *
 * Arguments are interpolated client-side into `?` placeholders (escaped
 * with mysql_real_escape_string); rows are read unbuffered.
 */
class MysqlConnection : public IDbConnection {
public:
    explicit MysqlConnection(MYSQL* conn);
    ~MysqlConnection() override;

    MysqlConnection(const MysqlConnection&) = delete;
    MysqlConnection& operator=(const MysqlConnection&) = delete;

    ResultStream<Either> fetch_many(const Query& query) override;
    Result<Describe> describe(const std::string& sql) override;
    Result<Statement> prepare_with(const std::string& sql,
                                   const std::vector<TypeInfo>& parameters) override;

    Result<void> ping() override;
    bool is_connected() const override;
    DatabaseType database_type() const override { return DatabaseType::MYSQL; }
    void close() override;

    /**
     * @brief Substitute `?` placeholders outside quotes and comments
     * @return ENCODE error when the argument count does not match
     */
    [[nodiscard]] Result<std::string> interpolate(const Query& query) const;

    /// Error from the last failed call on a handle
    [[nodiscard]] static DbError make_error(MYSQL* conn);

private:
    MYSQL* conn_;
};

/**
 * @brief MySQL connection factory
 *
 * Creates MysqlConnection instances using mysql_real_connect.
 * Defaults: host localhost, port 3306, charset utf8mb4.
 */
class MysqlConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const ConnectOptions& options) override;
};

} // namespace sqltrace
