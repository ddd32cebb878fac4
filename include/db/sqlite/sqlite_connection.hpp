#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace sqltrace {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3*. Statements are prepared one at a time from the query
 * text and stepped lazily as the stream advances. Arguments bind to the
 * statements in order, each statement taking as many as it declares.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open handle (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    ResultStream<Either> fetch_many(const Query& query) override;
    Result<Describe> describe(const std::string& sql) override;
    Result<Statement> prepare_with(const std::string& sql,
                                   const std::vector<TypeInfo>& parameters) override;

    Result<void> ping() override;
    bool is_connected() const override { return db_ != nullptr; }
    DatabaseType database_type() const override { return DatabaseType::SQLITE; }
    void close() override;

    /// Error for the most recent failure on a handle
    [[nodiscard]] static DbError make_error(sqlite3* db);

private:
    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * Opens the file named by the options; `mode=ro|rw|rwc` selects the open
 * flags (default rw, the file must exist).
 *
 * An in-memory database is private to one handle, so `:memory:` is
 * mapped to a named shared-cache database unique to this factory. The
 * factory keeps one handle open for its whole lifetime so the data
 * survives while the pool's connections come and go.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    SqliteConnectionFactory() = default;
    ~SqliteConnectionFactory() override;

    SqliteConnectionFactory(const SqliteConnectionFactory&) = delete;
    SqliteConnectionFactory& operator=(const SqliteConnectionFactory&) = delete;

    Result<std::unique_ptr<IDbConnection>> create(const ConnectOptions& options) override;

private:
    Result<sqlite3*> open(const std::string& path, int flags);

    std::mutex mutex_;
    std::string memory_uri_;
    sqlite3* memory_anchor_ = nullptr;

    static std::atomic<uint64_t> next_memory_id_;
};

} // namespace sqltrace
