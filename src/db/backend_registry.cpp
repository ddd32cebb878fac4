#include "db/backend_registry.hpp"

#ifdef SQLTRACE_WITH_POSTGRESQL
#include "db/postgresql/pg_connection.hpp"
#endif
#ifdef SQLTRACE_WITH_MYSQL
#include "db/mysql/mysql_connection.hpp"
#endif
#ifdef SQLTRACE_WITH_SQLITE
#include "db/sqlite/sqlite_connection.hpp"
#endif

#include <format>

namespace sqltrace {

BackendRegistry& BackendRegistry::instance() {
    static BackendRegistry registry;
    return registry;
}

BackendRegistry::BackendRegistry() {
#ifdef SQLTRACE_WITH_POSTGRESQL
    makers_[DatabaseType::POSTGRESQL] = [] { return std::make_shared<PgConnectionFactory>(); };
#endif
#ifdef SQLTRACE_WITH_MYSQL
    makers_[DatabaseType::MYSQL] = [] { return std::make_shared<MysqlConnectionFactory>(); };
#endif
#ifdef SQLTRACE_WITH_SQLITE
    makers_[DatabaseType::SQLITE] = [] { return std::make_shared<SqliteConnectionFactory>(); };
#endif
}

void BackendRegistry::register_backend(DatabaseType type, ConnectionFactoryMaker maker) {
    std::lock_guard lock(mutex_);
    makers_[type] = std::move(maker);
}

Result<std::shared_ptr<IConnectionFactory>> BackendRegistry::make_factory(DatabaseType type) const {
    using R = Result<std::shared_ptr<IConnectionFactory>>;

    ConnectionFactoryMaker maker;
    {
        std::lock_guard lock(mutex_);
        const auto it = makers_.find(type);
        if (it == makers_.end()) {
            return R::error(DbErrorKind::CONFIGURATION,
                std::format("no backend compiled in for database type '{}'",
                            database_type_to_string(type)));
        }
        maker = it->second;
    }
    return R::ok(maker());
}

bool BackendRegistry::has_backend(DatabaseType type) const {
    std::lock_guard lock(mutex_);
    return makers_.contains(type);
}

} // namespace sqltrace
