#pragma once

#include "core/database_type.hpp"
#include "db/iconnection_factory.hpp"
#include <mutex>
#include <unordered_map>

namespace sqltrace {

/**
 * @brief Maps a database type to the maker of its connection factory
 *
 * The backends compiled into this build register themselves on first
 * use of instance(). Embedders may register additional or replacement
 * makers, e.g. to route a type to a proxying driver.
 */
class BackendRegistry {
public:
    static BackendRegistry& instance();

    void register_backend(DatabaseType type, ConnectionFactoryMaker maker);

    /**
     * @brief New factory for one pool
     * @return CONFIGURATION error when no backend serves the type
     */
    [[nodiscard]] Result<std::shared_ptr<IConnectionFactory>> make_factory(DatabaseType type) const;

    [[nodiscard]] bool has_backend(DatabaseType type) const;

private:
    BackendRegistry();

    mutable std::mutex mutex_;
    std::unordered_map<DatabaseType, ConnectionFactoryMaker> makers_;
};

} // namespace sqltrace
