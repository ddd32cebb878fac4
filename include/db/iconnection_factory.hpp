#pragma once

#include "db/connect_options.hpp"
#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqltrace {

/**
 * @brief Opens native connections for one pool
 *
 * A pool owns exactly one factory for its whole life, so a factory may
 * keep per-pool state (the SQLite factory keeps the in-memory database
 * alive between connections).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /// Open a connection; the error is the backend's connect error
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const ConnectOptions& options) = 0;
};

using ConnectionFactoryMaker = std::function<std::shared_ptr<IConnectionFactory>()>;

} // namespace sqltrace
