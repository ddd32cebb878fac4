#pragma once

#include "db/connection_pool.hpp"
#include "instrument/pool_connection.hpp"
#include "instrument/traced_executor.hpp"
#include "instrument/transaction.hpp"
#include "tracing/attributes.hpp"
#include <memory>
#include <optional>
#include <string>

namespace sqltrace {

struct SqltraceConfig;

/**
 * @brief Instrumented connection pool
 *
 * Cheap to copy: copies share the driver pool and the attribute set.
 * Executor calls on the pool check a connection out for the duration of
 * the call.
 */
class Pool : public TracedExecutor {
public:
    Pool(std::shared_ptr<ConnectionPool> inner, SharedAttributes attributes);

    /// Check out a connection, in a sqlx.pool.acquire span
    [[nodiscard]] Result<PoolConnection> acquire();

    /**
     * @brief Non-blocking checkout, in a sqlx.pool.acquire span
     * @return std::nullopt when no idle connection exists and the pool is full
     */
    [[nodiscard]] std::optional<PoolConnection> try_acquire();

    /**
     * @brief Close the pool, in a sqlx.pool.close span
     *
     * Returns once every connection, including checked-out ones, has been
     * returned and closed.
     */
    void close();

    /// Check out a connection and begin a transaction, in a sqlx.transaction.begin span
    [[nodiscard]] Result<Transaction> begin();

    [[nodiscard]] bool is_closed() const { return pool_->is_closed(); }

    /// Open connections, idle plus checked out
    [[nodiscard]] uint32_t size() const { return pool_->size(); }

    [[nodiscard]] size_t num_idle() const { return pool_->num_idle(); }

    /// The undecorated driver pool
    [[nodiscard]] ConnectionPool& inner() const { return *pool_; }

    [[nodiscard]] const std::shared_ptr<ConnectionPool>& inner_ptr() const { return pool_; }

protected:
    IExecutor& raw_executor() override { return *pool_; }
    DatabaseType system() const override { return pool_->database_type(); }

private:
    std::shared_ptr<ConnectionPool> pool_;
};

/**
 * @brief Builds a Pool and its attribute set
 *
 * Host, port and database default from the driver pool's connect
 * options. File-based backends have no network address; for them the
 * database filename becomes the host and port/database stay empty.
 *
 * Usage:
 *   auto builder = PoolBuilder::connect("postgres://app@db:5432/orders");
 *   Pool pool = builder.value()
 *       .with_name("orders-db")
 *       .with_query_text_recording(false)
 *       .build();
 */
class PoolBuilder {
public:
    [[nodiscard]] static PoolBuilder from_pool(std::shared_ptr<ConnectionPool> pool);

    /// Open a driver pool for the URL and derive defaults from it
    [[nodiscard]] static Result<PoolBuilder> connect(const std::string& url,
                                                     const PoolConfig& config = {});

    /// Open the configured database and apply the [database] / [tracing] overrides
    [[nodiscard]] static Result<PoolBuilder> from_config(const SqltraceConfig& config);

    [[nodiscard]] PoolBuilder with_name(std::string name) const;
    [[nodiscard]] PoolBuilder with_host(std::string host) const;
    [[nodiscard]] PoolBuilder with_port(uint16_t port) const;
    [[nodiscard]] PoolBuilder with_database(std::string database) const;
    [[nodiscard]] PoolBuilder with_query_text_recording(bool enabled) const;
    [[nodiscard]] PoolBuilder with_error_detail_recording(bool enabled) const;

    [[nodiscard]] const Attributes& attributes() const { return attributes_; }

    /// Freeze the attributes and wrap the driver pool
    [[nodiscard]] Pool build() const;

private:
    PoolBuilder(std::shared_ptr<ConnectionPool> pool, Attributes attributes);

    std::shared_ptr<ConnectionPool> pool_;
    Attributes attributes_;
};

} // namespace sqltrace
