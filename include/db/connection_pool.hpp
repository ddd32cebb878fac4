#pragma once

#include "db/connect_options.hpp"
#include "db/iconnection_factory.hpp"
#include "db/iexecutor.hpp"
#include "db/pooled_connection.hpp"
#include "db/transaction.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace sqltrace {

/**
 * @brief Pool configuration (database-agnostic)
 */
struct PoolConfig {
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds acquire_timeout{30000};
    std::chrono::milliseconds idle_timeout{600000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{1800};  // 0 = disabled
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;

    // Acquire time histogram (microseconds)
    // Buckets: ≤100μs, ≤500μs, ≤1ms, ≤5ms, ≤50ms, +Inf
    uint64_t acquire_time_sum_us = 0;
    uint64_t acquire_time_count = 0;
    std::array<uint64_t, 6> acquire_time_buckets = {};
};

/**
 * @brief Database-agnostic connection pool
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore
 * - Lazy growth: connections created on-demand up to max
 * - Health checking: connections idle longer than idle_timeout are
 *   validated before being handed out
 * - RAII: PooledConnection auto-returns on destruction
 * - close() refuses new checkouts and blocks until every outstanding
 *   connection has come back and been closed
 *
 * Always owned by a shared_ptr: returned connections find their way
 * back through a weak reference, so a connection outliving the pool is
 * simply closed.
 *
 * Also an IExecutor: each call checks a connection out, runs on it, and
 * returns it (streams keep the connection until they end).
 */
class ConnectionPool : public IExecutor,
                       public std::enable_shared_from_this<ConnectionPool> {
    struct PrivateTag {};

public:
    /**
     * @brief Parse the URL, pick the backend, pre-warm min_connections
     *
     * The first connection is opened eagerly; its failure fails the call.
     */
    [[nodiscard]] static Result<std::shared_ptr<ConnectionPool>> connect(
        const std::string& url, const PoolConfig& config = {});

    /**
     * @brief Same as connect() with an explicit factory (custom or mock backends)
     */
    [[nodiscard]] static Result<std::shared_ptr<ConnectionPool>> connect_with(
        ConnectOptions options,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ConnectionPool(PrivateTag, ConnectOptions options, const PoolConfig& config,
                   std::shared_ptr<IConnectionFactory> factory);

    ~ConnectionPool() override;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// Acquire with the configured acquire_timeout
    [[nodiscard]] Result<std::unique_ptr<PooledConnection>> acquire();

    /**
     * @brief Acquire connection from pool (blocking with timeout)
     * @return POOL_TIMED_OUT, POOL_CLOSED, or the connect error on failure
     */
    [[nodiscard]] Result<std::unique_ptr<PooledConnection>> acquire(
        std::chrono::milliseconds timeout);

    /**
     * @brief Non-blocking acquire
     * @return nullptr when no idle connection exists and the pool is at
     *         capacity (or closed, or a new connection cannot be opened)
     */
    [[nodiscard]] std::unique_ptr<PooledConnection> try_acquire();

    /// Acquire a connection and open a transaction on it
    [[nodiscard]] Result<DbTransaction> begin();

    /**
     * @brief Close the pool
     *
     * Idle connections are closed immediately; outstanding ones are
     * closed when returned. Does not return until all are closed.
     */
    void close();

    [[nodiscard]] bool is_closed() const { return shutdown_.load(std::memory_order_acquire); }

    /// Open connections, idle plus checked out
    [[nodiscard]] uint32_t size() const;

    [[nodiscard]] size_t num_idle() const;

    [[nodiscard]] const ConnectOptions& connect_options() const { return options_; }

    [[nodiscard]] DatabaseType database_type() const { return options_.type; }

    [[nodiscard]] const PoolConfig& config() const { return config_; }

    [[nodiscard]] PoolStats get_stats() const;

    // IExecutor (one checkout per call)
    Result<Describe> describe(const std::string& sql) override;
    Result<QueryResult> execute(const Query& query) override;
    ResultStream<QueryResult> execute_many(const Query& query) override;
    ResultStream<Row> fetch(const Query& query) override;
    Result<std::vector<Row>> fetch_all(const Query& query) override;
    ResultStream<Either> fetch_many(const Query& query) override;
    Result<Row> fetch_one(const Query& query) override;
    Result<std::optional<Row>> fetch_optional(const Query& query) override;
    Result<Statement> prepare(const std::string& sql) override;
    Result<Statement> prepare_with(const std::string& sql,
                                   const std::vector<TypeInfo>& parameters) override;

private:
    /**
     * @brief Open the min_connections set; fails if the first connect fails
     */
    Result<void> prewarm();

    /**
     * @brief Take an idle connection or open a new one (semaphore slot held)
     */
    Result<std::unique_ptr<IDbConnection>> checkout();

    Result<std::unique_ptr<IDbConnection>> create_connection();

    /// Close a connection that will not return to the idle set
    void discard_connection(std::unique_ptr<IDbConnection> conn);

    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn);

    void record_acquire_time(std::chrono::steady_clock::time_point start);

    template<typename T, typename Fn>
    Result<T> with_connection(Fn&& fn);

    template<typename T, typename Fn>
    ResultStream<T> stream_with_connection(Fn&& fn);

    ConnectOptions options_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;
    std::condition_variable all_closed_;
    size_t open_connections_ = 0;

    // Semaphore for bounded pool
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<uint64_t> acquire_time_sum_us_{0};
    std::atomic<uint64_t> acquire_time_count_{0};
    std::array<std::atomic<uint64_t>, 6> acquire_time_buckets_{};

    // Shutdown flag
    std::atomic<bool> shutdown_{false};

    // Connection lifetime tracking
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
};

} // namespace sqltrace
