#include "db/connection_pool.hpp"
#include "db/backend_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <functional>

namespace sqltrace {

namespace {

/**
 * @brief Stream that keeps its checked-out connection until it ends
 */
template<typename T>
class PooledStreamSource : public IStreamSource<T> {
public:
    PooledStreamSource(std::unique_ptr<PooledConnection> conn,
                       const std::function<ResultStream<T>(IDbConnection&)>& open)
        : conn_(std::move(conn)), inner_(open(**conn_)) {}

    std::optional<Result<T>> next() override {
        return inner_.next();
    }

private:
    // Destroyed after inner_ (reverse declaration order)
    std::unique_ptr<PooledConnection> conn_;
    ResultStream<T> inner_;
};

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Result<std::shared_ptr<ConnectionPool>> ConnectionPool::connect(
    const std::string& url, const PoolConfig& config) {

    auto options = ConnectOptions::parse(url);
    if (options.is_error()) {
        return Result<std::shared_ptr<ConnectionPool>>::error(options.error());
    }

    auto factory = BackendRegistry::instance().make_factory(options.value().type);
    if (factory.is_error()) {
        return Result<std::shared_ptr<ConnectionPool>>::error(factory.error());
    }

    return connect_with(options.take_value(), config, factory.take_value());
}

Result<std::shared_ptr<ConnectionPool>> ConnectionPool::connect_with(
    ConnectOptions options,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory) {

    if (!factory) {
        return Result<std::shared_ptr<ConnectionPool>>::error(DbErrorKind::CONFIGURATION,
            "connection factory is required");
    }
    if (config.max_connections == 0) {
        return Result<std::shared_ptr<ConnectionPool>>::error(DbErrorKind::CONFIGURATION,
            "max_connections must be at least 1");
    }
    if (config.min_connections > config.max_connections) {
        return Result<std::shared_ptr<ConnectionPool>>::error(DbErrorKind::CONFIGURATION,
            std::format("min_connections ({}) exceeds max_connections ({})",
                        config.min_connections, config.max_connections));
    }

    auto pool = std::make_shared<ConnectionPool>(
        PrivateTag{}, std::move(options), config, std::move(factory));

    auto warm = pool->prewarm();
    if (warm.is_error()) {
        return Result<std::shared_ptr<ConnectionPool>>::error(warm.error());
    }

    utils::log::info(std::format("ConnectionPool initialized for {} database: {} connections (min={}, max={})",
        database_type_to_string(pool->database_type()), pool->size(),
        config.min_connections, config.max_connections));

    return Result<std::shared_ptr<ConnectionPool>>::ok(std::move(pool));
}

ConnectionPool::ConnectionPool(PrivateTag, ConnectOptions options, const PoolConfig& config,
                               std::shared_ptr<IConnectionFactory> factory)
    : options_(std::move(options)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {}

ConnectionPool::~ConnectionPool() {
    shutdown_.store(true, std::memory_order_release);

    std::deque<std::unique_ptr<IDbConnection>> idle;
    {
        std::lock_guard lock(mutex_);
        idle.swap(idle_connections_);
    }
    // Outstanding connections are closed by their return callback
    for (auto& conn : idle) {
        if (conn) conn->close();
    }
}

Result<void> ConnectionPool::prewarm() {
    const size_t target = std::clamp<size_t>(config_.min_connections, 1, config_.max_connections);

    for (size_t i = 0; i < target; ++i) {
        auto conn = create_connection();
        if (conn.is_error()) {
            if (i == 0) {
                return Result<void>::error(conn.error());
            }
            utils::log::warn(std::format("Failed to create connection {} during pool initialization ({})",
                i + 1, error_kind_to_string(conn.error().kind)));
            break;
        }
        std::lock_guard lock(mutex_);
        idle_connections_.emplace_back(conn.take_value());
    }
    return Result<void>::ok();
}

// ============================================================================
// Acquire / release
// ============================================================================

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire() {
    return acquire(config_.acquire_timeout);
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    using R = Result<std::unique_ptr<PooledConnection>>;
    const auto acquire_start = std::chrono::steady_clock::now();

    if (is_closed()) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return R::error(DbError::pool_closed());
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return R::error(is_closed() ? DbError::pool_closed() : DbError::pool_timed_out());
    }

    // Re-check shutdown after acquiring semaphore (TOCTOU: shutdown may have
    // been set between the initial check and semaphore acquisition)
    if (is_closed()) {
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return R::error(DbError::pool_closed());
    }

    auto conn = checkout();
    if (conn.is_error()) {
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return R::error(conn.error());
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);
    record_acquire_time(acquire_start);
    return R::ok(wrap(conn.take_value()));
}

std::unique_ptr<PooledConnection> ConnectionPool::try_acquire() {
    const auto acquire_start = std::chrono::steady_clock::now();

    if (is_closed() || !semaphore_.try_acquire()) {
        return nullptr;
    }
    if (is_closed()) {
        semaphore_.release();
        return nullptr;
    }

    auto conn = checkout();
    if (conn.is_error()) {
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);
    record_acquire_time(acquire_start);
    return wrap(conn.take_value());
}

Result<std::unique_ptr<IDbConnection>> ConnectionPool::checkout() {
    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point birth{};
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = created_at_.find(conn.get()); it != created_at_.end()) {
                birth = it->second;
            }
            if (const auto it = last_used_.find(conn.get()); it != last_used_.end()) {
                last_used = it->second;
            }
        }
    }

    if (!conn) {
        return create_connection();
    }

    const auto now = std::chrono::steady_clock::now();

    // Recycle connections older than max_lifetime
    if (config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
        discard_connection(std::move(conn));
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        return create_connection();
    }

    // Only health-check connections that have been idle longer than idle_timeout.
    if (now - last_used > config_.idle_timeout) {
        if (!conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            discard_connection(std::move(conn));
            return create_connection();
        }
    }

    return Result<std::unique_ptr<IDbConnection>>::ok(std::move(conn));
}

Result<std::unique_ptr<IDbConnection>> ConnectionPool::create_connection() {
    auto conn = factory_->create(options_);
    if (conn.is_error()) {
        utils::log::warn(std::format("Failed to open {} connection ({})",
            database_type_to_string(options_.type), error_kind_to_string(conn.error().kind)));
        return conn;
    }

    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);
    ++open_connections_;
    created_at_[conn.value().get()] = now;
    last_used_[conn.value().get()] = now;
    return conn;
}

void ConnectionPool::discard_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    conn.reset();
    {
        std::lock_guard lock(mutex_);
        --open_connections_;
    }
    all_closed_.notify_all();
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<IDbConnection> conn) {
    std::weak_ptr<ConnectionPool> weak = weak_from_this();
    auto return_fn = [weak](std::unique_ptr<IDbConnection> c) {
        if (auto pool = weak.lock()) {
            pool->return_connection(std::move(c));
        } else if (c) {
            c->close();
        }
    };
    return std::make_unique<PooledConnection>(std::move(conn), std::move(return_fn));
}

void ConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    // A connection still inside a transaction, or one that lost its server,
    // never goes back to the idle set
    const bool reusable = conn->is_connected() && conn->transaction_depth() == 0;

    {
        std::lock_guard lock(mutex_);
        if (reusable && !is_closed()) {
            last_used_[conn.get()] = std::chrono::steady_clock::now();
            idle_connections_.emplace_back(std::move(conn));
        }
    }

    if (conn) {
        discard_connection(std::move(conn));
    }

    semaphore_.release();
}

void ConnectionPool::record_acquire_time(std::chrono::steady_clock::time_point start) {
    const auto elapsed = std::chrono::steady_clock::now() - start;
    const auto us = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    acquire_time_sum_us_.fetch_add(us, std::memory_order_relaxed);
    acquire_time_count_.fetch_add(1, std::memory_order_relaxed);

    // Buckets: ≤100μs, ≤500μs, ≤1ms, ≤5ms, ≤50ms, +Inf
    size_t bucket = 5;
    if (us <= 100)        bucket = 0;
    else if (us <= 500)   bucket = 1;
    else if (us <= 1000)  bucket = 2;
    else if (us <= 5000)  bucket = 3;
    else if (us <= 50000) bucket = 4;
    acquire_time_buckets_[bucket].fetch_add(1, std::memory_order_relaxed);
}

Result<DbTransaction> ConnectionPool::begin() {
    auto conn = acquire();
    if (conn.is_error()) {
        return Result<DbTransaction>::error(conn.error());
    }
    return DbTransaction::begin(conn.take_value());
}

void ConnectionPool::close() {
    shutdown_.store(true, std::memory_order_release);

    std::deque<std::unique_ptr<IDbConnection>> idle;
    {
        std::lock_guard lock(mutex_);
        idle.swap(idle_connections_);
    }
    for (auto& conn : idle) {
        discard_connection(std::move(conn));
    }

    {
        std::unique_lock lock(mutex_);
        all_closed_.wait(lock, [this] { return open_connections_ == 0; });
    }

    utils::log::info(std::format("ConnectionPool closed for {} database",
        database_type_to_string(options_.type)));
}

// ============================================================================
// Introspection
// ============================================================================

uint32_t ConnectionPool::size() const {
    std::lock_guard lock(mutex_);
    return static_cast<uint32_t>(open_connections_);
}

size_t ConnectionPool::num_idle() const {
    std::lock_guard lock(mutex_);
    return idle_connections_.size();
}

PoolStats ConnectionPool::get_stats() const {
    PoolStats stats;
    {
        std::lock_guard lock(mutex_);
        stats.total_connections = open_connections_;
        stats.idle_connections = idle_connections_.size();
    }
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);

    stats.acquire_time_sum_us = acquire_time_sum_us_.load(std::memory_order_relaxed);
    stats.acquire_time_count = acquire_time_count_.load(std::memory_order_relaxed);
    for (size_t i = 0; i < acquire_time_buckets_.size(); ++i) {
        stats.acquire_time_buckets[i] = acquire_time_buckets_[i].load(std::memory_order_relaxed);
    }

    return stats;
}

// ============================================================================
// IExecutor: one checkout per call
// ============================================================================

template<typename T, typename Fn>
Result<T> ConnectionPool::with_connection(Fn&& fn) {
    auto conn = acquire();
    if (conn.is_error()) {
        return Result<T>::error(conn.error());
    }
    return fn(**conn.value());
}

template<typename T, typename Fn>
ResultStream<T> ConnectionPool::stream_with_connection(Fn&& fn) {
    auto conn = acquire();
    if (conn.is_error()) {
        return error_stream<T>(conn.error());
    }
    const std::function<ResultStream<T>(IDbConnection&)> open = std::forward<Fn>(fn);
    return ResultStream<T>(
        std::make_unique<PooledStreamSource<T>>(conn.take_value(), open));
}

Result<Describe> ConnectionPool::describe(const std::string& sql) {
    return with_connection<Describe>([&](IDbConnection& c) { return c.describe(sql); });
}

Result<QueryResult> ConnectionPool::execute(const Query& query) {
    return with_connection<QueryResult>([&](IDbConnection& c) { return c.execute(query); });
}

ResultStream<QueryResult> ConnectionPool::execute_many(const Query& query) {
    return stream_with_connection<QueryResult>([&](IDbConnection& c) { return c.execute_many(query); });
}

ResultStream<Row> ConnectionPool::fetch(const Query& query) {
    return stream_with_connection<Row>([&](IDbConnection& c) { return c.fetch(query); });
}

Result<std::vector<Row>> ConnectionPool::fetch_all(const Query& query) {
    return with_connection<std::vector<Row>>([&](IDbConnection& c) { return c.fetch_all(query); });
}

ResultStream<Either> ConnectionPool::fetch_many(const Query& query) {
    return stream_with_connection<Either>([&](IDbConnection& c) { return c.fetch_many(query); });
}

Result<Row> ConnectionPool::fetch_one(const Query& query) {
    return with_connection<Row>([&](IDbConnection& c) { return c.fetch_one(query); });
}

Result<std::optional<Row>> ConnectionPool::fetch_optional(const Query& query) {
    return with_connection<std::optional<Row>>([&](IDbConnection& c) { return c.fetch_optional(query); });
}

Result<Statement> ConnectionPool::prepare(const std::string& sql) {
    return with_connection<Statement>([&](IDbConnection& c) { return c.prepare(sql); });
}

Result<Statement> ConnectionPool::prepare_with(const std::string& sql,
                                               const std::vector<TypeInfo>& parameters) {
    return with_connection<Statement>([&](IDbConnection& c) { return c.prepare_with(sql, parameters); });
}

} // namespace sqltrace
