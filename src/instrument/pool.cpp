#include "instrument/pool.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "instrument/traced_call.hpp"
#include "tracing/span_fields.hpp"

#include <format>

namespace sqltrace {

// ============================================================================
// Pool
// ============================================================================

Pool::Pool(std::shared_ptr<ConnectionPool> inner, SharedAttributes attributes)
    : TracedExecutor(std::move(attributes)), pool_(std::move(inner)) {}

Result<PoolConnection> Pool::acquire() {
    return traced_lifecycle<PoolConnection>(ops::POOL_ACQUIRE, *attributes(), system(),
        [this]() -> Result<PoolConnection> {
            auto conn = pool_->acquire();
            if (conn.is_error()) {
                return Result<PoolConnection>::error(conn.error());
            }
            return Result<PoolConnection>::ok(PoolConnection(conn.take_value(), attributes()));
        });
}

std::optional<PoolConnection> Pool::try_acquire() {
    // No outcome is recorded: an empty pool is not an error
    DbSpan span = make_lifecycle_span(ops::POOL_ACQUIRE, *attributes(), system());
    SpanScope scope(span);
    auto conn = pool_->try_acquire();
    if (!conn) {
        return std::nullopt;
    }
    return PoolConnection(std::move(conn), attributes());
}

void Pool::close() {
    DbSpan span = make_lifecycle_span(ops::POOL_CLOSE, *attributes(), system());
    SpanScope scope(span);
    pool_->close();
}

Result<Transaction> Pool::begin() {
    return traced_lifecycle<Transaction>(ops::TRANSACTION_BEGIN, *attributes(), system(),
        [this]() -> Result<Transaction> {
            auto tx = pool_->begin();
            if (tx.is_error()) {
                return Result<Transaction>::error(tx.error());
            }
            return Result<Transaction>::ok(Transaction(tx.take_value(), attributes()));
        });
}

// ============================================================================
// PoolBuilder
// ============================================================================

PoolBuilder::PoolBuilder(std::shared_ptr<ConnectionPool> pool, Attributes attributes)
    : pool_(std::move(pool)), attributes_(std::move(attributes)) {}

PoolBuilder PoolBuilder::from_pool(std::shared_ptr<ConnectionPool> pool) {
    Attributes attrs;
    const ConnectOptions& options = pool->connect_options();

    if (is_file_based(options.type)) {
        attrs.host = options.filename;
    } else if (auto url = options.to_url_lossy(); url.is_ok()) {
        attrs.host = options.host.value_or("localhost");
        attrs.port = options.port ? options.port : default_port(options.type);
        if (options.database) {
            attrs.database = options.database->substr(0, options.database->find('/'));
        }
    } else {
        utils::log::warn(std::format("Cannot derive span attributes from connect options: {}",
                                     url.error().to_string()));
    }

    return PoolBuilder(std::move(pool), std::move(attrs));
}

Result<PoolBuilder> PoolBuilder::connect(const std::string& url, const PoolConfig& config) {
    auto pool = ConnectionPool::connect(url, config);
    if (pool.is_error()) {
        return Result<PoolBuilder>::error(pool.error());
    }
    return Result<PoolBuilder>::ok(from_pool(pool.take_value()));
}

Result<PoolBuilder> PoolBuilder::from_config(const SqltraceConfig& config) {
    auto connected = connect(config.database.url, config.pool);
    if (connected.is_error()) {
        return connected;
    }

    PoolBuilder builder = connected.take_value()
        .with_query_text_recording(config.tracing.record_query_text)
        .with_error_detail_recording(config.tracing.record_error_details);
    if (config.database.name) {
        builder = builder.with_name(*config.database.name);
    }
    if (config.database.host) {
        builder = builder.with_host(*config.database.host);
    }
    if (config.database.port) {
        builder = builder.with_port(*config.database.port);
    }
    if (config.database.database) {
        builder = builder.with_database(*config.database.database);
    }
    return Result<PoolBuilder>::ok(std::move(builder));
}

PoolBuilder PoolBuilder::with_name(std::string name) const {
    PoolBuilder next = *this;
    next.attributes_.name = std::move(name);
    return next;
}

PoolBuilder PoolBuilder::with_host(std::string host) const {
    PoolBuilder next = *this;
    next.attributes_.host = std::move(host);
    return next;
}

PoolBuilder PoolBuilder::with_port(uint16_t port) const {
    PoolBuilder next = *this;
    next.attributes_.port = port;
    return next;
}

PoolBuilder PoolBuilder::with_database(std::string database) const {
    PoolBuilder next = *this;
    next.attributes_.database = std::move(database);
    return next;
}

PoolBuilder PoolBuilder::with_query_text_recording(bool enabled) const {
    PoolBuilder next = *this;
    next.attributes_.record_query_text = enabled;
    return next;
}

PoolBuilder PoolBuilder::with_error_detail_recording(bool enabled) const {
    PoolBuilder next = *this;
    next.attributes_.record_error_details = enabled;
    return next;
}

Pool PoolBuilder::build() const {
    return Pool(pool_, std::make_shared<const Attributes>(attributes_));
}

} // namespace sqltrace
