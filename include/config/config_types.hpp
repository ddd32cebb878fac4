#pragma once

#include "db/connection_pool.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sqltrace {

// ============================================================================
// Configuration Types
// ============================================================================

/**
 * @brief [database] section: connection URL plus span attribute overrides
 *
 * Unset overrides keep the values derived from the URL.
 */
struct DatabaseConfig {
    std::string url;
    std::optional<std::string> name;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> database;
};

/**
 * @brief [tracing] section
 */
struct TracingConfig {
    bool record_query_text = true;
    bool record_error_details = true;
    std::string exporter = "none";   // "none" | "json"
    std::string output_file;         // json exporter target (empty = stderr)
};

struct SqltraceConfig {
    DatabaseConfig database;
    PoolConfig pool;
    TracingConfig tracing;
};

} // namespace sqltrace
