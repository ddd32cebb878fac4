#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sqltrace {

/**
 * @brief Identifying metadata attached to every span of one pool
 *
 * Built once by PoolBuilder and then shared read-only by the pool and
 * every connection and transaction derived from it.
 *
 * Both recording toggles default to on; turning one off redacts the
 * SQL text or the error details from every span.
 */
struct Attributes {
    std::optional<std::string> name;      // peer.service
    std::optional<std::string> host;      // net.peer.name
    std::optional<uint16_t> port;         // net.peer.port
    std::optional<std::string> database;  // db.name
    bool record_query_text = true;
    bool record_error_details = true;

    bool operator==(const Attributes&) const = default;
};

using SharedAttributes = std::shared_ptr<const Attributes>;

} // namespace sqltrace
