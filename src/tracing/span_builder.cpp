#include "tracing/span_builder.hpp"
#include "tracing/span_fields.hpp"

#include <type_traits>

namespace sqltrace {

namespace {

SpanField empty(std::string_view key) {
    return SpanField{std::string(key), std::nullopt};
}

SpanField bound(std::string_view key, FieldValue value) {
    return SpanField{std::string(key), std::move(value)};
}

template<typename T>
SpanField optional_field(std::string_view key, const std::optional<T>& value) {
    if (!value) {
        return empty(key);
    }
    if constexpr (std::is_same_v<T, std::string>) {
        return bound(key, *value);
    } else {
        return bound(key, static_cast<int64_t>(*value));
    }
}

} // anonymous namespace

DbSpan make_query_span(std::string_view name,
                       std::string_view sql,
                       const Attributes& attrs,
                       DatabaseType system) {
    std::vector<SpanField> f;
    f.reserve(17);
    f.push_back(optional_field(fields::DB_NAME, attrs.database));
    f.push_back(empty(fields::DB_OPERATION));
    f.push_back(attrs.record_query_text ? bound(fields::DB_QUERY_TEXT, std::string(sql))
                                        : empty(fields::DB_QUERY_TEXT));
    f.push_back(empty(fields::DB_AFFECTED_ROWS));
    f.push_back(empty(fields::DB_RETURNED_ROWS));
    f.push_back(empty(fields::DB_STATUS_CODE));
    f.push_back(empty(fields::DB_SQL_TABLE));
    f.push_back(bound(fields::DB_SYSTEM_NAME, std::string(database_system_name(system))));
    f.push_back(empty(fields::ERROR_TYPE));
    f.push_back(empty(fields::ERROR_MESSAGE));
    f.push_back(empty(fields::ERROR_STACKTRACE));
    f.push_back(optional_field(fields::NET_PEER_NAME, attrs.host));
    f.push_back(optional_field(fields::NET_PEER_PORT, attrs.port));
    f.push_back(bound(fields::OTEL_KIND, std::string("client")));
    f.push_back(empty(fields::OTEL_STATUS_CODE));
    f.push_back(empty(fields::OTEL_STATUS_DESCRIPTION));
    f.push_back(optional_field(fields::PEER_SERVICE, attrs.name));
    return DbSpan(std::string(name), std::move(f));
}

DbSpan make_lifecycle_span(std::string_view name,
                           const Attributes& attrs,
                           DatabaseType system) {
    std::vector<SpanField> f;
    f.reserve(11);
    f.push_back(optional_field(fields::DB_NAME, attrs.database));
    f.push_back(bound(fields::DB_SYSTEM_NAME, std::string(database_system_name(system))));
    f.push_back(empty(fields::ERROR_TYPE));
    f.push_back(empty(fields::ERROR_MESSAGE));
    f.push_back(empty(fields::ERROR_STACKTRACE));
    f.push_back(optional_field(fields::NET_PEER_NAME, attrs.host));
    f.push_back(optional_field(fields::NET_PEER_PORT, attrs.port));
    f.push_back(bound(fields::OTEL_KIND, std::string("client")));
    f.push_back(empty(fields::OTEL_STATUS_CODE));
    f.push_back(empty(fields::OTEL_STATUS_DESCRIPTION));
    f.push_back(optional_field(fields::PEER_SERVICE, attrs.name));
    return DbSpan(std::string(name), std::move(f));
}

} // namespace sqltrace
