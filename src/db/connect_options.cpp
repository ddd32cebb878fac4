#include "db/connect_options.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqltrace {

namespace {

constexpr std::string_view kMemory = ":memory:";

Result<ConnectOptions> config_error(std::string message) {
    return Result<ConnectOptions>::error(DbErrorKind::CONFIGURATION, std::move(message));
}

void parse_params(std::string_view query, ConnectOptions& opts) {
    for (const auto& pair : utils::split(std::string(query), '&')) {
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            opts.params.emplace_back(utils::percent_decode(pair), "");
        } else {
            opts.params.emplace_back(utils::percent_decode(pair.substr(0, eq)),
                                     utils::percent_decode(pair.substr(eq + 1)));
        }
    }
}

Result<ConnectOptions> parse_sqlite(std::string_view url) {
    ConnectOptions opts;
    opts.type = DatabaseType::SQLITE;
    opts.url = std::string(url);

    std::string_view rest = url.substr(url.find(':') + 1);
    if (rest.starts_with("//")) {
        rest.remove_prefix(2);
    }

    if (const auto q = rest.find('?'); q != std::string_view::npos) {
        parse_params(rest.substr(q + 1), opts);
        rest = rest.substr(0, q);
    }

    if (rest.empty()) {
        return config_error("sqlite URL has no database file");
    }

    opts.filename = utils::percent_decode(rest);
    return Result<ConnectOptions>::ok(std::move(opts));
}

} // anonymous namespace

std::optional<std::string> ConnectOptions::param(std::string_view key) const {
    for (const auto& [k, v] : params) {
        if (k == key) return v;
    }
    return std::nullopt;
}

Result<ConnectOptions> ConnectOptions::parse(std::string_view url) {
    if (url == kMemory) {
        return parse_sqlite("sqlite::memory:");
    }

    const auto scheme_end = url.find(':');
    if (scheme_end == std::string_view::npos) {
        return config_error(std::format("invalid connection URL: missing scheme in '{}'", url));
    }

    const auto scheme = utils::to_lower(url.substr(0, scheme_end));
    const auto type = parse_database_type(scheme);
    if (!type) {
        return config_error(std::format("unsupported database scheme '{}'", scheme));
    }

    if (*type == DatabaseType::SQLITE) {
        return parse_sqlite(url);
    }

    std::string_view rest = url.substr(scheme_end + 1);
    if (!rest.starts_with("//")) {
        return config_error(std::format("invalid connection URL: expected '//' after '{}:'", scheme));
    }
    rest.remove_prefix(2);

    ConnectOptions opts;
    opts.type = *type;
    opts.url = std::string(url);

    if (const auto q = rest.find('?'); q != std::string_view::npos) {
        parse_params(rest.substr(q + 1), opts);
        rest = rest.substr(0, q);
    }

    std::string_view authority = rest;
    if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
        authority = rest.substr(0, slash);
        const auto db = rest.substr(slash + 1);
        if (!db.empty()) {
            opts.database = utils::percent_decode(db);
        }
    }

    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        const auto userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        if (const auto colon = userinfo.find(':'); colon != std::string_view::npos) {
            opts.user = utils::percent_decode(userinfo.substr(0, colon));
            opts.password = utils::percent_decode(userinfo.substr(colon + 1));
        } else {
            opts.user = utils::percent_decode(userinfo);
        }
    }

    std::string_view host = authority;
    if (authority.starts_with('[')) {
        // IPv6 literal: [::1]:5432
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return config_error("invalid connection URL: unterminated IPv6 host");
        }
        host = authority.substr(1, close - 1);
        const auto after = authority.substr(close + 1);
        if (after.starts_with(':')) {
            const auto port = utils::try_parse_int<uint16_t>(after.substr(1));
            if (!port) {
                return config_error(std::format("invalid port '{}'", after.substr(1)));
            }
            opts.port = *port;
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        const auto port = utils::try_parse_int<uint16_t>(authority.substr(colon + 1));
        if (!port) {
            return config_error(std::format("invalid port '{}'", authority.substr(colon + 1)));
        }
        opts.port = *port;
    }

    if (!host.empty()) {
        opts.host = utils::percent_decode(host);
    }

    return Result<ConnectOptions>::ok(std::move(opts));
}

Result<std::string> ConnectOptions::to_url_lossy() const {
    if (is_file_based(type)) {
        return Result<std::string>::error(DbErrorKind::CONFIGURATION,
            std::format("{} connections have no network URL", database_type_to_string(type)));
    }

    std::string out = std::format("{}://", database_type_to_string(type));
    if (!user.empty()) {
        out += user;
        out += '@';
    }
    if (host) {
        out += host->find(':') != std::string::npos ? std::format("[{}]", *host) : *host;
    }
    if (port) {
        out += std::format(":{}", *port);
    }
    if (database) {
        out += '/';
        out += *database;
    }
    for (size_t i = 0; i < params.size(); ++i) {
        out += (i == 0) ? '?' : '&';
        out += params[i].first;
        out += '=';
        out += params[i].second;
    }
    return Result<std::string>::ok(std::move(out));
}

} // namespace sqltrace
