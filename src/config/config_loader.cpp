#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace sqltrace {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, val] : *tbl) {
            expand_env_vars_recursive(val);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& item : *arr) {
            expand_env_vars_recursive(item);
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        auto* base_sub = base[key].as_table();
        if (const auto* overlay_sub = val.as_table(); overlay_sub && base_sub) {
            merge_tables(*base_sub, *overlay_sub);
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 *
 * Each file is expanded once, before its own include list is read.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (const auto* s = inc_node.as_string()) {
        paths.emplace_back(s->get());
    } else if (const auto* arr = inc_node.as_array()) {
        for (const auto& item : *arr) {
            if (const auto* p = item.as_string()) {
                paths.emplace_back(p->get());
            }
        }
    } else {
        throw std::runtime_error("include must be a string or an array of strings");
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        expand_env_vars_recursive(included);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base; the including file overrides it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

int64_t toml_non_negative(const toml::table& tbl, const std::string_view key, int64_t fallback) {
    const int64_t value = tbl[key].value_or(fallback);
    if (value < 0) {
        throw std::runtime_error(std::format("{} must not be negative, got {}", key, value));
    }
    return value;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* db = root["database"].as_table();
    if (!db) return cfg;

    cfg.url = (*db)["url"].value_or(""s);
    cfg.name = toml_optional_string(*db, "name");
    cfg.host = toml_optional_string(*db, "host");
    cfg.database = toml_optional_string(*db, "database");

    if (const auto port = (*db)["port"].value<int64_t>()) {
        if (*port < 1 || *port > 65535) {
            throw std::runtime_error(std::format("database.port must be 1-65535, got {}", *port));
        }
        cfg.port = static_cast<uint16_t>(*port);
    }
    return cfg;
}

PoolConfig ConfigLoader::extract_pool(const toml::table& root) {
    PoolConfig cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) return cfg;

    cfg.min_connections = static_cast<size_t>(
        toml_non_negative(*pool, "min_connections", static_cast<int64_t>(cfg.min_connections)));
    cfg.max_connections = static_cast<size_t>(
        toml_non_negative(*pool, "max_connections", static_cast<int64_t>(cfg.max_connections)));
    cfg.acquire_timeout = std::chrono::milliseconds(
        toml_non_negative(*pool, "acquire_timeout_ms", cfg.acquire_timeout.count()));
    cfg.idle_timeout = std::chrono::milliseconds(
        toml_non_negative(*pool, "idle_timeout_ms", cfg.idle_timeout.count()));
    cfg.max_lifetime = std::chrono::seconds(
        toml_non_negative(*pool, "max_lifetime_s", cfg.max_lifetime.count()));
    cfg.health_check_query = (*pool)["health_check_query"].value_or(cfg.health_check_query);
    return cfg;
}

TracingConfig ConfigLoader::extract_tracing(const toml::table& root) {
    TracingConfig cfg;
    const auto* t = root["tracing"].as_table();
    if (!t) return cfg;

    cfg.record_query_text    = (*t)["record_query_text"].value_or(cfg.record_query_text);
    cfg.record_error_details = (*t)["record_error_details"].value_or(cfg.record_error_details);
    cfg.exporter             = utils::to_lower((*t)["exporter"].value_or(cfg.exporter));
    cfg.output_file          = (*t)["output_file"].value_or(cfg.output_file);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

SqltraceConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    SqltraceConfig config;
    config.database = extract_database(tbl);
    config.pool = extract_pool(tbl);
    config.tracing = extract_tracing(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SqltraceConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SqltraceConfig& config) {
    std::vector<std::string> errors;

    if (config.database.url.empty()) {
        errors.emplace_back("database.url must not be empty");
    }

    if (config.pool.max_connections < 1) {
        errors.emplace_back("pool.max_connections must be >= 1");
    }
    if (config.pool.min_connections > config.pool.max_connections) {
        errors.push_back(std::format("pool.min_connections ({}) > max_connections ({})",
                                     config.pool.min_connections, config.pool.max_connections));
    }

    if (config.tracing.exporter != "none" && config.tracing.exporter != "json") {
        errors.push_back(std::format("tracing.exporter must be \"none\" or \"json\", got \"{}\"",
                                     config.tracing.exporter));
    }

    return errors;
}

} // namespace sqltrace
