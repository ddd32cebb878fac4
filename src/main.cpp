#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "instrument/pool.hpp"
#include "tracing/span_exporter.hpp"
#include "tracing/tracer.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>

using namespace sqltrace;

namespace {

void print_row(const Row& row) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) line += '\t';
        const auto& cell = row.values()[i];
        line += cell ? *cell : "NULL";
    }
    std::cout << line << '\n';
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << std::format("usage: {} <config.toml> <sql>\n", argc > 0 ? argv[0] : "sqltrace-query");
        return EXIT_FAILURE;
    }
    const std::string config_file = argv[1];
    const std::string sql = argv[2];

    auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return EXIT_FAILURE;
    }
    const SqltraceConfig& config = config_result.config;

    auto exporter = create_span_exporter(config.tracing.exporter, config.tracing.output_file);
    if (exporter.is_error()) {
        utils::log::error(exporter.error().to_string());
        return EXIT_FAILURE;
    }
    Tracer::instance().set_exporter(exporter.value());

    auto builder = PoolBuilder::from_config(config);
    if (builder.is_error()) {
        utils::log::error(std::format("Failed to open database: {}", builder.error().to_string()));
        return EXIT_FAILURE;
    }
    Pool pool = builder.value().build();

    int status = EXIT_SUCCESS;
    auto rows = pool.fetch_all(Query(sql));
    if (rows.is_error()) {
        utils::log::error(std::format("Query failed: {}", rows.error().to_string()));
        status = EXIT_FAILURE;
    } else {
        for (const auto& row : rows.value()) {
            print_row(row);
        }
        utils::log::info(std::format("{} row(s)", rows.value().size()));
    }

    pool.close();
    Tracer::instance().flush();
    return status;
}
