#pragma once

#include <catch2/catch_test_macros.hpp>

#include "tracing/span_exporter.hpp"
#include "tracing/tracer.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace sqltrace::testing {

/**
 * @brief Installs an in-memory exporter for the lifetime of a test
 */
struct SpanCapture {
    std::shared_ptr<InMemorySpanExporter> exporter = std::make_shared<InMemorySpanExporter>();
    std::shared_ptr<ISpanExporter> previous;

    SpanCapture() { previous = Tracer::instance().set_exporter(exporter); }
    ~SpanCapture() { Tracer::instance().set_exporter(previous); }

    SpanCapture(const SpanCapture&) = delete;
    SpanCapture& operator=(const SpanCapture&) = delete;

    [[nodiscard]] std::vector<SpanRecord> spans() const { return exporter->spans(); }

    [[nodiscard]] SpanRecord only(std::string_view name) const {
        auto found = exporter->find(name);
        REQUIRE(found.size() == 1);
        return found.front();
    }
};

} // namespace sqltrace::testing
