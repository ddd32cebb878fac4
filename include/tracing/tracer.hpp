#pragma once

#include "tracing/span_exporter.hpp"
#include <memory>
#include <mutex>

namespace sqltrace {

/**
 * @brief Process-wide sink for finished spans
 *
 * With no exporter installed, finished spans are dropped.
 *
 * Usage:
 *   auto exporter = std::make_shared<InMemorySpanExporter>();
 *   Tracer::instance().set_exporter(exporter);
 */
class Tracer {
public:
    static Tracer& instance() {
        static Tracer tracer;
        return tracer;
    }

    /// Install (or with nullptr, remove) the exporter; returns the previous one
    std::shared_ptr<ISpanExporter> set_exporter(std::shared_ptr<ISpanExporter> exporter);

    [[nodiscard]] std::shared_ptr<ISpanExporter> exporter() const;

    void submit(const SpanRecord& span);

    void flush();

private:
    Tracer() = default;

    mutable std::mutex mutex_;
    std::shared_ptr<ISpanExporter> exporter_;
};

} // namespace sqltrace
