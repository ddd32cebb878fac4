#include "tracing/tracer.hpp"

namespace sqltrace {

std::shared_ptr<ISpanExporter> Tracer::set_exporter(std::shared_ptr<ISpanExporter> exporter) {
    std::lock_guard lock(mutex_);
    std::swap(exporter_, exporter);
    return exporter;
}

std::shared_ptr<ISpanExporter> Tracer::exporter() const {
    std::lock_guard lock(mutex_);
    return exporter_;
}

void Tracer::submit(const SpanRecord& span) {
    // Export outside the lock; exporters synchronize themselves
    if (auto sink = exporter()) {
        sink->export_span(span);
    }
}

void Tracer::flush() {
    if (auto sink = exporter()) {
        sink->flush();
    }
}

} // namespace sqltrace
