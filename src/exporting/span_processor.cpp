#include "msgtrace/core/exporting/span_processor.hpp"

#include <exception>
#include <utility>

namespace msgtrace::core::exporting {

ExportingSpanProcessor::ExportingSpanProcessor(SpanExporterPtr exporter, std::size_t queue_capacity,
                                               SpanFilterPtr filter, logging::LoggerPtr logger)
    : exporter_(std::move(exporter)),
      queue_(queue_capacity),
      filter_(std::move(filter)),
      logger_(std::move(logger)) {
}

void ExportingSpanProcessor::on_end(const std::shared_ptr<const tracing::Span>& span) noexcept {
    if (!span || shutdown_.load()) {
        return;
    }
    if (!span->sampled()) {
        ++unsampled_;
        return;
    }

    try {
        if (filter_ && !filter_->should_export(*span)) {
            ++filtered_;
            return;
        }
    } catch (const std::exception& e) {
        ++filtered_;
        if (logger_) {
            logger_->warn("span filter failed on '{}', span not exported: {}", span->name(), e.what());
        }
        return;
    }

    if (!queue_.try_push(span) && logger_) {
        logger_->debug("export queue full, dropped '{}' ({} dropped so far)", span->name(), queue_.dropped());
    }
}

std::size_t ExportingSpanProcessor::flush() {
    std::size_t exported = 0;
    for (auto& span : queue_.drain()) {
        if (!exporter_) {
            continue;
        }
        try {
            exporter_->submit(span);
            ++exported;
        } catch (const std::exception& e) {
            ++export_failures_;
            if (logger_) {
                logger_->warn("exporter rejected span '{}': {}", span->name(), e.what());
            }
        }
    }
    if (exporter_) {
        try {
            exporter_->flush();
        } catch (const std::exception& e) {
            ++export_failures_;
            if (logger_) {
                logger_->warn("exporter flush failed: {}", e.what());
            }
        }
    }
    return exported;
}

void ExportingSpanProcessor::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    auto exported = flush();
    if (exporter_) {
        try {
            exporter_->shutdown();
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->warn("exporter shutdown failed: {}", e.what());
            }
        }
    }
    if (logger_) {
        logger_->info("span processor stopped: {} exported on shutdown, {} dropped, {} export failures",
                      exported, queue_.dropped(), export_failures_.load());
    }
}

}  // namespace msgtrace::core::exporting
