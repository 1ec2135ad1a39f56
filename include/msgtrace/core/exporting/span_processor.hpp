#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "msgtrace/core/exporting/export_queue.hpp"
#include "msgtrace/core/exporting/span_exporter.hpp"
#include "msgtrace/core/exporting/span_filter.hpp"
#include "msgtrace/core/logging/logger.hpp"
#include "msgtrace/core/tracing/span.hpp"

namespace msgtrace::core::exporting {

/**
 * @brief Routes ended spans to the export queue.
 *
 * Unsampled spans and spans the filter rejects stop here. Nothing on this
 * path blocks or throws into the code that ended the span. flush() moves the
 * queued spans to the exporter; exporter failures are counted and logged.
 */
class ExportingSpanProcessor : public tracing::SpanProcessor {
public:
    ExportingSpanProcessor(SpanExporterPtr exporter, std::size_t queue_capacity,
                           SpanFilterPtr filter = nullptr, logging::LoggerPtr logger = nullptr);

    void on_end(const std::shared_ptr<const tracing::Span>& span) noexcept override;

    // Hands everything queued so far to the exporter. Returns the number exported.
    std::size_t flush();
    // Flushes, then stops accepting spans and shuts the exporter down. Idempotent.
    void shutdown();

    [[nodiscard]] bool is_shutdown() const noexcept { return shutdown_.load(); }
    [[nodiscard]] const ExportQueue& queue() const noexcept { return queue_; }
    [[nodiscard]] std::uint64_t unsampled() const noexcept { return unsampled_.load(); }
    [[nodiscard]] std::uint64_t filtered() const noexcept { return filtered_.load(); }
    [[nodiscard]] std::uint64_t export_failures() const noexcept { return export_failures_.load(); }

private:
    SpanExporterPtr exporter_;
    ExportQueue queue_;
    SpanFilterPtr filter_;
    logging::LoggerPtr logger_;
    std::atomic<bool> shutdown_{false};
    std::atomic<std::uint64_t> unsampled_{0};
    std::atomic<std::uint64_t> filtered_{0};
    std::atomic<std::uint64_t> export_failures_{0};
};

}  // namespace msgtrace::core::exporting
