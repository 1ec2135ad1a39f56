#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <vector>

#include "msgtrace/core/tracing/span.hpp"

namespace msgtrace::core::exporting {

using SpanData = std::shared_ptr<const tracing::Span>;

/**
 * @brief Bounded hand-off between the tracing core and the exporter.
 *
 * try_push never blocks: when the queue is full the incoming span is dropped
 * and counted. Safe for concurrent producers and consumers.
 */
class ExportQueue {
public:
    // Throws ConfigurationError for a zero capacity.
    explicit ExportQueue(std::size_t capacity);

    bool try_push(SpanData span) noexcept;
    [[nodiscard]] std::vector<SpanData> drain(std::size_t max_items = std::numeric_limits<std::size_t>::max());

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t accepted() const noexcept { return accepted_.load(std::memory_order_relaxed); }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<SpanData> spans_;
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> accepted_{0};
};

}  // namespace msgtrace::core::exporting
