#include "msgtrace/core/exporting/export_queue.hpp"

#include <algorithm>
#include <new>
#include <utility>

#include "msgtrace/core/errors.hpp"

namespace msgtrace::core::exporting {

ExportQueue::ExportQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw ConfigurationError("export queue capacity must be positive");
    }
}

bool ExportQueue::try_push(SpanData span) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (spans_.size() < capacity_) {
            try {
                spans_.push_back(std::move(span));
                accepted_.fetch_add(1, std::memory_order_relaxed);
                return true;
            } catch (const std::bad_alloc&) {
                // counted as a drop below
            }
        }
    }
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
}

std::vector<SpanData> ExportQueue::drain(std::size_t max_items) {
    std::vector<SpanData> batch;
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t count = std::min(max_items, spans_.size());
    batch.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        batch.push_back(std::move(spans_.front()));
        spans_.pop_front();
    }
    return batch;
}

std::size_t ExportQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_.size();
}

}  // namespace msgtrace::core::exporting
