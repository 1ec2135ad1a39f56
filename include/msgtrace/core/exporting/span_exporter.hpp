#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

#include "msgtrace/core/exporting/export_queue.hpp"
#include "msgtrace/core/logging/logger.hpp"

namespace msgtrace::core::exporting {

/**
 * @brief Tracing-backend collaborator. Receives ended, sampled, accepted spans.
 *
 * submit() may throw; the core counts the failure and moves on.
 */
class SpanExporter {
public:
    virtual ~SpanExporter() = default;

    virtual void submit(const SpanData& span) = 0;
    virtual void flush() {}
    virtual void shutdown() {}
};

using SpanExporterPtr = std::shared_ptr<SpanExporter>;

/**
 * @brief Writes each span as one JSON log line.
 */
class LogSpanExporter : public SpanExporter {
public:
    explicit LogSpanExporter(logging::LoggerPtr logger, logging::Level level = logging::Level::info);

    void submit(const SpanData& span) override;
    void flush() override;

private:
    logging::LoggerPtr logger_;
    logging::Level level_;
};

/**
 * @brief Keeps submitted spans in memory, for tests and local inspection.
 */
class InMemorySpanExporter : public SpanExporter {
public:
    void submit(const SpanData& span) override;

    [[nodiscard]] std::vector<SpanData> spans() const;
    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<SpanData> spans_;
};

// Span record as exported: ids in hex, kind and status as lower-case names,
// epoch-microsecond timestamps, attributes with their native JSON types.
[[nodiscard]] nlohmann::json to_json(const tracing::Span& span);

}  // namespace msgtrace::core::exporting
