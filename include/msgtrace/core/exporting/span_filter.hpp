#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "msgtrace/core/config/tracing_config.hpp"
#include "msgtrace/core/tracing/span.hpp"

namespace msgtrace::core::exporting {

/**
 * @brief Per-span export decision, taken after the span has ended.
 */
class SpanFilter {
public:
    virtual ~SpanFilter() = default;
    [[nodiscard]] virtual bool should_export(const tracing::Span& span) const = 0;
};

using SpanFilterPtr = std::shared_ptr<SpanFilter>;

/**
 * @brief Rejects everything while tracing is disabled; otherwise applies the
 * per-kind flag named by the span's `message.type`. Untagged spans pass.
 */
class ConfigurationSpanFilter : public SpanFilter {
public:
    explicit ConfigurationSpanFilter(config::TracingConfiguration config);

    [[nodiscard]] bool should_export(const tracing::Span& span) const override;

private:
    config::TracingConfiguration config_;
};

/**
 * @brief Logical AND of its filters. Empty accepts everything.
 */
class CompositeSpanFilter : public SpanFilter {
public:
    explicit CompositeSpanFilter(std::vector<SpanFilterPtr> filters);

    [[nodiscard]] bool should_export(const tracing::Span& span) const override;
    [[nodiscard]] std::size_t size() const noexcept { return filters_.size(); }

private:
    std::vector<SpanFilterPtr> filters_;
};

class FunctionSpanFilter : public SpanFilter {
public:
    using Predicate = std::function<bool(const tracing::Span&)>;

    explicit FunctionSpanFilter(Predicate predicate) : predicate_(std::move(predicate)) {}

    [[nodiscard]] bool should_export(const tracing::Span& span) const override {
        return !predicate_ || predicate_(span);
    }

private:
    Predicate predicate_;
};

}  // namespace msgtrace::core::exporting
