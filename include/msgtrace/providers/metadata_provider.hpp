#pragma once

#include <functional>
#include <string>

#include "msgtrace/core/tracing/attribute_provider.hpp"

namespace msgtrace::providers {

/**
 * @brief Copies message metadata onto spans as "{prefix}.{key}".
 *
 * With an empty prefix the metadata key is used as is. The trace-context keys
 * (traceparent, tracestate, baggage) are never copied; `key_filter`, when set,
 * selects among the rest.
 */
class MetadataAttributeProvider : public core::tracing::AttributeProvider {
public:
    using KeyFilter = std::function<bool(const std::string&)>;

    explicit MetadataAttributeProvider(std::string prefix = "metadata", KeyFilter key_filter = nullptr,
                                       int priority = 0);

    core::tracing::ProvidedAttributes provide_attributes(const core::tracing::Message& message) override;
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] std::string name() const override { return "metadata"; }

private:
    std::string prefix_;
    KeyFilter key_filter_;
    int priority_;
};

}  // namespace msgtrace::providers
