#pragma once

#include <string>

#include "msgtrace/core/tracing/attribute_provider.hpp"
#include "msgtrace/core/tracing/correlation.hpp"

namespace msgtrace::providers {

/**
 * @brief Publishes the message's correlation id as a span attribute.
 *
 * Runs at priority 100 so it overrides generic providers writing the same key.
 */
class CorrelationIdAttributeProvider : public core::tracing::AttributeProvider {
public:
    static constexpr int default_priority = 100;

    explicit CorrelationIdAttributeProvider(std::string metadata_key = core::tracing::correlation_id_key,
                                            std::string attribute_key = core::tracing::correlation_id_attribute);

    core::tracing::ProvidedAttributes provide_attributes(const core::tracing::Message& message) override;
    [[nodiscard]] int priority() const noexcept override { return default_priority; }
    [[nodiscard]] std::string name() const override { return "correlation-id"; }

private:
    std::string metadata_key_;
    std::string attribute_key_;
};

}  // namespace msgtrace::providers
