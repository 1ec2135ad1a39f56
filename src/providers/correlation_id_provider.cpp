#include "msgtrace/providers/correlation_id_provider.hpp"

#include <utility>

namespace msgtrace::providers {

CorrelationIdAttributeProvider::CorrelationIdAttributeProvider(std::string metadata_key, std::string attribute_key)
    : metadata_key_(std::move(metadata_key)), attribute_key_(std::move(attribute_key)) {
}

core::tracing::ProvidedAttributes CorrelationIdAttributeProvider::provide_attributes(
    const core::tracing::Message& message) {
    auto correlation_id = message.metadata_value(metadata_key_);
    if (!correlation_id) {
        return {};
    }
    return {{attribute_key_, core::tracing::AttributeValue{std::move(*correlation_id)}}};
}

}  // namespace msgtrace::providers
