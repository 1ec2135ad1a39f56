#include "msgtrace/providers/metadata_provider.hpp"

#include <utility>

#include "msgtrace/core/tracing/propagator.hpp"

namespace msgtrace::providers {

MetadataAttributeProvider::MetadataAttributeProvider(std::string prefix, KeyFilter key_filter, int priority)
    : prefix_(std::move(prefix)), key_filter_(std::move(key_filter)), priority_(priority) {
}

core::tracing::ProvidedAttributes MetadataAttributeProvider::provide_attributes(
    const core::tracing::Message& message) {
    core::tracing::ProvidedAttributes attributes;
    for (const auto& [key, value] : message.metadata) {
        if (core::tracing::is_reserved_key(key)) {
            continue;
        }
        if (key_filter_ && !key_filter_(key)) {
            continue;
        }
        std::string attribute_key = prefix_.empty() ? key : prefix_ + "." + key;
        attributes.emplace(std::move(attribute_key), core::tracing::AttributeValue{value});
    }
    return attributes;
}

}  // namespace msgtrace::providers
