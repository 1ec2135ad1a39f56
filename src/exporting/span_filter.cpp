#include "msgtrace/core/exporting/span_filter.hpp"

#include <algorithm>
#include <utility>

#include "msgtrace/core/tracing/span_attributes.hpp"

namespace msgtrace::core::exporting {

ConfigurationSpanFilter::ConfigurationSpanFilter(config::TracingConfiguration config)
    : config_(std::move(config)) {
}

bool ConfigurationSpanFilter::should_export(const tracing::Span& span) const {
    if (!config_.enabled) {
        return false;
    }
    auto tag = span.attribute(tracing::span_attributes::message_type);
    if (!tag) {
        return true;
    }
    const auto* text = std::get_if<std::string>(&*tag);
    if (!text) {
        return true;
    }
    auto kind = tracing::message_kind_from_string(*text);
    if (!kind) {
        return true;
    }
    return config_.traces(*kind);
}

CompositeSpanFilter::CompositeSpanFilter(std::vector<SpanFilterPtr> filters)
    : filters_(std::move(filters)) {
    filters_.erase(std::remove(filters_.begin(), filters_.end(), nullptr), filters_.end());
}

bool CompositeSpanFilter::should_export(const tracing::Span& span) const {
    return std::all_of(filters_.begin(), filters_.end(),
                       [&span](const SpanFilterPtr& filter) { return filter->should_export(span); });
}

}  // namespace msgtrace::core::exporting
