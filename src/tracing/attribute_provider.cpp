#include "msgtrace/core/tracing/attribute_provider.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace msgtrace::core::tracing {

FunctionAttributeProvider::FunctionAttributeProvider(std::string name, Function function, int priority)
    : name_(std::move(name)), function_(std::move(function)), priority_(priority) {
}

ProvidedAttributes FunctionAttributeProvider::provide_attributes(const Message& message) {
    if (!function_) {
        return {};
    }
    return function_(message);
}

CompositeAttributeProvider::CompositeAttributeProvider(std::vector<AttributeProviderPtr> providers,
                                                       logging::LoggerPtr logger)
    : providers_(std::move(providers)), logger_(std::move(logger)) {
    providers_.erase(std::remove(providers_.begin(), providers_.end(), nullptr), providers_.end());
    std::stable_sort(providers_.begin(), providers_.end(),
                     [](const AttributeProviderPtr& lhs, const AttributeProviderPtr& rhs) {
                         return lhs->priority() < rhs->priority();
                     });
}

Attributes CompositeAttributeProvider::provide_attributes(const Message& message) const {
    Attributes merged;
    for (const auto& provider : providers_) {
        try {
            for (auto& [key, value] : provider->provide_attributes(message)) {
                if (value) {
                    merged.insert_or_assign(key, std::move(*value));
                }
            }
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->warn("attribute provider '{}' failed for message {}: {}",
                              provider->name(), message.identifier, e.what());
            }
        } catch (...) {
            if (logger_) {
                logger_->warn("attribute provider '{}' failed for message {} with a non-standard exception",
                              provider->name(), message.identifier);
            }
        }
    }
    return merged;
}

}  // namespace msgtrace::core::tracing
