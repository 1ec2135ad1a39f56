#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "msgtrace/core/logging/logger.hpp"
#include "msgtrace/core/tracing/attributes.hpp"
#include "msgtrace/core/tracing/message.hpp"

namespace msgtrace::core::tracing {

/// A provider's output. std::nullopt means "do not write this key".
using ProvidedAttributes = std::map<std::string, std::optional<AttributeValue>>;

/**
 * @brief Pluggable source of extra span attributes.
 *
 * Called for every dispatch and handler span. Implementations must be safe to
 * call concurrently. A provider that throws is logged and skipped.
 */
class AttributeProvider {
public:
    virtual ~AttributeProvider() = default;

    virtual ProvidedAttributes provide_attributes(const Message& message) = 0;

    // Higher priority is applied later and therefore wins on key conflicts.
    [[nodiscard]] virtual int priority() const noexcept { return 0; }
    [[nodiscard]] virtual std::string name() const { return "attribute-provider"; }
};

using AttributeProviderPtr = std::shared_ptr<AttributeProvider>;

/**
 * @brief Adapts a callable into a provider.
 */
class FunctionAttributeProvider : public AttributeProvider {
public:
    using Function = std::function<ProvidedAttributes(const Message&)>;

    FunctionAttributeProvider(std::string name, Function function, int priority = 0);

    ProvidedAttributes provide_attributes(const Message& message) override;
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] std::string name() const override { return name_; }

private:
    std::string name_;
    Function function_;
    int priority_;
};

/**
 * @brief Runs providers in ascending priority order and merges their output.
 *
 * Ties keep registration order. Later writes overwrite earlier ones, so the
 * highest priority provider wins; an absent value leaves the key untouched.
 */
class CompositeAttributeProvider {
public:
    explicit CompositeAttributeProvider(std::vector<AttributeProviderPtr> providers = {},
                                        logging::LoggerPtr logger = nullptr);

    [[nodiscard]] Attributes provide_attributes(const Message& message) const;

    [[nodiscard]] std::size_t size() const noexcept { return providers_.size(); }
    [[nodiscard]] bool empty() const noexcept { return providers_.empty(); }

private:
    std::vector<AttributeProviderPtr> providers_;
    logging::LoggerPtr logger_;
};

}  // namespace msgtrace::core::tracing
