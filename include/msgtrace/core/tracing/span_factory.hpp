#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "msgtrace/core/config/tracing_config.hpp"
#include "msgtrace/core/logging/logger.hpp"
#include "msgtrace/core/tracing/attribute_provider.hpp"
#include "msgtrace/core/tracing/message.hpp"
#include "msgtrace/core/tracing/span.hpp"
#include "msgtrace/core/tracing/tracer.hpp"

namespace msgtrace::core::tracing {

/**
 * @brief Builds named, kinded and attributed spans for the two phases of a message.
 *
 * Provider attributes are applied first and the standard attributes after
 * them, so a provider cannot overwrite `message.type` or the other standard keys.
 */
class SpanFactory {
public:
    SpanFactory(std::shared_ptr<Tracer> tracer,
                config::TracingConfiguration config,
                CompositeAttributeProvider providers = CompositeAttributeProvider{},
                logging::LoggerPtr logger = nullptr);

    // "{Verb}: {name}", Client for commands and queries, Producer for events.
    [[nodiscard]] SpanPtr create_dispatch_span(const Message& message, const std::optional<TraceContext>& parent);

    // "Handle: {name}", Server for commands and queries, Consumer for events.
    [[nodiscard]] SpanPtr create_handler_span(const Message& message, std::string_view handler_id,
                                              const std::optional<TraceContext>& parent);

    [[nodiscard]] const config::TracingConfiguration& config() const noexcept { return config_; }

    // Cuts `value` to `max_length` characters and appends "..." when it was longer.
    [[nodiscard]] static std::string truncate(std::string_view value, std::size_t max_length);

private:
    void apply_attributes(Span& span, const Message& message, bool dispatch) const;
    void apply_standard_attributes(Span& span, const Message& message, bool dispatch) const;

    std::shared_ptr<Tracer> tracer_;
    config::TracingConfiguration config_;
    CompositeAttributeProvider providers_;
    logging::LoggerPtr logger_;
};

}  // namespace msgtrace::core::tracing
