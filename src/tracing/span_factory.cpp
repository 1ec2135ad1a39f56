#include "msgtrace/core/tracing/span_factory.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "msgtrace/core/tracing/propagator.hpp"
#include "msgtrace/core/tracing/span_attributes.hpp"
#include "msgtrace/core/tracing/span_names.hpp"

namespace msgtrace::core::tracing {
namespace {

std::int64_t epoch_millis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::string metadata_json(const Carrier& metadata) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [key, value] : metadata) {
        if (!is_reserved_key(key)) {
            object[key] = value;
        }
    }
    return object.dump();
}

// Processor details only exist for events; the aggregate lifecycle for any handler.
void apply_handler_context(Attributes& attributes, const Message& message) {
    namespace keys = span_attributes;

    if (message.kind == MessageKind::Event && message.processing) {
        const auto& processing = *message.processing;
        if (!processing.processor_name.empty()) {
            attributes[keys::event_processor_name] = processing.processor_name;
        }
        if (!processing.processor_type.empty()) {
            attributes[keys::event_processor_type] = processing.processor_type;
        }
        if (processing.token_position) {
            attributes[keys::event_processor_token_position] = *processing.token_position;
        }
        attributes[keys::event_processor_is_replaying] = processing.replaying;
        if (!processing.handler_group.empty()) {
            attributes[keys::event_handler_group] = processing.handler_group;
        }
    }

    if (message.lifecycle) {
        if (message.aggregate) {
            attributes[keys::aggregate_type] = message.aggregate->type;
            attributes[keys::aggregate_id] = message.aggregate->identifier;
        }
        attributes[keys::aggregate_events_applied] = message.lifecycle->events_applied;
        attributes[keys::aggregate_is_creation] = message.lifecycle->creation;
    }
}

}  // namespace

SpanFactory::SpanFactory(std::shared_ptr<Tracer> tracer,
                         config::TracingConfiguration config,
                         CompositeAttributeProvider providers,
                         logging::LoggerPtr logger)
    : tracer_(std::move(tracer)),
      config_(std::move(config)),
      providers_(std::move(providers)),
      logger_(std::move(logger)) {
    if (!tracer_) {
        throw std::invalid_argument("SpanFactory requires a tracer");
    }
}

std::string SpanFactory::truncate(std::string_view value, std::size_t max_length) {
    if (value.size() <= max_length) {
        return std::string(value);
    }
    std::string truncated(value.substr(0, max_length));
    truncated.append("...");
    return truncated;
}

SpanPtr SpanFactory::create_dispatch_span(const Message& message, const std::optional<TraceContext>& parent) {
    const auto name = extract_message_name(message);
    auto span = tracer_->start_span(dispatch_span_name(message.kind, name),
                                    dispatch_span_kind(message.kind), parent);
    apply_attributes(*span, message, true);
    return span;
}

SpanPtr SpanFactory::create_handler_span(const Message& message, std::string_view handler_id,
                                         const std::optional<TraceContext>& parent) {
    const auto name = extract_message_name(message);
    auto span = tracer_->start_span(handler_span_name(name), handler_span_kind(message.kind), parent);
    apply_attributes(*span, message, false);
    if (!handler_id.empty()) {
        span->set_attribute(span_attributes::handler, std::string(handler_id));
    }
    return span;
}

void SpanFactory::apply_attributes(Span& span, const Message& message, bool dispatch) const {
    if (!providers_.empty()) {
        span.set_attributes(providers_.provide_attributes(message));
    }
    apply_standard_attributes(span, message, dispatch);
}

void SpanFactory::apply_standard_attributes(Span& span, const Message& message, bool dispatch) const {
    namespace keys = span_attributes;

    const auto name = extract_message_name(message);

    Attributes attributes;
    attributes[keys::messaging_system] = std::string(keys::messaging_system_name);
    attributes[keys::messaging_operation] = std::string(dispatch ? keys::operation_send : keys::operation_process);
    attributes[keys::messaging_destination] = name;
    attributes[keys::message_type] = std::string(to_string(message.kind));
    attributes[keys::message_name] = name;
    if (!message.identifier.empty()) {
        attributes[keys::message_id] = message.identifier;
        attributes[keys::messaging_message_id] = message.identifier;
    }
    if (!message.payload_type.empty()) {
        attributes[keys::payload_type] = message.payload_type;
    }
    if (!config_.service_name.empty()) {
        attributes[keys::service_name] = config_.service_name;
    }
    if (!config_.environment.empty()) {
        attributes[keys::deployment_environment] = config_.environment;
    }

    switch (message.kind) {
        case MessageKind::Command:
            attributes[keys::command_name] = name;
            break;
        case MessageKind::Event:
            attributes[keys::event_type] = name;
            attributes[keys::event_timestamp] = epoch_millis(message.timestamp);
            if (message.aggregate) {
                attributes[keys::aggregate_type] = message.aggregate->type;
                attributes[keys::aggregate_id] = message.aggregate->identifier;
                attributes[keys::aggregate_sequence_number] = message.aggregate->sequence_number;
            }
            break;
        case MessageKind::Query:
            attributes[keys::query_name] = name;
            if (!message.response_type.empty()) {
                attributes[keys::query_response_type] = message.response_type;
            }
            break;
    }

    if (!dispatch) {
        apply_handler_context(attributes, message);
    }

    if (config_.captures_payload(message.kind) && !message.payload.empty()) {
        attributes[keys::payload] = truncate(message.payload, config_.max_payload_length);
    }
    if (config_.capture_metadata) {
        try {
            attributes[keys::metadata] = metadata_json(message.metadata);
        } catch (const nlohmann::json::exception& e) {
            if (logger_) {
                logger_->warn("metadata of message {} not captured: {}", message.identifier, e.what());
            }
        }
    }

    span.set_attributes(attributes);
}

}  // namespace msgtrace::core::tracing
