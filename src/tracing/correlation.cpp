#include "msgtrace/core/tracing/correlation.hpp"

#include <utility>

#include "msgtrace/core/tracing/propagator.hpp"

namespace msgtrace::core::tracing {
namespace {

std::optional<std::string> active_trace_id(const ExecutionContext& execution) {
    if (auto current = execution.current()) {
        return current->trace_id().to_hex();
    }
    return std::nullopt;
}

}  // namespace

std::string generate_uuid(IdGenerator& ids) {
    const std::string hex = ids.generate_trace_id().to_hex();
    std::string uuid;
    uuid.reserve(36);
    uuid.append(hex, 0, 8).push_back('-');
    uuid.append(hex, 8, 4).push_back('-');
    uuid.append(hex, 12, 4).push_back('-');
    uuid.append(hex, 16, 4).push_back('-');
    uuid.append(hex, 20, 12);
    return uuid;
}

Message with_correlation_id(Message message, const std::string& correlation_id) {
    message.metadata[correlation_id_key] = correlation_id;
    return message;
}

Message with_transaction_id(Message message, const std::string& transaction_id) {
    message.metadata[transaction_id_key] = transaction_id;
    return message;
}

Message with_correlation_context(Message message, const CorrelationContext& context) {
    if (context.correlation_id) {
        message.metadata[correlation_id_key] = *context.correlation_id;
    }
    if (context.transaction_id) {
        message.metadata[transaction_id_key] = *context.transaction_id;
    }
    return message;
}

CorrelationContext extract_correlation_context(const Message& message, const ExecutionContext& execution) {
    CorrelationContext context;
    context.correlation_id = message.metadata_value(correlation_id_key);
    context.transaction_id = message.metadata_value(transaction_id_key);

    if (auto parent = ContextPropagator::extract(message.metadata)) {
        context.trace_id = parent->trace_id().to_hex();
    } else {
        context.trace_id = active_trace_id(execution);
    }
    return context;
}

CorrelationContext generate_correlation_context(const ExecutionContext& execution, IdGenerator& ids,
                                                bool use_trace_id_as_transaction_id) {
    CorrelationContext context;
    context.correlation_id = generate_uuid(ids);
    context.trace_id = active_trace_id(execution);
    if (use_trace_id_as_transaction_id && context.trace_id) {
        context.transaction_id = context.trace_id;
    } else {
        context.transaction_id = generate_uuid(ids);
    }
    return context;
}

CorrelationContext create_child_correlation_context(const CorrelationContext& parent,
                                                    const ExecutionContext& execution,
                                                    IdGenerator& ids) {
    CorrelationContext child;
    child.correlation_id = generate_uuid(ids);
    child.transaction_id = parent.transaction_id ? parent.transaction_id : std::optional<std::string>{generate_uuid(ids)};
    child.trace_id = active_trace_id(execution);
    return child;
}

void link_span_to_correlation_context(Span& span, const Message& message) {
    if (auto correlation = message.metadata_value(correlation_id_key)) {
        span.set_attribute(correlation_id_attribute, std::move(*correlation));
    }
    if (auto transaction = message.metadata_value(transaction_id_key)) {
        span.set_attribute(transaction_id_attribute, std::move(*transaction));
    }
}

}  // namespace msgtrace::core::tracing
