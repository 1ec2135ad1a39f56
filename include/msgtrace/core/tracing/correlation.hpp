#pragma once

#include <optional>
#include <string>

#include "msgtrace/core/tracing/context_scope.hpp"
#include "msgtrace/core/tracing/id_generator.hpp"
#include "msgtrace/core/tracing/message.hpp"
#include "msgtrace/core/tracing/span.hpp"

namespace msgtrace::core::tracing {

inline constexpr const char* correlation_id_key = "msgtrace.correlation.id";
inline constexpr const char* transaction_id_key = "msgtrace.transaction.id";

inline constexpr const char* correlation_id_attribute = "correlation.id";
inline constexpr const char* transaction_id_attribute = "transaction.id";

/**
 * @brief Business-level identifiers carried next to the trace context.
 *
 * The correlation id names one logical operation across messages; the
 * transaction id groups the messages of one business transaction and defaults
 * to the trace id.
 */
struct CorrelationContext {
    std::optional<std::string> correlation_id;
    std::optional<std::string> transaction_id;
    std::optional<std::string> trace_id;

    [[nodiscard]] bool has_correlation() const noexcept { return correlation_id.has_value(); }
    [[nodiscard]] bool has_transaction() const noexcept { return transaction_id.has_value(); }
};

// 8-4-4-4-12 lower-case hex built from a fresh trace id.
[[nodiscard]] std::string generate_uuid(IdGenerator& ids);

[[nodiscard]] Message with_correlation_id(Message message, const std::string& correlation_id);
[[nodiscard]] Message with_transaction_id(Message message, const std::string& transaction_id);
// Writes whichever ids the context holds.
[[nodiscard]] Message with_correlation_context(Message message, const CorrelationContext& context);

/**
 * @brief Ids found on a message. The trace id comes from its traceparent when
 * that parses, else from the active context of `execution`.
 */
[[nodiscard]] CorrelationContext extract_correlation_context(const Message& message,
                                                             const ExecutionContext& execution = {});

/**
 * @brief Fresh correlation id; the transaction id is the active trace id when
 * there is one and `use_trace_id_as_transaction_id` is set, else a fresh id.
 */
[[nodiscard]] CorrelationContext generate_correlation_context(const ExecutionContext& execution, IdGenerator& ids,
                                                              bool use_trace_id_as_transaction_id = true);

// Fresh correlation id, same transaction as `parent`.
[[nodiscard]] CorrelationContext create_child_correlation_context(const CorrelationContext& parent,
                                                                  const ExecutionContext& execution,
                                                                  IdGenerator& ids);

// Copies the message's correlation and transaction ids onto the span.
void link_span_to_correlation_context(Span& span, const Message& message);

}  // namespace msgtrace::core::tracing
