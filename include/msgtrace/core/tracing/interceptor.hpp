#pragma once

#include <any>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "msgtrace/core/error/error_correlator.hpp"
#include "msgtrace/core/logging/logger.hpp"
#include "msgtrace/core/tracing/context_scope.hpp"
#include "msgtrace/core/tracing/message.hpp"
#include "msgtrace/core/tracing/scoped_span.hpp"
#include "msgtrace/core/tracing/span_factory.hpp"

namespace msgtrace::core::tracing {

using HandlerResult = std::any;
using Handler = std::function<HandlerResult(const Message&, ExecutionContext&)>;
using Sender = std::function<HandlerResult(const Message&)>;

/// A message ready for the bus, plus the handle of its still-open dispatch span.
struct DispatchedMessage {
    Message message;
    DispatchHandle handle;
};

/**
 * @brief Wraps the dispatch and handling calls of the message bus.
 *
 * Dispatch side: a span per outgoing message, child of the active context,
 * injected into the message metadata. Events close their span right away;
 * commands and queries keep it open in the returned handle.
 *
 * Handling side: the parent comes from the message metadata (none means a new
 * trace), the handler span is active while the handler runs and is closed on
 * every exit path. Handler exceptions are recorded and re-thrown unchanged.
 *
 * Tracing failures never reach the caller: a span that cannot be created
 * leaves the message untraced.
 */
class TracingInterceptor {
public:
    TracingInterceptor(std::shared_ptr<SpanFactory> factory,
                       std::shared_ptr<error::ErrorCorrelator> correlator,
                       logging::LoggerPtr logger = nullptr);

    [[nodiscard]] bool is_traced(MessageKind kind) const noexcept;

    [[nodiscard]] std::vector<DispatchedMessage> wrap_dispatch(std::vector<Message> messages,
                                                               const ExecutionContext& execution);
    [[nodiscard]] DispatchedMessage wrap_dispatch(Message message, const ExecutionContext& execution);

    // Traces a synchronous send: the dispatch span closes with the reply or the exception.
    HandlerResult dispatch(Message message, const ExecutionContext& execution, const Sender& send);

    HandlerResult wrap_handler(const Message& message, ExecutionContext& execution, const Handler& next,
                               std::string_view handler_id = {});

    // Opens the handler span without running anything; see ScopedSpan for closing it.
    [[nodiscard]] HandlerInvocation begin_handler(const Message& message, std::string_view handler_id = {});

private:
    std::shared_ptr<SpanFactory> factory_;
    std::shared_ptr<error::ErrorCorrelator> correlator_;
    logging::LoggerPtr logger_;
};

}  // namespace msgtrace::core::tracing
