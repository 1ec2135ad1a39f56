#include "msgtrace/core/tracing/interceptor.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "msgtrace/core/tracing/propagator.hpp"

namespace msgtrace::core::tracing {

TracingInterceptor::TracingInterceptor(std::shared_ptr<SpanFactory> factory,
                                       std::shared_ptr<error::ErrorCorrelator> correlator,
                                       logging::LoggerPtr logger)
    : factory_(std::move(factory)), correlator_(std::move(correlator)), logger_(std::move(logger)) {
    if (!factory_) {
        throw std::invalid_argument("TracingInterceptor requires a span factory");
    }
}

bool TracingInterceptor::is_traced(MessageKind kind) const noexcept {
    return factory_->config().traces(kind);
}

std::vector<DispatchedMessage> TracingInterceptor::wrap_dispatch(std::vector<Message> messages,
                                                                 const ExecutionContext& execution) {
    std::vector<DispatchedMessage> dispatched;
    dispatched.reserve(messages.size());
    for (auto& message : messages) {
        dispatched.push_back(wrap_dispatch(std::move(message), execution));
    }
    return dispatched;
}

DispatchedMessage TracingInterceptor::wrap_dispatch(Message message, const ExecutionContext& execution) {
    if (!is_traced(message.kind)) {
        return {std::move(message), DispatchHandle{}};
    }

    SpanPtr span;
    try {
        span = factory_->create_dispatch_span(message, execution.current());
        ContextPropagator::inject(span->context(), message.metadata);
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->warn("dispatch of message {} left untraced: {}", message.identifier, e.what());
        }
        if (span) {
            span->end();
        }
        return {std::move(message), DispatchHandle{}};
    }

    auto snapshot = std::make_shared<const Message>(message);
    DispatchHandle handle{std::move(span), std::move(snapshot), correlator_, false, logger_};
    if (message.kind == MessageKind::Event) {
        // Fire-and-forget: nothing will report back.
        handle->end();
    }
    return {std::move(message), std::move(handle)};
}

HandlerResult TracingInterceptor::dispatch(Message message, const ExecutionContext& execution, const Sender& send) {
    auto dispatched = wrap_dispatch(std::move(message), execution);
    HandlerResult result;
    try {
        result = send(dispatched.message);
    } catch (...) {
        dispatched.handle.fail(std::current_exception());
        throw;
    }
    dispatched.handle.complete(result);
    return result;
}

HandlerInvocation TracingInterceptor::begin_handler(const Message& message, std::string_view handler_id) {
    if (!is_traced(message.kind)) {
        return HandlerInvocation{};
    }
    try {
        auto parent = ContextPropagator::extract(message.metadata);
        auto span = factory_->create_handler_span(message, handler_id, parent);
        return HandlerInvocation{std::move(span), std::make_shared<const Message>(message), correlator_, true,
                                 logger_};
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->warn("handling of message {} left untraced: {}", message.identifier, e.what());
        }
        return HandlerInvocation{};
    }
}

HandlerResult TracingInterceptor::wrap_handler(const Message& message, ExecutionContext& execution,
                                               const Handler& next, std::string_view handler_id) {
    auto invocation = begin_handler(message, handler_id);
    auto scope = invocation.activate(execution);
    HandlerResult result;
    try {
        result = next(message, execution);
    } catch (...) {
        invocation.fail(std::current_exception());
        throw;
    }
    invocation.complete(result);
    return result;
}

}  // namespace msgtrace::core::tracing
