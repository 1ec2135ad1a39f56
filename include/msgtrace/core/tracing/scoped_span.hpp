#pragma once

#include <any>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "msgtrace/core/error/error_correlator.hpp"
#include "msgtrace/core/logging/logger.hpp"
#include "msgtrace/core/tracing/context_scope.hpp"
#include "msgtrace/core/tracing/message.hpp"
#include "msgtrace/core/tracing/span.hpp"

namespace msgtrace::core::tracing {

/**
 * @brief Owns an open span until its outcome is known (RAII).
 *
 * complete(), fail() and cancel() close the span; only the first of them has
 * any effect. A ScopedSpan destroyed while its span is still open closes it as
 * Cancelled. Movable, so it can travel with a continuation to another thread.
 * A default-constructed ScopedSpan records nothing and every call is a no-op.
 */
class ScopedSpan {
public:
    ScopedSpan() = default;
    ScopedSpan(SpanPtr span, std::shared_ptr<const Message> message,
               std::shared_ptr<error::ErrorCorrelator> correlator, bool report_errors,
               logging::LoggerPtr logger = nullptr);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;
    ScopedSpan(ScopedSpan&& other) noexcept = default;
    ScopedSpan& operator=(ScopedSpan&& other) noexcept;

    // Status Ok, result attributes, duration. A result that cannot be recorded is logged
    // and the span still closes as Ok.
    void complete(const std::any& result = {});
    // Error status with the exception recorded; OperationCancelled closes as Cancelled instead.
    void fail(const std::exception_ptr& failure);
    void cancel(const std::string& reason = "cancelled");

    // Makes this span the active context of `execution` until the returned scope ends.
    [[nodiscard]] ContextScope activate(ExecutionContext& execution) const;

    [[nodiscard]] bool is_recording() const noexcept { return span_ != nullptr; }
    [[nodiscard]] bool is_open() const;
    [[nodiscard]] const SpanPtr& span() const noexcept { return span_; }
    [[nodiscard]] std::optional<TraceContext> context() const;

    Span* operator->() const noexcept { return span_.get(); }

private:
    void close(StatusCode status, const std::string& description);
    // cancel() for the destructor and move assignment: ends the span even if closing throws.
    void abandon() noexcept;

    SpanPtr span_;
    std::shared_ptr<const Message> message_;
    std::shared_ptr<error::ErrorCorrelator> correlator_;
    bool report_errors_{false};
    logging::LoggerPtr logger_;
};

/// Open dispatch span of a command or query, closed when the reply arrives.
using DispatchHandle = ScopedSpan;
/// Open handler span of an asynchronously completing handler.
using HandlerInvocation = ScopedSpan;

// True when `failure` holds an OperationCancelled.
[[nodiscard]] bool is_cancellation(const std::exception_ptr& failure);

}  // namespace msgtrace::core::tracing
