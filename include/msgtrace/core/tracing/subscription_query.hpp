#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <string>

#include "msgtrace/core/tracing/scoped_span.hpp"

namespace msgtrace::core::tracing {

/**
 * @brief Follows a subscription query over the lifetime of its span.
 *
 * Takes over the query's DispatchHandle (or HandlerInvocation) and marks the
 * span with `query.is_subscription`. Every update bumps `query.update_count`
 * and records its type. complete(), cancel() and fail() stamp the outcome
 * and the subscription duration, then close the span through the handle.
 *
 * update() may be called from several threads. The tracker is neither
 * copyable nor movable; share it by pointer between update sources.
 */
class SubscriptionQueryTracker {
public:
    explicit SubscriptionQueryTracker(ScopedSpan handle);

    SubscriptionQueryTracker(const SubscriptionQueryTracker&) = delete;
    SubscriptionQueryTracker& operator=(const SubscriptionQueryTracker&) = delete;

    void initial_result(const std::any& result);
    void update(const std::any& update);

    void complete();
    void cancel(const std::string& reason = "subscription cancelled");
    void fail(const std::exception_ptr& failure);

    [[nodiscard]] std::int64_t update_count() const noexcept { return updates_.load(); }
    [[nodiscard]] const ScopedSpan& handle() const noexcept { return handle_; }

private:
    void stamp_closure(const char* outcome_key);

    ScopedSpan handle_;
    std::any initial_result_;
    std::atomic<std::int64_t> updates_{0};
    const std::chrono::steady_clock::time_point started_;
};

}  // namespace msgtrace::core::tracing
