#include "msgtrace/core/tracing/subscription_query.hpp"

#include <utility>

#include "msgtrace/core/tracing/result_enricher.hpp"
#include "msgtrace/core/tracing/span_attributes.hpp"

namespace msgtrace::core::tracing {

namespace keys = span_attributes;

SubscriptionQueryTracker::SubscriptionQueryTracker(ScopedSpan handle)
    : handle_(std::move(handle)), started_(std::chrono::steady_clock::now()) {
    if (handle_.is_open()) {
        handle_->set_attribute(keys::query_is_subscription, true);
    }
}

void SubscriptionQueryTracker::initial_result(const std::any& result) {
    initial_result_ = result;
    if (handle_.is_open()) {
        handle_->set_attribute(keys::query_initial_result_type, result_type_name(result));
    }
}

void SubscriptionQueryTracker::update(const std::any& update) {
    const auto count = ++updates_;
    if (!handle_.is_open()) {
        return;
    }
    handle_->set_attribute(keys::query_update_count, count);
    if (update.has_value()) {
        handle_->set_attribute(keys::query_update_type, result_type_name(update));
    }
}

void SubscriptionQueryTracker::complete() {
    stamp_closure(keys::query_subscription_completed);
    handle_.complete(initial_result_);
}

void SubscriptionQueryTracker::cancel(const std::string& reason) {
    stamp_closure(keys::query_subscription_cancelled);
    handle_.cancel(reason);
}

void SubscriptionQueryTracker::fail(const std::exception_ptr& failure) {
    stamp_closure(keys::query_subscription_error);
    handle_.fail(failure);
}

// Updates racing with closure may overwrite the count; the final value is written here.
void SubscriptionQueryTracker::stamp_closure(const char* outcome_key) {
    if (!handle_.is_open()) {
        return;
    }
    const auto elapsed = std::chrono::steady_clock::now() - started_;
    handle_->set_attribute(keys::query_update_count, updates_.load());
    handle_->set_attribute(keys::query_subscription_duration,
                           static_cast<std::int64_t>(
                               std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count()));
    handle_->set_attribute(outcome_key, true);
}

}  // namespace msgtrace::core::tracing
