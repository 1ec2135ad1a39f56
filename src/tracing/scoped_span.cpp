#include "msgtrace/core/tracing/scoped_span.hpp"

#include <cstdint>
#include <exception>
#include <utility>

#include "msgtrace/core/errors.hpp"
#include "msgtrace/core/tracing/result_enricher.hpp"

namespace msgtrace::core::tracing {

bool is_cancellation(const std::exception_ptr& failure) {
    if (!failure) {
        return false;
    }
    try {
        std::rethrow_exception(failure);
    } catch (const OperationCancelled&) {
        return true;
    } catch (...) {
        return false;
    }
}

ScopedSpan::ScopedSpan(SpanPtr span, std::shared_ptr<const Message> message,
                       std::shared_ptr<error::ErrorCorrelator> correlator, bool report_errors,
                       logging::LoggerPtr logger)
    : span_(std::move(span)),
      message_(std::move(message)),
      correlator_(std::move(correlator)),
      report_errors_(report_errors),
      logger_(std::move(logger)) {
}

ScopedSpan::~ScopedSpan() {
    abandon();
}

ScopedSpan& ScopedSpan::operator=(ScopedSpan&& other) noexcept {
    if (this != &other) {
        abandon();
        span_ = std::move(other.span_);
        message_ = std::move(other.message_);
        correlator_ = std::move(other.correlator_);
        report_errors_ = other.report_errors_;
        logger_ = std::move(other.logger_);
    }
    return *this;
}

bool ScopedSpan::is_open() const {
    return span_ && !span_->is_ended();
}

std::optional<TraceContext> ScopedSpan::context() const {
    if (!span_) {
        return std::nullopt;
    }
    return span_->context();
}

ContextScope ScopedSpan::activate(ExecutionContext& execution) const {
    if (!span_) {
        return ContextScope{};
    }
    return ContextScope{execution, span_->context()};
}

void ScopedSpan::complete(const std::any& result) {
    if (!is_open()) {
        return;
    }
    if (message_) {
        try {
            enrich_with_result(*span_, message_->kind, result);
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->warn("result of '{}' not recorded: {}", span_->name(), e.what());
            }
        }
    }
    close(StatusCode::Ok, {});
}

void ScopedSpan::fail(const std::exception_ptr& failure) {
    if (!is_open()) {
        return;
    }
    const auto details = error::describe(failure);
    if (is_cancellation(failure)) {
        cancel(details.message);
        return;
    }
    if (report_errors_ && correlator_) {
        correlator_->record_exception(*span_, failure, message_.get());
    } else {
        error::ErrorCorrelator::annotate(*span_, details);
    }
    close(StatusCode::Error, details.message.empty() ? "Error" : details.message);
}

void ScopedSpan::cancel(const std::string& reason) {
    if (!is_open()) {
        return;
    }
    close(StatusCode::Cancelled, reason);
}

void ScopedSpan::abandon() noexcept {
    try {
        cancel();
    } catch (const std::exception& e) {
        // The span leaves with whatever was recorded before the failure.
        try {
            span_->end();
            if (logger_) {
                logger_->warn("span '{}' dropped while open was not closed cleanly: {}", span_->name(), e.what());
            }
        } catch (const std::exception&) {
            // Runs from a destructor: there is no caller left to report to.
        }
    }
}

void ScopedSpan::close(StatusCode status, const std::string& description) {
    if (message_) {
        span_->set_attribute(std::string(to_string(message_->kind)) + ".duration_ns",
                             static_cast<std::int64_t>(span_->elapsed().count()));
    }
    span_->set_status(status, description);
    span_->end();
}

}  // namespace msgtrace::core::tracing
