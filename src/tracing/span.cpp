#include "msgtrace/core/tracing/span.hpp"

#include <utility>

namespace msgtrace::core::tracing {

std::string_view to_string(SpanKind kind) noexcept {
    switch (kind) {
        case SpanKind::Internal: return "internal";
        case SpanKind::Client:   return "client";
        case SpanKind::Server:   return "server";
        case SpanKind::Producer: return "producer";
        case SpanKind::Consumer: return "consumer";
    }
    return "internal";
}

std::string_view to_string(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Unset:     return "unset";
        case StatusCode::Ok:        return "ok";
        case StatusCode::Error:     return "error";
        case StatusCode::Cancelled: return "cancelled";
    }
    return "unset";
}

Span::Span(std::string name, SpanKind kind, TraceContext context,
           std::optional<SpanId> parent_span_id, std::shared_ptr<SpanProcessor> processor)
    : name_(std::move(name)),
      kind_(kind),
      context_(std::move(context)),
      parent_span_id_(parent_span_id),
      processor_(std::move(processor)),
      start_time_(Clock::now()),
      start_steady_(std::chrono::steady_clock::now()) {
}

void Span::set_attribute(const std::string& key, AttributeValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
        return;
    }
    attributes_.insert_or_assign(key, std::move(value));
}

void Span::set_attributes(const Attributes& attributes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
        return;
    }
    for (const auto& [key, value] : attributes) {
        attributes_.insert_or_assign(key, value);
    }
}

void Span::set_status(StatusCode code, std::string description) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
        return;
    }
    status_ = code;
    status_description_ = std::move(description);
}

void Span::add_exception(ExceptionEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
        return;
    }
    exceptions_.push_back(std::move(event));
}

bool Span::end() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ended_) {
            return false;
        }
        ended_ = true;
        end_time_ = Clock::now();
        duration_ = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start_steady_);
    }
    if (processor_) {
        processor_->on_end(shared_from_this());
    }
    return true;
}

bool Span::is_ended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ended_;
}

std::optional<AttributeValue> Span::attribute(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attributes_.find(key);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

StatusCode Span::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<Span::Clock::time_point> Span::end_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_time_;
}

std::chrono::nanoseconds Span::elapsed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
        return duration_;
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_steady_);
}

}  // namespace msgtrace::core::tracing
