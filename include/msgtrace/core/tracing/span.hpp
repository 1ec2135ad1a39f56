#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "msgtrace/core/tracing/attributes.hpp"
#include "msgtrace/core/tracing/trace_context.hpp"

namespace msgtrace::core::tracing {

enum class SpanKind { Internal, Client, Server, Producer, Consumer };

enum class StatusCode { Unset, Ok, Error, Cancelled };

[[nodiscard]] std::string_view to_string(SpanKind kind) noexcept;
[[nodiscard]] std::string_view to_string(StatusCode code) noexcept;

struct ExceptionEvent {
    std::string type;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

class Span;

/**
 * @brief Receives every span exactly once, right after it ends.
 */
class SpanProcessor {
public:
    virtual ~SpanProcessor() = default;
    virtual void on_end(const std::shared_ptr<const Span>& span) noexcept = 0;
};

/**
 * @brief Mutable span record with a single end-of-life transition.
 *
 * Created -> active -> ended. After end() every mutator is a no-op and the
 * recorded data is frozen, so readers may hold references into it.
 * Mutators and end() are serialized by an internal mutex.
 */
class Span : public std::enable_shared_from_this<Span> {
public:
    using Clock = std::chrono::system_clock;

    Span(std::string name, SpanKind kind, TraceContext context,
         std::optional<SpanId> parent_span_id, std::shared_ptr<SpanProcessor> processor = nullptr);

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] SpanKind kind() const noexcept { return kind_; }
    [[nodiscard]] const TraceContext& context() const noexcept { return context_; }
    [[nodiscard]] const TraceId& trace_id() const noexcept { return context_.trace_id(); }
    [[nodiscard]] const SpanId& span_id() const noexcept { return context_.span_id(); }
    [[nodiscard]] const std::optional<SpanId>& parent_span_id() const noexcept { return parent_span_id_; }
    [[nodiscard]] bool sampled() const noexcept { return context_.sampled(); }

    void set_attribute(const std::string& key, AttributeValue value);
    void set_attributes(const Attributes& attributes);
    void set_status(StatusCode code, std::string description = {});
    void add_exception(ExceptionEvent event);

    // Returns true only for the call that actually ended the span.
    bool end();

    [[nodiscard]] bool is_ended() const;
    [[nodiscard]] const Attributes& attributes() const noexcept { return attributes_; }
    [[nodiscard]] std::optional<AttributeValue> attribute(const std::string& key) const;
    [[nodiscard]] StatusCode status() const;
    [[nodiscard]] const std::string& status_description() const noexcept { return status_description_; }
    [[nodiscard]] const std::vector<ExceptionEvent>& exceptions() const noexcept { return exceptions_; }
    [[nodiscard]] Clock::time_point start_time() const noexcept { return start_time_; }
    [[nodiscard]] std::optional<Clock::time_point> end_time() const;
    [[nodiscard]] std::chrono::nanoseconds elapsed() const;

private:
    const std::string name_;
    const SpanKind kind_;
    const TraceContext context_;
    const std::optional<SpanId> parent_span_id_;
    const std::shared_ptr<SpanProcessor> processor_;

    mutable std::mutex mutex_;
    bool ended_{false};
    Attributes attributes_;
    StatusCode status_{StatusCode::Unset};
    std::string status_description_;
    std::vector<ExceptionEvent> exceptions_;
    const Clock::time_point start_time_;
    const std::chrono::steady_clock::time_point start_steady_;
    std::optional<Clock::time_point> end_time_;
    std::chrono::nanoseconds duration_{0};
};

using SpanPtr = std::shared_ptr<Span>;

}  // namespace msgtrace::core::tracing
