#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "msgtrace/core/tracing/trace_context.hpp"

namespace msgtrace::core::tracing {

/**
 * @brief The active trace context of one logical execution flow.
 *
 * A stack of frames owned by the flow (a request, a task, a coroutine frame),
 * passed explicitly rather than kept in thread-local storage, so the active
 * context follows the work across threads and continuations. Not thread-safe:
 * one flow, one owner at a time.
 */
class ExecutionContext {
public:
    ExecutionContext() = default;
    // Starts a flow whose base frame is `root`, e.g. a context captured before a hop.
    explicit ExecutionContext(TraceContext root);

    [[nodiscard]] std::optional<TraceContext> current() const;
    [[nodiscard]] std::size_t depth() const noexcept { return frames_.size(); }

private:
    friend class ContextScope;

    std::vector<TraceContext> frames_;
};

/**
 * @brief Makes a trace context active for the lifetime of the scope.
 *
 * The destructor truncates the flow back to the depth it had on entry, on every
 * exit path. A default-constructed scope is inert.
 */
class ContextScope {
public:
    ContextScope() = default;
    ContextScope(ExecutionContext& execution, TraceContext active);
    ~ContextScope();

    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;
    ContextScope(ContextScope&& other) noexcept;
    ContextScope& operator=(ContextScope&& other) noexcept;

    [[nodiscard]] bool is_active() const noexcept { return execution_ != nullptr; }

private:
    void restore() noexcept;

    ExecutionContext* execution_{nullptr};
    std::size_t restore_depth_{0};
};

}  // namespace msgtrace::core::tracing
