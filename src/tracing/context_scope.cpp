#include "msgtrace/core/tracing/context_scope.hpp"

#include <utility>

namespace msgtrace::core::tracing {

ExecutionContext::ExecutionContext(TraceContext root) {
    frames_.push_back(std::move(root));
}

std::optional<TraceContext> ExecutionContext::current() const {
    if (frames_.empty()) {
        return std::nullopt;
    }
    return frames_.back();
}

ContextScope::ContextScope(ExecutionContext& execution, TraceContext active)
    : execution_(&execution), restore_depth_(execution.frames_.size()) {
    execution.frames_.push_back(std::move(active));
}

ContextScope::~ContextScope() {
    restore();
}

ContextScope::ContextScope(ContextScope&& other) noexcept
    : execution_(std::exchange(other.execution_, nullptr)),
      restore_depth_(other.restore_depth_) {
}

ContextScope& ContextScope::operator=(ContextScope&& other) noexcept {
    if (this != &other) {
        restore();
        execution_ = std::exchange(other.execution_, nullptr);
        restore_depth_ = other.restore_depth_;
    }
    return *this;
}

void ContextScope::restore() noexcept {
    if (!execution_) {
        return;
    }
    auto& frames = execution_->frames_;
    while (frames.size() > restore_depth_) {
        frames.pop_back();
    }
    execution_ = nullptr;
}

}  // namespace msgtrace::core::tracing
