#include "msgtrace/core/tracing/id_generator.hpp"

namespace msgtrace::core::tracing {

RandomIdGenerator::RandomIdGenerator() : engine_(std::random_device{}()) {}

RandomIdGenerator::RandomIdGenerator(std::uint64_t seed) : engine_(seed) {}

std::uint64_t RandomIdGenerator::next_non_zero() {
    std::uint64_t value = 0;
    while (value == 0) {
        value = engine_();
    }
    return value;
}

TraceId RandomIdGenerator::generate_trace_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    return TraceId{engine_(), next_non_zero()};
}

SpanId RandomIdGenerator::generate_span_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    return SpanId{next_non_zero()};
}

}  // namespace msgtrace::core::tracing
