#pragma once

#include <cstdint>
#include <mutex>
#include <random>

#include "msgtrace/core/tracing/trace_context.hpp"

namespace msgtrace::core::tracing {

/**
 * @brief Source of trace and span ids. Implementations never return a zero id.
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    virtual TraceId generate_trace_id() = 0;
    virtual SpanId generate_span_id() = 0;
};

/**
 * @brief mt19937_64 seeded from std::random_device. Thread-safe.
 */
class RandomIdGenerator : public IdGenerator {
public:
    RandomIdGenerator();
    // Deterministic sequence, for tests.
    explicit RandomIdGenerator(std::uint64_t seed);

    TraceId generate_trace_id() override;
    SpanId generate_span_id() override;

private:
    std::uint64_t next_non_zero();

    std::mutex mutex_;
    std::mt19937_64 engine_;
};

}  // namespace msgtrace::core::tracing
