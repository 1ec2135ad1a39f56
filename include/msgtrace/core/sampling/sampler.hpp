#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "msgtrace/core/config/tracing_config.hpp"
#include "msgtrace/core/tracing/trace_context.hpp"

namespace msgtrace::core::sampling {

/**
 * @brief Head-sampling decision. Consulted once, when a trace's root span is created.
 */
class Sampler {
public:
    virtual ~Sampler() = default;

    virtual bool should_sample(const tracing::TraceId& trace_id, std::string_view span_name) = 0;
    [[nodiscard]] virtual std::string description() const = 0;
};

using SamplerPtr = std::shared_ptr<Sampler>;

class AlwaysOnSampler : public Sampler {
public:
    bool should_sample(const tracing::TraceId&, std::string_view) override { return true; }
    [[nodiscard]] std::string description() const override { return "AlwaysOn"; }
};

class AlwaysOffSampler : public Sampler {
public:
    bool should_sample(const tracing::TraceId&, std::string_view) override { return false; }
    [[nodiscard]] std::string description() const override { return "AlwaysOff"; }
};

/**
 * @brief Samples a uniform random fraction of traces.
 *
 * Rate 0 never samples, rate 1 always samples. Throws ConfigurationError when
 * the rate is outside [0, 1].
 */
class ProbabilitySampler : public Sampler {
public:
    explicit ProbabilitySampler(double rate);
    ProbabilitySampler(double rate, std::uint64_t seed);

    bool should_sample(const tracing::TraceId& trace_id, std::string_view span_name) override;
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] double rate() const noexcept { return rate_; }

private:
    double rate_;
    std::mutex mutex_;
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> distribution_{0.0, 1.0};
};

/**
 * @brief Token bucket over traces: at most `traces_per_second` on average,
 * with up to `burst` admitted back to back. The bucket starts full.
 */
class RateLimitingSampler : public Sampler {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimitingSampler(double traces_per_second);
    RateLimitingSampler(double traces_per_second, double burst);

    bool should_sample(const tracing::TraceId& trace_id, std::string_view span_name) override;
    [[nodiscard]] std::string description() const override;

    void update_limits(double traces_per_second, double burst);

private:
    void refill();

    double traces_per_second_;
    double burst_;
    double tokens_;
    Clock::time_point last_refill_time_;
    std::mutex mutex_;
};

/**
 * @brief AND / OR over child samplers. Needs at least one child.
 *
 * AND stops at the first rejection, OR at the first acceptance, so later
 * children (a rate limiter, typically) only spend budget when consulted.
 */
class CompositeSampler : public Sampler {
public:
    CompositeSampler(std::vector<SamplerPtr> samplers, config::CombineStrategy strategy);

    bool should_sample(const tracing::TraceId& trace_id, std::string_view span_name) override;
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] config::CombineStrategy strategy() const noexcept { return strategy_; }

private:
    std::vector<SamplerPtr> samplers_;
    config::CombineStrategy strategy_;
};

/**
 * @brief Sampler described by the configuration.
 *
 * Rate 1 without a rate limit is AlwaysOn, rate 0 is AlwaysOff; with a
 * traces-per-second limit the probability sampler and the limiter are combined
 * under the configured strategy.
 */
SamplerPtr create_sampler(const config::TracingConfiguration& config);

}  // namespace msgtrace::core::sampling
