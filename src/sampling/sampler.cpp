#include "msgtrace/core/sampling/sampler.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include "msgtrace/core/errors.hpp"

namespace msgtrace::core::sampling {

ProbabilitySampler::ProbabilitySampler(double rate)
    : ProbabilitySampler(rate, std::random_device{}()) {
}

ProbabilitySampler::ProbabilitySampler(double rate, std::uint64_t seed)
    : rate_(rate), engine_(seed) {
    if (!(rate >= 0.0 && rate <= 1.0)) {
        throw ConfigurationError(fmt::format("sampling rate must be within [0, 1], got {}", rate));
    }
}

bool ProbabilitySampler::should_sample(const tracing::TraceId&, std::string_view) {
    if (rate_ >= 1.0) {
        return true;
    }
    if (rate_ <= 0.0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return distribution_(engine_) < rate_;
}

std::string ProbabilitySampler::description() const {
    return fmt::format("Probability{{rate={}}}", rate_);
}

RateLimitingSampler::RateLimitingSampler(double traces_per_second)
    : RateLimitingSampler(traces_per_second, std::max(1.0, traces_per_second)) {
}

RateLimitingSampler::RateLimitingSampler(double traces_per_second, double burst)
    : traces_per_second_(traces_per_second),
      burst_(burst),
      tokens_(burst),
      last_refill_time_(Clock::now()) {
    if (!(traces_per_second > 0.0)) {
        throw ConfigurationError(fmt::format("traces_per_second must be positive, got {}", traces_per_second));
    }
    if (!(burst >= 1.0)) {
        throw ConfigurationError(fmt::format("sampling burst must be at least 1, got {}", burst));
    }
}

bool RateLimitingSampler::should_sample(const tracing::TraceId&, std::string_view) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
    }
    return false;
}

void RateLimitingSampler::update_limits(double traces_per_second, double burst) {
    if (!(traces_per_second > 0.0) || !(burst >= 1.0)) {
        throw ConfigurationError("rate limit must be positive with a burst of at least 1");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    traces_per_second_ = traces_per_second;
    burst_ = burst;
    tokens_ = std::min(tokens_, burst_);
}

void RateLimitingSampler::refill() {
    auto now = Clock::now();
    auto elapsed = std::chrono::duration<double>(now - last_refill_time_).count();
    tokens_ = std::min(burst_, tokens_ + elapsed * traces_per_second_);
    last_refill_time_ = now;
}

std::string RateLimitingSampler::description() const {
    return fmt::format("RateLimiting{{traces_per_second={}, burst={}}}", traces_per_second_, burst_);
}

CompositeSampler::CompositeSampler(std::vector<SamplerPtr> samplers, config::CombineStrategy strategy)
    : samplers_(std::move(samplers)), strategy_(strategy) {
    samplers_.erase(std::remove(samplers_.begin(), samplers_.end(), nullptr), samplers_.end());
    if (samplers_.empty()) {
        throw std::invalid_argument("CompositeSampler requires at least one sampler");
    }
}

bool CompositeSampler::should_sample(const tracing::TraceId& trace_id, std::string_view span_name) {
    if (strategy_ == config::CombineStrategy::And) {
        return std::all_of(samplers_.begin(), samplers_.end(),
                           [&](const SamplerPtr& sampler) { return sampler->should_sample(trace_id, span_name); });
    }
    return std::any_of(samplers_.begin(), samplers_.end(),
                       [&](const SamplerPtr& sampler) { return sampler->should_sample(trace_id, span_name); });
}

std::string CompositeSampler::description() const {
    std::vector<std::string> parts;
    parts.reserve(samplers_.size());
    for (const auto& sampler : samplers_) {
        parts.push_back(sampler->description());
    }
    const char* op = strategy_ == config::CombineStrategy::And ? "And" : "Or";
    return fmt::format("{}[{}]", op, fmt::join(parts, ", "));
}

SamplerPtr create_sampler(const config::TracingConfiguration& config) {
    SamplerPtr probability;
    if (config.sample_rate == 1.0) {
        probability = std::make_shared<AlwaysOnSampler>();
    } else if (config.sample_rate == 0.0) {
        probability = std::make_shared<AlwaysOffSampler>();
    } else {
        probability = std::make_shared<ProbabilitySampler>(config.sample_rate);
    }

    if (!config.traces_per_second) {
        return probability;
    }

    double rate = *config.traces_per_second;
    double burst = config.rate_limit_burst.value_or(std::max(1.0, rate));
    auto limiter = std::make_shared<RateLimitingSampler>(rate, burst);
    return std::make_shared<CompositeSampler>(std::vector<SamplerPtr>{probability, limiter},
                                              config.combine_strategy);
}

}  // namespace msgtrace::core::sampling
