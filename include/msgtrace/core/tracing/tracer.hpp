#pragma once

#include <memory>
#include <optional>
#include <string>

#include "msgtrace/core/logging/logger.hpp"
#include "msgtrace/core/sampling/sampler.hpp"
#include "msgtrace/core/tracing/id_generator.hpp"
#include "msgtrace/core/tracing/span.hpp"

namespace msgtrace::core::tracing {

/**
 * @brief Starts spans and links them into traces.
 *
 * With a parent the new span joins the parent's trace and inherits its sampled
 * flag, baggage and trace state. Without one a new trace is started and the
 * sampler decides, once, whether the whole trace is recorded.
 */
class Tracer {
public:
    Tracer(std::shared_ptr<IdGenerator> id_generator,
           sampling::SamplerPtr sampler,
           std::shared_ptr<SpanProcessor> processor,
           logging::LoggerPtr logger = nullptr);

    [[nodiscard]] SpanPtr start_span(std::string name, SpanKind kind,
                                     const std::optional<TraceContext>& parent);

    [[nodiscard]] const sampling::SamplerPtr& sampler() const noexcept { return sampler_; }

private:
    std::shared_ptr<IdGenerator> id_generator_;
    sampling::SamplerPtr sampler_;
    std::shared_ptr<SpanProcessor> processor_;
    logging::LoggerPtr logger_;
};

}  // namespace msgtrace::core::tracing
