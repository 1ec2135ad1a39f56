#include "msgtrace/core/tracing/tracer.hpp"

#include <utility>

namespace msgtrace::core::tracing {

Tracer::Tracer(std::shared_ptr<IdGenerator> id_generator,
               sampling::SamplerPtr sampler,
               std::shared_ptr<SpanProcessor> processor,
               logging::LoggerPtr logger)
    : id_generator_(std::move(id_generator)),
      sampler_(std::move(sampler)),
      processor_(std::move(processor)),
      logger_(std::move(logger)) {
    if (!id_generator_) {
        id_generator_ = std::make_shared<RandomIdGenerator>();
    }
    if (!sampler_) {
        sampler_ = std::make_shared<sampling::AlwaysOnSampler>();
    }
}

SpanPtr Tracer::start_span(std::string name, SpanKind kind, const std::optional<TraceContext>& parent) {
    const SpanId span_id = id_generator_->generate_span_id();

    if (parent) {
        TraceContext context{parent->trace_id(), span_id, parent->sampled(),
                             parent->baggage(), parent->trace_state()};
        return std::make_shared<Span>(std::move(name), kind, std::move(context),
                                      parent->span_id(), processor_);
    }

    const TraceId trace_id = id_generator_->generate_trace_id();
    const bool sampled = sampler_->should_sample(trace_id, name);
    if (logger_) {
        logger_->trace("new trace {} for '{}' (sampled={})", trace_id.to_hex(), name, sampled);
    }
    return std::make_shared<Span>(std::move(name), kind, TraceContext{trace_id, span_id, sampled},
                                  std::nullopt, processor_);
}

}  // namespace msgtrace::core::tracing
