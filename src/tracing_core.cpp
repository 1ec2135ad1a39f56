#include "msgtrace/core/tracing_core.hpp"

#include <exception>
#include <utility>

namespace msgtrace::core {

TracingCore::TracingCore(TracingCoreOptions options)
    : config_(std::move(options.config)), logger_(std::move(options.logger)) {
    config_.validate();

    std::vector<exporting::SpanFilterPtr> filters;
    filters.push_back(std::make_shared<exporting::ConfigurationSpanFilter>(config_));
    for (auto& filter : options.extra_filters) {
        filters.push_back(std::move(filter));
    }
    auto filter = std::make_shared<exporting::CompositeSpanFilter>(std::move(filters));

    processor_ = std::make_shared<exporting::ExportingSpanProcessor>(
        std::move(options.exporter), config_.export_queue_capacity, std::move(filter), logger_);

    sampling::SamplerPtr sampler = std::move(options.sampler);
    if (!sampler) {
        // A disabled core starts no spans, so its sampling settings are ignored.
        sampler = config_.enabled ? sampling::create_sampler(config_)
                                  : std::make_shared<sampling::AlwaysOffSampler>();
    }
    tracer_ = std::make_shared<tracing::Tracer>(std::move(options.id_generator), sampler, processor_, logger_);

    span_factory_ = std::make_shared<tracing::SpanFactory>(
        tracer_, config_,
        tracing::CompositeAttributeProvider{std::move(options.attribute_providers), logger_},
        logger_);
    correlator_ = std::make_shared<error::ErrorCorrelator>(std::move(options.error_reporter), logger_);
    interceptor_ = std::make_unique<tracing::TracingInterceptor>(span_factory_, correlator_, logger_);

    if (logger_) {
        logger_->info("tracing core ready: enabled={}, sampler={}, queue capacity={}",
                      config_.enabled, sampler->description(), config_.export_queue_capacity);
    }
}

TracingCore::~TracingCore() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error("tracing core shutdown failed: {}", e.what());
        }
    }
}

std::size_t TracingCore::flush() {
    return processor_->flush();
}

void TracingCore::shutdown() {
    processor_->shutdown();
}

}  // namespace msgtrace::core
