#pragma once

#include <memory>
#include <vector>

#include "msgtrace/core/config/tracing_config.hpp"
#include "msgtrace/core/error/error_correlator.hpp"
#include "msgtrace/core/error/error_reporter.hpp"
#include "msgtrace/core/exporting/span_exporter.hpp"
#include "msgtrace/core/exporting/span_filter.hpp"
#include "msgtrace/core/exporting/span_processor.hpp"
#include "msgtrace/core/logging/logger.hpp"
#include "msgtrace/core/sampling/sampler.hpp"
#include "msgtrace/core/tracing/attribute_provider.hpp"
#include "msgtrace/core/tracing/id_generator.hpp"
#include "msgtrace/core/tracing/interceptor.hpp"
#include "msgtrace/core/tracing/span_factory.hpp"
#include "msgtrace/core/tracing/tracer.hpp"

namespace msgtrace::core {

/**
 * @brief Collaborators of a TracingCore. Only `config` is required.
 *
 * Left empty: spans are dropped at export, errors are not forwarded, the
 * sampler comes from the configuration and ids from a RandomIdGenerator.
 */
struct TracingCoreOptions {
    config::TracingConfiguration config{};
    exporting::SpanExporterPtr exporter{};
    error::ErrorReporterPtr error_reporter{};
    std::vector<tracing::AttributeProviderPtr> attribute_providers{};
    std::vector<exporting::SpanFilterPtr> extra_filters{};
    sampling::SamplerPtr sampler{};
    std::shared_ptr<tracing::IdGenerator> id_generator{};
    logging::LoggerPtr logger{};
};

/**
 * @brief The assembled tracing core: tracer, span factory, interceptor,
 * error correlator and export pipeline.
 *
 * Constructed explicitly and passed to whoever needs it; there is no global
 * instance. The constructor validates the configuration and throws
 * ConfigurationError.
 */
class TracingCore {
public:
    explicit TracingCore(TracingCoreOptions options);
    ~TracingCore();

    TracingCore(const TracingCore&) = delete;
    TracingCore& operator=(const TracingCore&) = delete;

    [[nodiscard]] tracing::TracingInterceptor& interceptor() noexcept { return *interceptor_; }
    [[nodiscard]] tracing::SpanFactory& span_factory() noexcept { return *span_factory_; }
    [[nodiscard]] tracing::Tracer& tracer() noexcept { return *tracer_; }
    [[nodiscard]] error::ErrorCorrelator& error_correlator() noexcept { return *correlator_; }
    [[nodiscard]] const exporting::ExportingSpanProcessor& processor() const noexcept { return *processor_; }
    [[nodiscard]] const config::TracingConfiguration& config() const noexcept { return config_; }

    // Moves queued spans to the exporter. Returns how many were exported.
    std::size_t flush();
    // Flushes and stops exporting. Safe to call more than once; also run by the destructor.
    void shutdown();

    [[nodiscard]] bool is_shutdown() const noexcept { return processor_->is_shutdown(); }
    [[nodiscard]] std::uint64_t dropped_spans() const noexcept { return processor_->queue().dropped(); }

private:
    config::TracingConfiguration config_;
    logging::LoggerPtr logger_;
    std::shared_ptr<exporting::ExportingSpanProcessor> processor_;
    std::shared_ptr<tracing::Tracer> tracer_;
    std::shared_ptr<tracing::SpanFactory> span_factory_;
    std::shared_ptr<error::ErrorCorrelator> correlator_;
    std::unique_ptr<tracing::TracingInterceptor> interceptor_;
};

}  // namespace msgtrace::core
