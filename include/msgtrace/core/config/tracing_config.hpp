#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "msgtrace/core/tracing/message.hpp"

namespace msgtrace::core::config {

class Configuration;

enum class CombineStrategy { And, Or };

/**
 * @brief Settings of the tracing core.
 *
 * Loaded from the [tracing], [tracing.sampling] and [tracing.export] tables:
 *
 *   [tracing]
 *   enabled = true
 *   trace_events = false
 *   capture_command_payloads = true
 *   max_payload_length = 1000
 *
 *   [tracing.sampling]
 *   rate = 0.25
 *   traces_per_second = 50
 *   strategy = "and"
 *
 *   [tracing.export]
 *   queue_capacity = 2048
 */
struct TracingConfiguration {
    bool enabled{true};

    bool trace_commands{true};
    bool trace_events{true};
    bool trace_queries{true};

    bool capture_command_payloads{false};
    bool capture_event_payloads{false};
    bool capture_query_payloads{false};
    std::size_t max_payload_length{1000};
    bool capture_metadata{false};

    double sample_rate{1.0};
    std::optional<double> traces_per_second;
    std::optional<double> rate_limit_burst;
    CombineStrategy combine_strategy{CombineStrategy::And};

    std::size_t export_queue_capacity{2048};

    std::string service_name{"msgtrace"};
    std::string environment{"development"};

    [[nodiscard]] bool traces(tracing::MessageKind kind) const noexcept;
    [[nodiscard]] bool captures_payload(tracing::MessageKind kind) const noexcept;

    // Missing keys keep their defaults. Throws ConfigurationError on unparsable values.
    static TracingConfiguration from_config(const Configuration& config);

    // Throws ConfigurationError when tracing is enabled and a setting is out of range.
    void validate() const;
};

[[nodiscard]] std::optional<CombineStrategy> combine_strategy_from_string(const std::string& text);

}  // namespace msgtrace::core::config
