#include "msgtrace/core/config/tracing_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "msgtrace/core/config/configuration.hpp"
#include "msgtrace/core/errors.hpp"

namespace msgtrace::core::config {
namespace {

bool read_bool(const Configuration& config, const std::string& key, bool fallback) {
    if (!config.contains(key)) {
        return fallback;
    }
    auto raw = Configuration::strip_quotes(Configuration::trim(config.get_string(key)));
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (raw == "true" || raw == "1") return true;
    if (raw == "false" || raw == "0") return false;
    throw ConfigurationError(key + " is not a boolean: '" + raw + "'");
}

double read_double(const Configuration& config, const std::string& key) {
    auto value = config.find_double(key);
    if (!value) {
        throw ConfigurationError(key + " is not a number: '" + config.get_string(key) + "'");
    }
    return *value;
}

std::size_t read_size(const Configuration& config, const std::string& key, std::size_t fallback) {
    if (!config.contains(key)) {
        return fallback;
    }
    auto text = Configuration::strip_quotes(Configuration::trim(config.get_string(key)));
    long long value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        throw ConfigurationError(key + " is not an integer: '" + text + "'");
    }
    if (value < 0) {
        throw ConfigurationError(key + " must not be negative");
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

bool TracingConfiguration::traces(tracing::MessageKind kind) const noexcept {
    if (!enabled) {
        return false;
    }
    switch (kind) {
        case tracing::MessageKind::Command: return trace_commands;
        case tracing::MessageKind::Query:   return trace_queries;
        case tracing::MessageKind::Event:   return trace_events;
    }
    return false;
}

bool TracingConfiguration::captures_payload(tracing::MessageKind kind) const noexcept {
    switch (kind) {
        case tracing::MessageKind::Command: return capture_command_payloads;
        case tracing::MessageKind::Query:   return capture_query_payloads;
        case tracing::MessageKind::Event:   return capture_event_payloads;
    }
    return false;
}

std::optional<CombineStrategy> combine_strategy_from_string(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "and" || lower == "all") return CombineStrategy::And;
    if (lower == "or" || lower == "any") return CombineStrategy::Or;
    return std::nullopt;
}

TracingConfiguration TracingConfiguration::from_config(const Configuration& config) {
    TracingConfiguration result;

    result.enabled = read_bool(config, "tracing.enabled", result.enabled);
    result.trace_commands = read_bool(config, "tracing.trace_commands", result.trace_commands);
    result.trace_events = read_bool(config, "tracing.trace_events", result.trace_events);
    result.trace_queries = read_bool(config, "tracing.trace_queries", result.trace_queries);

    result.capture_command_payloads =
        read_bool(config, "tracing.capture_command_payloads", result.capture_command_payloads);
    result.capture_event_payloads =
        read_bool(config, "tracing.capture_event_payloads", result.capture_event_payloads);
    result.capture_query_payloads =
        read_bool(config, "tracing.capture_query_payloads", result.capture_query_payloads);
    result.max_payload_length = read_size(config, "tracing.max_payload_length", result.max_payload_length);
    result.capture_metadata = read_bool(config, "tracing.capture_metadata", result.capture_metadata);

    if (config.contains("tracing.service_name")) {
        result.service_name = config.get_string("tracing.service_name");
    }
    if (config.contains("tracing.environment")) {
        result.environment = config.get_string("tracing.environment");
    }

    if (config.contains("tracing.sampling.rate")) {
        result.sample_rate = read_double(config, "tracing.sampling.rate");
    }
    if (config.contains("tracing.sampling.traces_per_second")) {
        result.traces_per_second = read_double(config, "tracing.sampling.traces_per_second");
    }
    if (config.contains("tracing.sampling.burst")) {
        result.rate_limit_burst = read_double(config, "tracing.sampling.burst");
    }
    if (config.contains("tracing.sampling.strategy")) {
        auto raw = config.get_string("tracing.sampling.strategy");
        auto strategy = combine_strategy_from_string(raw);
        if (!strategy) {
            throw ConfigurationError("tracing.sampling.strategy must be 'and' or 'or', got '" + raw + "'");
        }
        result.combine_strategy = *strategy;
    }

    result.export_queue_capacity =
        read_size(config, "tracing.export.queue_capacity", result.export_queue_capacity);

    return result;
}

void TracingConfiguration::validate() const {
    if (!enabled) {
        return;
    }
    if (!(sample_rate >= 0.0 && sample_rate <= 1.0)) {
        throw ConfigurationError("sampling rate must be within [0, 1], got " + std::to_string(sample_rate));
    }
    if (traces_per_second && !(*traces_per_second > 0.0)) {
        throw ConfigurationError("traces_per_second must be positive, got " + std::to_string(*traces_per_second));
    }
    if (rate_limit_burst && !(*rate_limit_burst >= 1.0)) {
        throw ConfigurationError("sampling burst must be at least 1");
    }
    if (export_queue_capacity == 0) {
        throw ConfigurationError("export queue capacity must be positive");
    }
    if (max_payload_length == 0) {
        throw ConfigurationError("max_payload_length must be positive");
    }
}

}  // namespace msgtrace::core::config
