#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "msgtrace/core/config/configuration.hpp"
#include "msgtrace/core/config/tracing_config.hpp"
#include "msgtrace/core/errors.hpp"

using msgtrace::core::ConfigurationError;
using msgtrace::core::config::CombineStrategy;
using msgtrace::core::config::Configuration;
using msgtrace::core::config::TracingConfiguration;
using msgtrace::core::tracing::MessageKind;

TEST_CASE("TracingConfiguration defaults", "[config][tracing]") {
    TracingConfiguration config;

    REQUIRE(config.enabled);
    REQUIRE(config.traces(MessageKind::Command));
    REQUIRE(config.traces(MessageKind::Query));
    REQUIRE(config.traces(MessageKind::Event));
    REQUIRE_FALSE(config.captures_payload(MessageKind::Command));
    REQUIRE(config.max_payload_length == 1000);
    REQUIRE(config.sample_rate == 1.0);
    REQUIRE_FALSE(config.traces_per_second.has_value());
    REQUIRE(config.combine_strategy == CombineStrategy::And);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("TracingConfiguration disabled traces nothing", "[config][tracing]") {
    TracingConfiguration config;
    config.enabled = false;

    REQUIRE_FALSE(config.traces(MessageKind::Command));
    REQUIRE_FALSE(config.traces(MessageKind::Query));
    REQUIRE_FALSE(config.traces(MessageKind::Event));

    // Out-of-range settings do not matter while disabled.
    config.sample_rate = 3.0;
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("TracingConfiguration from configuration", "[config][tracing]") {
    auto source = Configuration::load_from_string(R"(
[tracing]
enabled = true
trace_events = false
capture_command_payloads = true
max_payload_length = 64
capture_metadata = true
service_name = "billing"
environment = "staging"

[tracing.sampling]
rate = 0.25
traces_per_second = 50
burst = 10
strategy = "or"

[tracing.export]
queue_capacity = 16
)");

    auto config = TracingConfiguration::from_config(source);

    REQUIRE(config.traces(MessageKind::Command));
    REQUIRE_FALSE(config.traces(MessageKind::Event));
    REQUIRE(config.captures_payload(MessageKind::Command));
    REQUIRE_FALSE(config.captures_payload(MessageKind::Query));
    REQUIRE(config.max_payload_length == 64);
    REQUIRE(config.capture_metadata);
    REQUIRE(config.service_name == "billing");
    REQUIRE(config.environment == "staging");
    REQUIRE(config.sample_rate == 0.25);
    REQUIRE(config.traces_per_second == 50.0);
    REQUIRE(config.rate_limit_burst == 10.0);
    REQUIRE(config.combine_strategy == CombineStrategy::Or);
    REQUIRE(config.export_queue_capacity == 16);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("TracingConfiguration rejects unparsable values", "[config][tracing]") {
    Configuration source;

    SECTION("Boolean") {
        source.set("tracing.enabled", "maybe");
        REQUIRE_THROWS_AS(TracingConfiguration::from_config(source), ConfigurationError);
    }

    SECTION("Rate") {
        source.set("tracing.sampling.rate", "often");
        REQUIRE_THROWS_WITH(TracingConfiguration::from_config(source),
                            Catch::Matchers::ContainsSubstring("tracing.sampling.rate"));
    }

    SECTION("Strategy") {
        source.set("tracing.sampling.strategy", "\"xor\"");
        REQUIRE_THROWS_AS(TracingConfiguration::from_config(source), ConfigurationError);
    }

    SECTION("Negative capacity") {
        source.set("tracing.export.queue_capacity", "-1");
        REQUIRE_THROWS_AS(TracingConfiguration::from_config(source), ConfigurationError);
    }
}

TEST_CASE("TracingConfiguration validation", "[config][tracing]") {
    TracingConfiguration config;

    SECTION("Sampling rate out of range") {
        config.sample_rate = 1.5;
        REQUIRE_THROWS_WITH(config.validate(), Catch::Matchers::StartsWith("tracing configuration: "));
        config.sample_rate = -0.1;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Rate limit must be positive") {
        config.traces_per_second = 0.0;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Burst of at least one") {
        config.traces_per_second = 10.0;
        config.rate_limit_burst = 0.5;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Queue capacity") {
        config.export_queue_capacity = 0;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }
}

TEST_CASE("Combine strategy names", "[config][tracing]") {
    using msgtrace::core::config::combine_strategy_from_string;

    REQUIRE(combine_strategy_from_string("AND") == CombineStrategy::And);
    REQUIRE(combine_strategy_from_string("all") == CombineStrategy::And);
    REQUIRE(combine_strategy_from_string("any") == CombineStrategy::Or);
    REQUIRE_FALSE(combine_strategy_from_string("both").has_value());
}
