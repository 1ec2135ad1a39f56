#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "msgtrace/core/exporting/span_processor.hpp"
#include "support/recording.hpp"

using namespace msgtrace::core;
using namespace msgtrace::core::tracing;
using namespace msgtrace::core::exporting;

namespace {

SpanPtr make_span(std::shared_ptr<SpanProcessor> processor, bool sampled, const char* message_type = nullptr) {
    auto span = std::make_shared<Span>("Handle: CreateOrder", SpanKind::Server,
                                       TraceContext{TraceId{1, 2}, SpanId{3}, sampled}, SpanId{4},
                                       std::move(processor));
    if (message_type) {
        span->set_attribute("message.type", std::string{message_type});
    }
    return span;
}

class ThrowingFilter : public SpanFilter {
public:
    [[nodiscard]] bool should_export(const Span&) const override { throw std::runtime_error("filter broke"); }
};

}  // namespace

TEST_CASE("Processor exports sampled spans on flush", "[exporting][processor]") {
    auto exporter = std::make_shared<InMemorySpanExporter>();
    auto processor = std::make_shared<ExportingSpanProcessor>(exporter, 16);

    make_span(processor, true)->end();
    REQUIRE(processor->queue().size() == 1);
    REQUIRE(exporter->size() == 0);

    REQUIRE(processor->flush() == 1);
    REQUIRE(exporter->size() == 1);
    REQUIRE(exporter->spans().front()->name() == "Handle: CreateOrder");
    REQUIRE(processor->queue().size() == 0);
}

TEST_CASE("Processor skips unsampled and filtered spans", "[exporting][processor]") {
    auto exporter = std::make_shared<InMemorySpanExporter>();
    config::TracingConfiguration config;
    config.trace_commands = false;
    auto processor = std::make_shared<ExportingSpanProcessor>(
        exporter, 16, std::make_shared<ConfigurationSpanFilter>(config));

    make_span(processor, false, "event")->end();
    make_span(processor, true, "command")->end();
    make_span(processor, true, "event")->end();

    REQUIRE(processor->unsampled() == 1);
    REQUIRE(processor->filtered() == 1);
    REQUIRE(processor->flush() == 1);
}

TEST_CASE("Processor contains failures", "[exporting][processor]") {
    SECTION("Throwing filter") {
        auto exporter = std::make_shared<InMemorySpanExporter>();
        auto processor = std::make_shared<ExportingSpanProcessor>(exporter, 16, std::make_shared<ThrowingFilter>());

        auto span = make_span(processor, true);
        REQUIRE_NOTHROW(span->end());
        REQUIRE(processor->filtered() == 1);
        REQUIRE(processor->queue().size() == 0);
    }

    SECTION("Throwing exporter") {
        auto processor = std::make_shared<ExportingSpanProcessor>(
            std::make_shared<msgtrace::testing::ThrowingExporter>(), 16, nullptr,
            logging::create_logger("processor-test"));

        make_span(processor, true)->end();
        make_span(processor, true)->end();
        REQUIRE_NOTHROW(processor->flush());
        REQUIRE(processor->export_failures() == 2);
    }

    SECTION("Full queue") {
        auto processor = std::make_shared<ExportingSpanProcessor>(std::make_shared<InMemorySpanExporter>(), 1);
        make_span(processor, true)->end();
        make_span(processor, true)->end();
        REQUIRE(processor->queue().dropped() == 1);
    }
}

TEST_CASE("Processor shutdown", "[exporting][processor]") {
    auto exporter = std::make_shared<InMemorySpanExporter>();
    auto processor = std::make_shared<ExportingSpanProcessor>(exporter, 16);

    make_span(processor, true)->end();
    processor->shutdown();
    REQUIRE(processor->is_shutdown());
    REQUIRE(exporter->size() == 1);

    make_span(processor, true)->end();
    REQUIRE(processor->queue().size() == 0);
    REQUIRE_NOTHROW(processor->shutdown());
}

TEST_CASE("Span JSON record", "[exporting]") {
    auto span = std::make_shared<Span>("Event: OrderCreated", SpanKind::Producer,
                                       TraceContext{TraceId{0, 0xab}, SpanId{0xcd}, true, {{"tenant", "acme"}}},
                                       std::nullopt);
    span->set_attribute("message.type", std::string{"event"});
    span->set_attribute("aggregate.sequence_number", std::int64_t{3});
    span->set_status(StatusCode::Error, "bad state");
    span->end();

    auto record = to_json(*span);
    REQUIRE(record["name"] == "Event: OrderCreated");
    REQUIRE(record["kind"] == "producer");
    REQUIRE(record["status"] == "error");
    REQUIRE(record["status_description"] == "bad state");
    REQUIRE(record["trace_id"] == "000000000000000000000000000000ab");
    REQUIRE(record["span_id"] == "00000000000000cd");
    REQUIRE(record["parent_span_id"].is_null());
    REQUIRE(record["attributes"]["aggregate.sequence_number"] == 3);
    REQUIRE(record["baggage"]["tenant"] == "acme");
    REQUIRE(record.contains("end_time_us"));
}

TEST_CASE("Log span exporter", "[exporting]") {
    auto logger = logging::create_logger("span-log-test");
    LogSpanExporter exporter{logger, logging::Level::debug};

    auto span = std::make_shared<Span>("Command: CreateOrder", SpanKind::Client,
                                       TraceContext{TraceId{1, 1}, SpanId{1}, true}, std::nullopt);
    span->end();

    REQUIRE_NOTHROW(exporter.submit(span));
    REQUIRE_NOTHROW(exporter.submit(nullptr));
    REQUIRE_NOTHROW(exporter.flush());
}
