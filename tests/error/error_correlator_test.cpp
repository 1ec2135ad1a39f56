#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "msgtrace/core/error/error_correlator.hpp"
#include "support/recording.hpp"

using namespace msgtrace::core;
using namespace msgtrace::core::tracing;
using msgtrace::testing::make_message;
using msgtrace::testing::RecordingReporter;
using msgtrace::testing::ThrowingReporter;

namespace {

SpanPtr make_span() {
    return std::make_shared<Span>("Handle: CreateOrder", SpanKind::Server,
                                  TraceContext{TraceId{0xa, 0xb}, SpanId{0xc}, true}, SpanId{0xd});
}

}  // namespace

TEST_CASE("Exception details", "[error]") {
    auto details = error::describe(std::make_exception_ptr(std::invalid_argument("bad state")));
    REQUIRE(details.type == "std::invalid_argument");
    REQUIRE(details.message == "bad state");

    details = error::describe(std::make_exception_ptr(42));
    REQUIRE(details.type == "unknown");

    details = error::describe(nullptr);
    REQUIRE(details.type == "unknown");
}

TEST_CASE("Correlator annotates the span and reports", "[error][correlator]") {
    auto reporter = std::make_shared<RecordingReporter>();
    error::ErrorCorrelator correlator{reporter};
    auto span = make_span();

    auto message = make_message(MessageKind::Command, "CreateOrder", "cmd-7");
    message.metadata = {{"tenant", "acme"}, {"traceparent", "ignored"}};
    message.aggregate = AggregateInfo{"Order", "order-7", 2};

    correlator.record_exception(*span, std::make_exception_ptr(std::invalid_argument("Order 7 is closed")), &message);

    REQUIRE(span->status() == StatusCode::Error);
    REQUIRE(span->status_description() == "Order 7 is closed");
    REQUIRE(span->exceptions().size() == 1);
    REQUIRE(std::get<std::string>(*span->attribute("error.type")) == "std::invalid_argument");
    REQUIRE(std::get<std::string>(*span->attribute("error.message")) == "Order 7 is closed");
    // The correlator never ends the span.
    REQUIRE_FALSE(span->is_ended());

    REQUIRE(correlator.reported() == 1);
    REQUIRE(reporter->reports.size() == 1);
    const auto& report = reporter->reports.front();
    REQUIRE(report.trace_id == span->trace_id().to_hex());
    REQUIRE(report.span_id == span->span_id().to_hex());
    REQUIRE(report.sampled);
    REQUIRE(report.error_type == "std::invalid_argument");
    REQUIRE(report.tags.at("trace_id") == report.trace_id);
    REQUIRE(report.tags.at("trace_sampled") == "true");
    REQUIRE(report.tags.at("message.id") == "cmd-7");
    REQUIRE(report.tags.at("command.name") == "CreateOrder");
    REQUIRE(report.tags.at("aggregate.id") == "order-7");
    REQUIRE(report.tags.at("metadata.tenant") == "acme");
    REQUIRE(report.tags.count("metadata.traceparent") == 0);
    REQUIRE(report.fingerprint == std::vector<std::string>{"std::invalid_argument", "CommandHandling", "Order",
                                                           "Order {number} is closed"});
}

TEST_CASE("Correlator survives a failing reporter", "[error][correlator]") {
    auto reporter = std::make_shared<ThrowingReporter>();
    error::ErrorCorrelator correlator{reporter, logging::create_logger("correlator-test")};
    auto span = make_span();

    REQUIRE_NOTHROW(correlator.record_exception(*span, std::make_exception_ptr(std::runtime_error("boom"))));

    REQUIRE(reporter->calls == 1);
    REQUIRE(correlator.failed_reports() == 1);
    REQUIRE(correlator.reported() == 0);
    REQUIRE(span->status() == StatusCode::Error);
}

TEST_CASE("Correlator without a reporter", "[error][correlator]") {
    error::ErrorCorrelator correlator;
    auto span = make_span();

    correlator.record_exception(*span, std::make_exception_ptr(std::runtime_error("")));
    REQUIRE(span->status() == StatusCode::Error);
    REQUIRE(span->status_description() == "Error");
    REQUIRE(correlator.reported() == 0);
}

TEST_CASE("Error report JSON", "[error]") {
    error::ErrorReport report;
    report.trace_id = "0af7651916cd43dd8448eb211c80319c";
    report.span_id = "b7ad6b7169203331";
    report.error_type = "std::runtime_error";
    report.error_message = "boom";
    report.fingerprint = {"std::runtime_error", "boom"};
    report.tags = {{"message.type", "command"}};

    auto json = nlohmann::json::parse(error::to_json(report));
    REQUIRE(json["trace_id"] == report.trace_id);
    REQUIRE(json["type"] == "std::runtime_error");
    REQUIRE(json["fingerprint"].size() == 2);
    REQUIRE(json["tags"]["message.type"] == "command");

    error::LogErrorReporter log_reporter{nullptr};
    REQUIRE_NOTHROW(log_reporter.report_error(report));
}
