#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "msgtrace/core/errors.hpp"
#include "msgtrace/core/tracing/interceptor.hpp"
#include "msgtrace/core/tracing/propagator.hpp"
#include "support/recording.hpp"

using namespace msgtrace::core;
using namespace msgtrace::core::tracing;
using msgtrace::testing::make_message;
using msgtrace::testing::RecordingProcessor;
using msgtrace::testing::RecordingReporter;

namespace {

class OrderRejected : public std::invalid_argument {
public:
    OrderRejected() : std::invalid_argument("bad state") {}
};

struct Harness {
    explicit Harness(config::TracingConfiguration config = {}, sampling::SamplerPtr sampler = nullptr) {
        auto tracer = std::make_shared<Tracer>(std::make_shared<RandomIdGenerator>(99), std::move(sampler), processor);
        auto factory = std::make_shared<SpanFactory>(tracer, std::move(config));
        correlator = std::make_shared<error::ErrorCorrelator>(reporter);
        interceptor = std::make_unique<TracingInterceptor>(factory, correlator);
    }

    std::shared_ptr<const Span> ended(const std::string& name) const {
        for (const auto& span : processor->ended) {
            if (span->name() == name) {
                return span;
            }
        }
        return nullptr;
    }

    std::shared_ptr<RecordingProcessor> processor = std::make_shared<RecordingProcessor>();
    std::shared_ptr<RecordingReporter> reporter = std::make_shared<RecordingReporter>();
    std::shared_ptr<error::ErrorCorrelator> correlator;
    std::unique_ptr<TracingInterceptor> interceptor;
};

}  // namespace

TEST_CASE("Dispatch without an active context starts a trace", "[tracing][interceptor]") {
    Harness harness;
    ExecutionContext client;

    auto dispatched = harness.interceptor->wrap_dispatch(make_message(MessageKind::Command, "CreateOrder"), client);

    REQUIRE(dispatched.handle.is_open());
    REQUIRE(dispatched.handle->name() == "Command: CreateOrder");
    REQUIRE_FALSE(dispatched.handle->parent_span_id().has_value());

    const auto& traceparent = dispatched.message.metadata.at(traceparent_key);
    REQUIRE(traceparent == "00-" + dispatched.handle->trace_id().to_hex() + "-" +
                               dispatched.handle->span_id().to_hex() + "-01");

    dispatched.handle.complete();
    REQUIRE(harness.processor->ended.size() == 1);
}

TEST_CASE("Handler failure is recorded and propagates unchanged", "[tracing][interceptor]") {
    Harness harness;
    ExecutionContext client;
    auto dispatched = harness.interceptor->wrap_dispatch(make_message(MessageKind::Command, "CreateOrder"), client);

    ExecutionContext remote;
    auto failing = [](const Message&, ExecutionContext&) -> HandlerResult { throw OrderRejected{}; };

    REQUIRE_THROWS_AS(harness.interceptor->wrap_handler(dispatched.message, remote, failing, "OrderAggregate::handle"),
                      OrderRejected);

    auto handler = harness.ended("Handle: CreateOrder");
    REQUIRE(handler);
    REQUIRE(handler->trace_id() == dispatched.handle->trace_id());
    REQUIRE(handler->parent_span_id() == dispatched.handle->span_id());
    REQUIRE(handler->status() == StatusCode::Error);
    REQUIRE(handler->exceptions().size() == 1);
    REQUIRE(handler->exceptions().front().message == "bad state");
    REQUIRE(handler->exceptions().front().type.find("OrderRejected") != std::string::npos);
    REQUIRE(harness.processor->ended.size() == 1);
    REQUIRE(harness.reporter->reports.size() == 1);
    REQUIRE(harness.reporter->reports.front().trace_id == handler->trace_id().to_hex());
    REQUIRE(remote.depth() == 0);
}

TEST_CASE("Events published inside a handler nest under it", "[tracing][interceptor]") {
    Harness harness;
    ExecutionContext client;

    auto command = make_message(MessageKind::Command, "CreateOrder");
    auto reply = harness.interceptor->dispatch(command, client, [&harness](const Message& outgoing) {
        ExecutionContext remote;
        return harness.interceptor->wrap_handler(outgoing, remote, [&harness](const Message&, ExecutionContext& active) {
            auto published = harness.interceptor->wrap_dispatch(
                std::vector<Message>{make_message(MessageKind::Event, "OrderCreated")}, active);
            REQUIRE(published.size() == 1);
            REQUIRE_FALSE(published.front().handle.is_open());
            REQUIRE(published.front().message.metadata.count(traceparent_key) == 1);
            return HandlerResult{std::string{"order-1"}};
        });
    });

    REQUIRE(std::any_cast<std::string>(reply) == "order-1");

    auto dispatch = harness.ended("Command: CreateOrder");
    auto handler = harness.ended("Handle: CreateOrder");
    auto event = harness.ended("Event: OrderCreated");
    REQUIRE(dispatch);
    REQUIRE(handler);
    REQUIRE(event);

    REQUIRE(event->kind() == SpanKind::Producer);
    REQUIRE(event->status() == StatusCode::Unset);
    REQUIRE(event->parent_span_id() == handler->span_id());
    REQUIRE(event->trace_id() == dispatch->trace_id());
    REQUIRE(dispatch->status() == StatusCode::Ok);
    REQUIRE(handler->status() == StatusCode::Ok);
    REQUIRE(harness.processor->ended.size() == 3);
}

TEST_CASE("Event handlers become consumers of the publisher", "[tracing][interceptor]") {
    Harness harness;
    ExecutionContext client;
    auto published = harness.interceptor->wrap_dispatch(make_message(MessageKind::Event, "OrderCreated"), client);

    for (const auto* id : {"OrderProjection::on", "ShippingSaga::on"}) {
        ExecutionContext remote;
        harness.interceptor->wrap_handler(published.message, remote,
                                          [](const Message&, ExecutionContext&) { return HandlerResult{}; }, id);
    }

    REQUIRE(harness.processor->ended.size() == 3);
    for (const auto& span : harness.processor->ended) {
        if (span->name() == "Handle: OrderCreated") {
            REQUIRE(span->kind() == SpanKind::Consumer);
            REQUIRE(span->parent_span_id() == published.handle->span_id());
        }
    }
}

TEST_CASE("Dispatch failure closes the dispatch span", "[tracing][interceptor]") {
    Harness harness;
    ExecutionContext client;

    auto send = [](const Message&) -> HandlerResult { throw std::runtime_error("no handler"); };
    REQUIRE_THROWS_AS(harness.interceptor->dispatch(make_message(MessageKind::Query, "FindOrder"), client, send),
                      std::runtime_error);

    auto dispatch = harness.ended("Query: FindOrder");
    REQUIRE(dispatch);
    REQUIRE(dispatch->status() == StatusCode::Error);
    REQUIRE(dispatch->exceptions().size() == 1);
    // Only the handler side reports to the error backend.
    REQUIRE(harness.reporter->reports.empty());
}

TEST_CASE("Cancelled handler", "[tracing][interceptor]") {
    Harness harness;
    ExecutionContext remote;

    auto cancelled = [](const Message&, ExecutionContext&) -> HandlerResult { throw OperationCancelled{}; };
    REQUIRE_THROWS_AS(harness.interceptor->wrap_handler(make_message(MessageKind::Command, "CreateOrder"), remote,
                                                        cancelled),
                      OperationCancelled);

    auto handler = harness.ended("Handle: CreateOrder");
    REQUIRE(handler);
    REQUIRE(handler->status() == StatusCode::Cancelled);
    REQUIRE(harness.reporter->reports.empty());
}

TEST_CASE("Handler without propagated context starts a new trace", "[tracing][interceptor]") {
    Harness harness;
    ExecutionContext remote;

    auto message = make_message(MessageKind::Command, "CreateOrder");
    message.metadata[traceparent_key] = "not-a-traceparent";

    std::optional<TraceContext> seen;
    harness.interceptor->wrap_handler(message, remote, [&seen](const Message&, ExecutionContext& active) {
        seen = active.current();
        return HandlerResult{};
    });

    auto handler = harness.ended("Handle: CreateOrder");
    REQUIRE(handler);
    REQUIRE_FALSE(handler->parent_span_id().has_value());
    REQUIRE(seen.has_value());
    REQUIRE(seen->span_id() == handler->span_id());
}

TEST_CASE("Disabled kinds pass through untraced", "[tracing][interceptor]") {
    config::TracingConfiguration config;
    config.trace_commands = false;
    Harness harness{config};
    ExecutionContext execution;

    REQUIRE_FALSE(harness.interceptor->is_traced(MessageKind::Command));
    REQUIRE(harness.interceptor->is_traced(MessageKind::Event));

    auto dispatched = harness.interceptor->wrap_dispatch(make_message(MessageKind::Command, "CreateOrder"), execution);
    REQUIRE_FALSE(dispatched.handle.is_recording());
    REQUIRE(dispatched.message.metadata.empty());

    auto result = harness.interceptor->wrap_handler(dispatched.message, execution,
                                                    [](const Message&, ExecutionContext&) { return HandlerResult{7}; });
    REQUIRE(std::any_cast<int>(result) == 7);
    REQUIRE(harness.processor->ended.empty());

    SECTION("Failures still propagate") {
        auto failing = [](const Message&, ExecutionContext&) -> HandlerResult { throw OrderRejected{}; };
        REQUIRE_THROWS_AS(harness.interceptor->wrap_handler(dispatched.message, execution, failing), OrderRejected);
        REQUIRE(harness.reporter->reports.empty());
    }
}

TEST_CASE("Batches are wrapped per message", "[tracing][interceptor]") {
    Harness harness;
    ExecutionContext execution;

    std::vector<Message> batch{make_message(MessageKind::Event, "OrderCreated", "e-1"),
                               make_message(MessageKind::Event, "OrderShipped", "e-2"),
                               make_message(MessageKind::Command, "ArchiveOrder", "c-1")};
    auto dispatched = harness.interceptor->wrap_dispatch(std::move(batch), execution);

    REQUIRE(dispatched.size() == 3);
    REQUIRE(dispatched[0].message.identifier == "e-1");
    REQUIRE(dispatched[2].message.identifier == "c-1");
    REQUIRE(dispatched[0].handle->trace_id() != dispatched[1].handle->trace_id());
    REQUIRE(dispatched[2].handle.is_open());
    REQUIRE(harness.processor->ended.size() == 2);
}

TEST_CASE("Batches share the active parent", "[tracing][interceptor]") {
    Harness harness;
    ExecutionContext execution;
    TraceContext parent{TraceId{0x4bf92f3577b34da6, 0xa3ce929d0e0e4736}, SpanId{0x00f067aa0ba902b7}, true};
    ContextScope scope{execution, parent};

    std::vector<Message> batch{make_message(MessageKind::Event, "OrderCreated", "e-1"),
                               make_message(MessageKind::Command, "ReserveStock", "c-1"),
                               make_message(MessageKind::Query, "FindCustomer", "q-1")};
    auto dispatched = harness.interceptor->wrap_dispatch(std::move(batch), execution);

    REQUIRE(dispatched.size() == 3);
    std::set<std::string> span_ids;
    for (const auto& entry : dispatched) {
        const auto& span = entry.handle.span();
        REQUIRE(span);
        REQUIRE(span->trace_id() == parent.trace_id());
        REQUIRE(span->parent_span_id() == parent.span_id());
        span_ids.insert(span->span_id().to_hex());

        auto propagated = ContextPropagator::extract(entry.message.metadata);
        REQUIRE(propagated.has_value());
        REQUIRE(propagated->span_id() == span->span_id());
    }
    REQUIRE(span_ids.size() == 3);
    REQUIRE_FALSE(span_ids.count(parent.span_id().to_hex()));
}

TEST_CASE("Concurrent flows close every span once", "[tracing][interceptor]") {
    Harness harness;
    constexpr int flows = 4;
    constexpr int messages_per_flow = 200;

    std::atomic<int> leaked_contexts{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < flows; ++t) {
        workers.emplace_back([&harness, &leaked_contexts] {
            ExecutionContext client;
            for (int i = 0; i < messages_per_flow; ++i) {
                harness.interceptor->dispatch(
                    make_message(MessageKind::Command, "CreateOrder"), client, [&harness](const Message& outgoing) {
                        ExecutionContext remote;
                        return harness.interceptor->wrap_handler(
                            outgoing, remote, [](const Message&, ExecutionContext&) { return HandlerResult{}; });
                    });
                if (client.current()) {
                    ++leaked_contexts;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(leaked_contexts.load() == 0);
    const auto& ended = harness.processor->ended;
    REQUIRE(ended.size() == static_cast<std::size_t>(2 * flows * messages_per_flow));
    std::set<std::string> span_ids;
    for (const auto& span : ended) {
        span_ids.insert(span->span_id().to_hex());
    }
    REQUIRE(span_ids.size() == ended.size());
}

TEST_CASE("Asynchronous handler invocation", "[tracing][interceptor]") {
    Harness harness;
    auto message = make_message(MessageKind::Query, "FindOrder");

    auto invocation = harness.interceptor->begin_handler(message, "OrderQueries::find");
    REQUIRE(invocation.is_open());
    REQUIRE(harness.processor->ended.empty());

    invocation.fail(std::make_exception_ptr(std::out_of_range("order 404")));

    auto handler = harness.ended("Handle: FindOrder");
    REQUIRE(handler);
    REQUIRE(handler->status() == StatusCode::Error);
    REQUIRE(harness.reporter->reports.size() == 1);
    REQUIRE(harness.reporter->reports.front().tags.at("query.name") == "FindOrder");
}

TEST_CASE("Unsampled traces still propagate", "[tracing][interceptor]") {
    Harness harness{{}, std::make_shared<sampling::AlwaysOffSampler>()};
    ExecutionContext execution;

    auto dispatched = harness.interceptor->wrap_dispatch(make_message(MessageKind::Command, "CreateOrder"), execution);
    REQUIRE(dispatched.handle.is_recording());
    REQUIRE_FALSE(dispatched.handle->sampled());
    REQUIRE(dispatched.message.metadata.at(traceparent_key).substr(53) == "00");

    ExecutionContext remote;
    harness.interceptor->wrap_handler(dispatched.message, remote,
                                      [](const Message&, ExecutionContext&) { return HandlerResult{}; });
    auto handler = harness.ended("Handle: CreateOrder");
    REQUIRE(handler);
    REQUIRE_FALSE(handler->sampled());
}
