#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "msgtrace/core/errors.hpp"
#include "msgtrace/core/tracing/subscription_query.hpp"
#include "support/recording.hpp"

using namespace msgtrace::core;
using namespace msgtrace::core::tracing;
using msgtrace::testing::make_message;
using msgtrace::testing::RecordingProcessor;
using msgtrace::testing::RecordingReporter;

namespace {

struct OrderView {
    std::string id;
};

struct Fixture {
    std::shared_ptr<RecordingProcessor> processor = std::make_shared<RecordingProcessor>();
    std::shared_ptr<RecordingReporter> reporter = std::make_shared<RecordingReporter>();

    ScopedSpan open_query() {
        auto message = std::make_shared<const Message>(make_message(MessageKind::Query, "WatchOrders"));
        auto span = std::make_shared<Span>("Query: WatchOrders", SpanKind::Client,
                                           TraceContext{TraceId{1, 2}, SpanId{3}, true}, std::nullopt, processor);
        return ScopedSpan{std::move(span), std::move(message), std::make_shared<error::ErrorCorrelator>(reporter),
                          false};
    }

    const Span& only_span() const {
        REQUIRE(processor->ended.size() == 1);
        return *processor->ended.front();
    }
};

bool flag(const Span& span, const std::string& key) {
    auto value = span.attribute(key);
    return value.has_value() && std::get<bool>(*value);
}

}  // namespace

TEST_CASE("Subscription query lifecycle", "[tracing][subscription]") {
    Fixture fixture;
    SubscriptionQueryTracker tracker{fixture.open_query()};
    REQUIRE(tracker.handle().is_open());
    REQUIRE(flag(*tracker.handle().span(), "query.is_subscription"));

    tracker.initial_result(std::any{std::string{"snapshot"}});
    tracker.update(std::any{OrderView{"order-1"}});
    tracker.update(std::any{OrderView{"order-2"}});
    REQUIRE(tracker.update_count() == 2);

    SECTION("Completed") {
        tracker.complete();
        const auto& span = fixture.only_span();

        REQUIRE(span.status() == StatusCode::Ok);
        REQUIRE(std::get<std::string>(*span.attribute("query.initial_result_type")) == "std::string");
        REQUIRE(std::get<std::int64_t>(*span.attribute("query.update_count")) == 2);
        auto update_type = std::get<std::string>(*span.attribute("query.update_type"));
        REQUIRE(update_type.find("OrderView") != std::string::npos);
        REQUIRE(flag(span, "query.subscription_completed"));
        REQUIRE_FALSE(span.attribute("query.subscription_cancelled").has_value());
        REQUIRE(std::get<std::int64_t>(*span.attribute("query.subscription_duration_ns")) >= 0);
        REQUIRE(std::get<std::string>(*span.attribute("query.result_type")) == "std::string");
    }

    SECTION("Cancelled by the subscriber") {
        tracker.cancel();
        const auto& span = fixture.only_span();
        REQUIRE(span.status() == StatusCode::Cancelled);
        REQUIRE(flag(span, "query.subscription_cancelled"));
        REQUIRE_FALSE(span.attribute("query.subscription_completed").has_value());
    }

    SECTION("Failed") {
        tracker.fail(std::make_exception_ptr(std::runtime_error("projection offline")));
        const auto& span = fixture.only_span();
        REQUIRE(span.status() == StatusCode::Error);
        REQUIRE(flag(span, "query.subscription_error"));
        REQUIRE(span.exceptions().size() == 1);
        REQUIRE(span.exceptions().front().message == "projection offline");
    }

    SECTION("Only the first outcome is recorded") {
        tracker.complete();
        tracker.cancel();
        tracker.update(std::any{OrderView{"late"}});
        const auto& span = fixture.only_span();
        REQUIRE_FALSE(span.attribute("query.subscription_cancelled").has_value());
        REQUIRE(std::get<std::int64_t>(*span.attribute("query.update_count")) == 2);
        REQUIRE(tracker.update_count() == 3);
    }
}

TEST_CASE("Subscription query void initial result", "[tracing][subscription]") {
    Fixture fixture;
    SubscriptionQueryTracker tracker{fixture.open_query()};
    tracker.initial_result(std::any{});
    tracker.complete();

    const auto& span = fixture.only_span();
    REQUIRE(std::get<std::string>(*span.attribute("query.initial_result_type")) == "void");
    REQUIRE(std::get<std::int64_t>(*span.attribute("query.update_count")) == 0);
    REQUIRE_FALSE(span.attribute("query.update_type").has_value());
}

TEST_CASE("Subscription query updates from several threads", "[tracing][subscription]") {
    Fixture fixture;
    SubscriptionQueryTracker tracker{fixture.open_query()};

    constexpr int threads = 4;
    constexpr int updates_per_thread = 250;
    std::vector<std::thread> sources;
    for (int t = 0; t < threads; ++t) {
        sources.emplace_back([&tracker] {
            for (int i = 0; i < updates_per_thread; ++i) {
                tracker.update(std::any{i});
            }
        });
    }
    for (auto& source : sources) {
        source.join();
    }
    tracker.complete();

    const auto& span = fixture.only_span();
    REQUIRE(std::get<std::int64_t>(*span.attribute("query.update_count")) == threads * updates_per_thread);
}

TEST_CASE("Subscription query without a recording span", "[tracing][subscription]") {
    SubscriptionQueryTracker tracker{ScopedSpan{}};
    tracker.initial_result(std::any{1});
    tracker.update(std::any{2});
    tracker.complete();

    REQUIRE(tracker.update_count() == 1);
    REQUIRE_FALSE(tracker.handle().is_recording());
}
