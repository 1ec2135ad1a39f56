#include "msgtrace/core/exporting/span_exporter.hpp"

#include <chrono>
#include <utility>

namespace msgtrace::core::exporting {
namespace {

std::int64_t epoch_micros(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();
}

}  // namespace

nlohmann::json to_json(const tracing::Span& span) {
    nlohmann::json attributes = nlohmann::json::object();
    for (const auto& [key, value] : span.attributes()) {
        std::visit([&attributes, &key = key](const auto& alternative) { attributes[key] = alternative; }, value);
    }

    nlohmann::json exceptions = nlohmann::json::array();
    for (const auto& event : span.exceptions()) {
        exceptions.push_back({
            {"type", event.type},
            {"message", event.message},
            {"timestamp_us", epoch_micros(event.timestamp)},
        });
    }

    nlohmann::json record = {
        {"name", span.name()},
        {"kind", std::string(tracing::to_string(span.kind()))},
        {"trace_id", span.trace_id().to_hex()},
        {"span_id", span.span_id().to_hex()},
        {"sampled", span.sampled()},
        {"status", std::string(tracing::to_string(span.status()))},
        {"start_time_us", epoch_micros(span.start_time())},
        {"duration_ns", span.elapsed().count()},
        {"attributes", std::move(attributes)},
        {"exceptions", std::move(exceptions)},
    };
    record["parent_span_id"] = span.parent_span_id() ? nlohmann::json(span.parent_span_id()->to_hex())
                                                     : nlohmann::json(nullptr);
    if (!span.status_description().empty()) {
        record["status_description"] = span.status_description();
    }
    if (auto end = span.end_time()) {
        record["end_time_us"] = epoch_micros(*end);
    }
    if (!span.context().baggage().empty()) {
        record["baggage"] = span.context().baggage();
    }
    return record;
}

LogSpanExporter::LogSpanExporter(logging::LoggerPtr logger, logging::Level level)
    : logger_(std::move(logger)), level_(level) {
    if (!logger_) {
        logger_ = logging::create_logger("msgtrace.spans");
    }
}

void LogSpanExporter::submit(const SpanData& span) {
    if (!span || !logger_->should_log(level_)) {
        return;
    }
    logger_->log(level_, "[span] {}",
                 to_json(*span).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void LogSpanExporter::flush() {
    logger_->flush();
}

void InMemorySpanExporter::submit(const SpanData& span) {
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.push_back(span);
}

std::vector<SpanData> InMemorySpanExporter::spans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
}

std::size_t InMemorySpanExporter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_.size();
}

void InMemorySpanExporter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.clear();
}

}  // namespace msgtrace::core::exporting
