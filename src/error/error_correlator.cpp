#include "msgtrace/core/error/error_correlator.hpp"

#include <utility>

#include "msgtrace/core/tracing/propagator.hpp"
#include "msgtrace/core/tracing/span_attributes.hpp"
#include "msgtrace/core/tracing/span_names.hpp"

namespace msgtrace::core::error {

ErrorDetails describe(const std::exception_ptr& error) {
    if (!error) {
        return {"unknown", ""};
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return {tracing::type_name(typeid(e)), e.what()};
    } catch (...) {
        return {"unknown", "non-standard exception"};
    }
}

std::map<std::string, std::string> message_tags(const tracing::Message& message) {
    std::map<std::string, std::string> tags;
    const auto name = tracing::extract_message_name(message);
    tags["message.type"] = std::string(tracing::to_string(message.kind));
    tags["message.name"] = name;
    if (!message.identifier.empty()) {
        tags["message.id"] = message.identifier;
    }
    if (!message.payload_type.empty()) {
        tags["message.payload_type"] = message.payload_type;
    }
    switch (message.kind) {
        case tracing::MessageKind::Command: tags["command.name"] = name; break;
        case tracing::MessageKind::Query:   tags["query.name"] = name; break;
        case tracing::MessageKind::Event:   tags["event.type"] = name; break;
    }
    if (message.aggregate) {
        tags["aggregate.type"] = message.aggregate->type;
        tags["aggregate.id"] = message.aggregate->identifier;
        tags["aggregate.sequence_number"] = std::to_string(message.aggregate->sequence_number);
    }
    for (const auto& [key, value] : message.metadata) {
        if (!tracing::is_reserved_key(key)) {
            tags["metadata." + key] = value;
        }
    }
    return tags;
}

ErrorCorrelator::ErrorCorrelator(ErrorReporterPtr reporter, logging::LoggerPtr logger)
    : reporter_(std::move(reporter)), logger_(std::move(logger)) {
}

void ErrorCorrelator::annotate(tracing::Span& span, const ErrorDetails& details) {
    span.add_exception({details.type, details.message, tracing::Span::Clock::now()});
    span.set_attribute(tracing::span_attributes::error_type, details.type);
    span.set_attribute(tracing::span_attributes::error_message, details.message);
    span.set_status(tracing::StatusCode::Error, details.message.empty() ? "Error" : details.message);
}

ErrorReport ErrorCorrelator::build_report(const tracing::Span& span, const ErrorDetails& details,
                                          const tracing::Message* message) const {
    ErrorReport report;
    report.trace_id = span.trace_id().to_hex();
    report.span_id = span.span_id().to_hex();
    report.sampled = span.sampled();
    report.error_type = details.type;
    report.error_message = details.message;

    if (message) {
        report.tags = message_tags(*message);
    }
    report.tags["trace_id"] = report.trace_id;
    report.tags["span_id"] = report.span_id;
    report.tags["trace_sampled"] = report.sampled ? "true" : "false";

    std::optional<tracing::MessageKind> kind;
    std::optional<std::string> aggregate_type;
    if (message) {
        kind = message->kind;
        if (message->aggregate) {
            aggregate_type = message->aggregate->type;
        }
    }
    report.fingerprint = fingerprints_.generate(details.type, details.message, kind, aggregate_type);
    return report;
}

void ErrorCorrelator::record_exception(tracing::Span& span, const std::exception_ptr& error,
                                       const tracing::Message* message) noexcept {
    ErrorDetails details;
    try {
        details = describe(error);
        annotate(span, details);
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error("failed to record exception on span {}: {}", span.name(), e.what());
        }
        return;
    }

    if (!reporter_) {
        return;
    }
    try {
        reporter_->report_error(build_report(span, details, message));
        ++reported_;
        if (logger_) {
            logger_->debug("reported {} for trace {}", details.type, span.trace_id().to_hex());
        }
    } catch (const std::exception& e) {
        ++failed_reports_;
        if (logger_) {
            logger_->warn("error reporter failed for trace {}: {}", span.trace_id().to_hex(), e.what());
        }
    } catch (...) {
        ++failed_reports_;
        if (logger_) {
            logger_->warn("error reporter failed for trace {} with a non-standard exception",
                          span.trace_id().to_hex());
        }
    }
}

}  // namespace msgtrace::core::error
