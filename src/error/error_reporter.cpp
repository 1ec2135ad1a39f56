#include "msgtrace/core/error/error_reporter.hpp"

#include <utility>

#include <nlohmann/json.hpp>

namespace msgtrace::core::error {

std::string to_json(const ErrorReport& report) {
    nlohmann::json json = {
        {"trace_id", report.trace_id},
        {"span_id", report.span_id},
        {"sampled", report.sampled},
        {"type", report.error_type},
        {"message", report.error_message},
        {"fingerprint", report.fingerprint},
        {"tags", report.tags},
    };
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

LogErrorReporter::LogErrorReporter(logging::LoggerPtr logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        logger_ = logging::create_logger("msgtrace.errors");
    }
}

void LogErrorReporter::report_error(const ErrorReport& report) {
    logger_->error("[error] {}", to_json(report));
}

}  // namespace msgtrace::core::error
