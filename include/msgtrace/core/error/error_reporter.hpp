#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "msgtrace/core/logging/logger.hpp"

namespace msgtrace::core::error {

/**
 * @brief What the error-monitoring backend receives for one failed handler.
 *
 * trace_id/span_id are the correlation key back to the trace.
 */
struct ErrorReport {
    std::string trace_id;
    std::string span_id;
    bool sampled{false};
    std::string error_type;
    std::string error_message;
    std::vector<std::string> fingerprint;
    std::map<std::string, std::string> tags;
};

/**
 * @brief Error-monitoring collaborator. May throw; the core contains it.
 */
class ErrorReporter {
public:
    virtual ~ErrorReporter() = default;
    virtual void report_error(const ErrorReport& report) = 0;
};

using ErrorReporterPtr = std::shared_ptr<ErrorReporter>;

/**
 * @brief Writes each report as one JSON log line at error level.
 */
class LogErrorReporter : public ErrorReporter {
public:
    explicit LogErrorReporter(logging::LoggerPtr logger);

    void report_error(const ErrorReport& report) override;

private:
    logging::LoggerPtr logger_;
};

[[nodiscard]] std::string to_json(const ErrorReport& report);

}  // namespace msgtrace::core::error
