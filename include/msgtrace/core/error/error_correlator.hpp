#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <map>
#include <string>

#include "msgtrace/core/error/error_reporter.hpp"
#include "msgtrace/core/error/fingerprint.hpp"
#include "msgtrace/core/logging/logger.hpp"
#include "msgtrace/core/tracing/message.hpp"
#include "msgtrace/core/tracing/span.hpp"

namespace msgtrace::core::error {

struct ErrorDetails {
    std::string type;
    std::string message;
};

// Type and what() of a captured exception; "unknown" for non-std exceptions.
[[nodiscard]] ErrorDetails describe(const std::exception_ptr& error);

/**
 * @brief Ties handler failures to their span and to the error backend.
 *
 * The span always gets the exception event and Error status. The report to the
 * backend is best effort: a throwing reporter is logged and counted, never
 * propagated, so the caller's own exception is what escapes.
 */
class ErrorCorrelator {
public:
    explicit ErrorCorrelator(ErrorReporterPtr reporter = nullptr, logging::LoggerPtr logger = nullptr);

    void record_exception(tracing::Span& span, const std::exception_ptr& error,
                          const tracing::Message* message = nullptr) noexcept;

    // Marks the span only; nothing is forwarded.
    static void annotate(tracing::Span& span, const ErrorDetails& details);

    [[nodiscard]] ErrorReport build_report(const tracing::Span& span, const ErrorDetails& details,
                                           const tracing::Message* message) const;

    [[nodiscard]] std::uint64_t reported() const noexcept { return reported_.load(); }
    [[nodiscard]] std::uint64_t failed_reports() const noexcept { return failed_reports_.load(); }

private:
    ErrorReporterPtr reporter_;
    logging::LoggerPtr logger_;
    FingerprintGenerator fingerprints_;
    std::atomic<std::uint64_t> reported_{0};
    std::atomic<std::uint64_t> failed_reports_{0};
};

// Tags describing the message: id, kind, payload type, name, aggregate, metadata.
[[nodiscard]] std::map<std::string, std::string> message_tags(const tracing::Message& message);

}  // namespace msgtrace::core::error
