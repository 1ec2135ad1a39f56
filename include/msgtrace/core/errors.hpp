#pragma once

#include <stdexcept>
#include <string>

namespace msgtrace::core {

/**
 * @brief Invalid or missing setting while tracing is enabled. Raised at startup.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("tracing configuration: " + message) {}
};

/**
 * @brief Thrown by a handler (or its host) when the invocation was cancelled
 * externally. The interceptor closes the span as Cancelled and re-throws it.
 */
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& message = "operation cancelled")
        : std::runtime_error(message) {}
};

}  // namespace msgtrace::core
