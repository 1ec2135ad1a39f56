#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "msgtrace/core/tracing/message.hpp"

namespace msgtrace::core::error {

/**
 * @brief Grouping key for similar errors.
 *
 * Components, in order and without duplicates: the exception type, the phase
 * ("CommandHandling", "QueryHandling", "EventProcessing") when the message kind
 * is known, the aggregate type, and the normalized message.
 */
class FingerprintGenerator {
public:
    static constexpr std::size_t max_message_length = 100;

    [[nodiscard]] std::vector<std::string> generate(std::string_view error_type,
                                                    std::string_view error_message,
                                                    std::optional<tracing::MessageKind> kind = std::nullopt,
                                                    std::optional<std::string> aggregate_type = std::nullopt) const;

    // UUIDs -> {uuid}, numbers -> {number}, "quoted" -> {string}; cut to max_message_length.
    [[nodiscard]] static std::string normalize_message(std::string_view message);
};

}  // namespace msgtrace::core::error
