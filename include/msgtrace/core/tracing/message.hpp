#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "msgtrace/core/tracing/propagator.hpp"

namespace msgtrace::core::tracing {

enum class MessageKind { Command, Query, Event };

/// Lower-case tag used for `message.type`: "command", "query", "event".
[[nodiscard]] std::string_view to_string(MessageKind kind) noexcept;
/// Capitalized verb used in dispatch span names: "Command", "Query", "Event".
[[nodiscard]] std::string_view verb(MessageKind kind) noexcept;
[[nodiscard]] std::optional<MessageKind> message_kind_from_string(std::string_view text) noexcept;

/// Source of a domain event, when the event came out of an event-sourced aggregate.
struct AggregateInfo {
    std::string type;
    std::string identifier;
    std::int64_t sequence_number{0};
};

/// Event processor that delivers an event to its handler.
struct ProcessingInfo {
    std::string processor_name;
    std::string processor_type;  // "tracking", "subscribing", "pooled"
    std::optional<std::string> token_position;
    bool replaying{false};
    std::string handler_group;
};

/// What the unit of work of a command handler did to its aggregate.
struct AggregateLifecycle {
    std::int64_t events_applied{0};
    bool creation{false};
};

/**
 * @brief What the tracing core sees of a bus message.
 *
 * The payload itself is opaque to the core; `payload` is its pre-rendered text
 * form and is only copied onto spans when payload capture is enabled.
 */
struct Message {
    std::string identifier;
    MessageKind kind{MessageKind::Command};
    std::string name;
    std::string payload_type;
    std::string payload;
    std::string response_type;
    Carrier metadata;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::optional<AggregateInfo> aggregate;
    // Handler-side context, filled in by the bus before the handler span opens.
    std::optional<ProcessingInfo> processing;
    std::optional<AggregateLifecycle> lifecycle;

    // Value of a metadata entry, or nullopt.
    [[nodiscard]] std::optional<std::string> metadata_value(const std::string& key) const;
};

}  // namespace msgtrace::core::tracing
