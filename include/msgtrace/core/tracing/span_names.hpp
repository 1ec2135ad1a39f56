#pragma once

#include <string>
#include <string_view>

#include "msgtrace/core/tracing/message.hpp"
#include "msgtrace/core/tracing/span.hpp"

namespace msgtrace::core::tracing {

/**
 * @brief Human-readable message name.
 *
 * Takes the explicit name, else the payload type name, and reduces it to a
 * simple name: "com.example.CreateOrder" and "shop::orders::CreateOrder" give
 * "CreateOrder", "Outer$Inner" gives "Inner", "Proxy$$Enhancer$$1" gives "Proxy",
 * "Outer$1" gives "Outer", "Envelope<Order>" gives "Envelope". Returns "Unknown"
 * when nothing usable is left.
 */
[[nodiscard]] std::string extract_message_name(std::string_view name, std::string_view payload_type);
[[nodiscard]] std::string extract_message_name(const Message& message);

// "Command: CreateOrder", "Query: FindOrder", "Event: OrderCreated"
[[nodiscard]] std::string dispatch_span_name(MessageKind kind, std::string_view message_name);
// "Handle: CreateOrder"
[[nodiscard]] std::string handler_span_name(std::string_view message_name);

// Client for commands and queries, Producer for events.
[[nodiscard]] SpanKind dispatch_span_kind(MessageKind kind) noexcept;
// Server for commands and queries, Consumer for events.
[[nodiscard]] SpanKind handler_span_kind(MessageKind kind) noexcept;

}  // namespace msgtrace::core::tracing
