#pragma once

// Attribute keys written by the tracing core.
namespace msgtrace::core::tracing::span_attributes {

inline constexpr const char* messaging_system = "messaging.system";
inline constexpr const char* messaging_operation = "messaging.operation";
inline constexpr const char* messaging_message_id = "messaging.message.id";
inline constexpr const char* messaging_destination = "messaging.destination.name";

inline constexpr const char* message_type = "message.type";
inline constexpr const char* message_id = "message.id";
inline constexpr const char* message_name = "message.name";
inline constexpr const char* payload_type = "message.payload_type";
inline constexpr const char* payload = "message.payload";
inline constexpr const char* metadata = "message.metadata";

inline constexpr const char* handler = "handler.id";

inline constexpr const char* command_name = "command.name";
inline constexpr const char* event_type = "event.type";
inline constexpr const char* event_timestamp = "event.timestamp";
inline constexpr const char* query_name = "query.name";
inline constexpr const char* query_response_type = "query.response_type";

inline constexpr const char* aggregate_type = "aggregate.type";
inline constexpr const char* aggregate_id = "aggregate.id";
inline constexpr const char* aggregate_sequence_number = "aggregate.sequence_number";
inline constexpr const char* aggregate_events_applied = "aggregate.events_applied";
inline constexpr const char* aggregate_is_creation = "aggregate.is_creation";

inline constexpr const char* event_processor_name = "event_processor.name";
inline constexpr const char* event_processor_type = "event_processor.type";
inline constexpr const char* event_processor_token_position = "event_processor.token_position";
inline constexpr const char* event_processor_is_replaying = "event_processor.is_replaying";
inline constexpr const char* event_handler_group = "event_handler.group";

inline constexpr const char* query_is_subscription = "query.is_subscription";
inline constexpr const char* query_initial_result_type = "query.initial_result_type";
inline constexpr const char* query_update_count = "query.update_count";
inline constexpr const char* query_update_type = "query.update_type";
inline constexpr const char* query_subscription_completed = "query.subscription_completed";
inline constexpr const char* query_subscription_cancelled = "query.subscription_cancelled";
inline constexpr const char* query_subscription_error = "query.subscription_error";
inline constexpr const char* query_subscription_duration = "query.subscription_duration_ns";

inline constexpr const char* service_name = "service.name";
inline constexpr const char* deployment_environment = "deployment.environment";

inline constexpr const char* error_type = "error.type";
inline constexpr const char* error_message = "error.message";

inline constexpr const char* messaging_system_name = "msgtrace";
inline constexpr const char* operation_send = "send";
inline constexpr const char* operation_process = "process";

}  // namespace msgtrace::core::tracing::span_attributes
