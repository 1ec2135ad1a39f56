#include "msgtrace/core/tracing/message.hpp"

namespace msgtrace::core::tracing {

std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Command: return "command";
        case MessageKind::Query:   return "query";
        case MessageKind::Event:   return "event";
    }
    return "command";
}

std::string_view verb(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Command: return "Command";
        case MessageKind::Query:   return "Query";
        case MessageKind::Event:   return "Event";
    }
    return "Command";
}

std::optional<MessageKind> message_kind_from_string(std::string_view text) noexcept {
    if (text == "command") return MessageKind::Command;
    if (text == "query") return MessageKind::Query;
    if (text == "event") return MessageKind::Event;
    return std::nullopt;
}

std::optional<std::string> Message::metadata_value(const std::string& key) const {
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace msgtrace::core::tracing
