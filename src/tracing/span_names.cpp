#include "msgtrace/core/tracing/span_names.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace msgtrace::core::tracing {
namespace {

constexpr std::string_view unknown_name = "Unknown";

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_numeric(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string_view after_last_separator(std::string_view name) {
    auto dot = name.rfind('.');
    auto scope = name.rfind("::");
    std::size_t cut = 0;
    if (dot != std::string_view::npos) {
        cut = dot + 1;
    }
    if (scope != std::string_view::npos && scope + 2 > cut) {
        cut = scope + 2;
    }
    return name.substr(cut);
}

}  // namespace

std::string extract_message_name(std::string_view name, std::string_view payload_type) {
    std::string_view raw = !is_blank(name) ? name : payload_type;
    if (is_blank(raw)) {
        return std::string(unknown_name);
    }

    if (auto angle = raw.find('<'); angle != std::string_view::npos) {
        raw = raw.substr(0, angle);
    }
    std::string_view simple = after_last_separator(raw);
    if (auto proxy = simple.find("$$"); proxy != std::string_view::npos) {
        simple = simple.substr(0, proxy);
    }

    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto dollar = simple.find('$', start);
        parts.push_back(simple.substr(start, dollar == std::string_view::npos ? std::string_view::npos
                                                                               : dollar - start));
        if (dollar == std::string_view::npos) {
            break;
        }
        start = dollar + 1;
    }

    auto innermost = std::find_if(parts.rbegin(), parts.rend(), [](std::string_view part) {
        return !is_blank(part) && !is_numeric(part);
    });
    std::string_view cleaned = innermost != parts.rend() ? *innermost : parts.front();
    if (is_blank(cleaned)) {
        return std::string(unknown_name);
    }
    return std::string(cleaned);
}

std::string extract_message_name(const Message& message) {
    return extract_message_name(message.name, message.payload_type);
}

std::string dispatch_span_name(MessageKind kind, std::string_view message_name) {
    std::string name{verb(kind)};
    name.append(": ");
    name.append(message_name);
    return name;
}

std::string handler_span_name(std::string_view message_name) {
    std::string name{"Handle: "};
    name.append(message_name);
    return name;
}

SpanKind dispatch_span_kind(MessageKind kind) noexcept {
    return kind == MessageKind::Event ? SpanKind::Producer : SpanKind::Client;
}

SpanKind handler_span_kind(MessageKind kind) noexcept {
    return kind == MessageKind::Event ? SpanKind::Consumer : SpanKind::Server;
}

}  // namespace msgtrace::core::tracing
