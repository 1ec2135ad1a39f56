#include "msgtrace/core/error/fingerprint.hpp"

#include <algorithm>
#include <regex>

namespace msgtrace::core::error {
namespace {

const std::regex& uuid_pattern() {
    static const std::regex pattern{
        "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}"};
    return pattern;
}

const std::regex& number_pattern() {
    static const std::regex pattern{"\\b\\d+(\\.\\d+)?\\b"};
    return pattern;
}

const std::regex& quoted_pattern() {
    static const std::regex pattern{"\"[^\"]*\""};
    return pattern;
}

std::string_view phase(tracing::MessageKind kind) {
    switch (kind) {
        case tracing::MessageKind::Command: return "CommandHandling";
        case tracing::MessageKind::Query:   return "QueryHandling";
        case tracing::MessageKind::Event:   return "EventProcessing";
    }
    return "CommandHandling";
}

}  // namespace

std::string FingerprintGenerator::normalize_message(std::string_view message) {
    std::string normalized{message};
    normalized = std::regex_replace(normalized, uuid_pattern(), "{uuid}");
    normalized = std::regex_replace(normalized, number_pattern(), "{number}");
    normalized = std::regex_replace(normalized, quoted_pattern(), "{string}");
    if (normalized.size() > max_message_length) {
        normalized.resize(max_message_length);
    }
    return normalized;
}

std::vector<std::string> FingerprintGenerator::generate(std::string_view error_type,
                                                        std::string_view error_message,
                                                        std::optional<tracing::MessageKind> kind,
                                                        std::optional<std::string> aggregate_type) const {
    std::vector<std::string> components;
    auto add = [&components](std::string component) {
        if (component.empty()) {
            return;
        }
        if (std::find(components.begin(), components.end(), component) == components.end()) {
            components.push_back(std::move(component));
        }
    };

    add(std::string{error_type});
    if (kind) {
        add(std::string{phase(*kind)});
    }
    if (aggregate_type) {
        add(std::move(*aggregate_type));
    }
    if (!error_message.empty()) {
        add(normalize_message(error_message));
    }
    if (components.empty()) {
        components.emplace_back("unknown");
    }
    return components;
}

}  // namespace msgtrace::core::error
