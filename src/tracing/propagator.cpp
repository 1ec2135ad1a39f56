#include "msgtrace/core/tracing/propagator.hpp"

#include <array>
#include <cctype>

#include "msgtrace/core/config/configuration.hpp"

namespace msgtrace::core::tracing {
namespace {

constexpr char hex_upper[] = "0123456789ABCDEF";

int hex_nibble(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

bool is_lower_hex(std::string_view text) noexcept {
    for (char ch : text) {
        bool digit = ch >= '0' && ch <= '9';
        bool lower = ch >= 'a' && ch <= 'f';
        if (!digit && !lower) {
            return false;
        }
    }
    return !text.empty();
}

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string percent_encode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char ch : text) {
        if (std::isalnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~') {
            out.push_back(static_cast<char>(ch));
        } else {
            out.push_back('%');
            out.push_back(hex_upper[ch >> 4]);
            out.push_back(hex_upper[ch & 0x0F]);
        }
    }
    return out;
}

std::optional<std::string> percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::nullopt;
        }
        int high = hex_nibble(text[i + 1]);
        int low = hex_nibble(text[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return out;
}

// Splits "00-<trace>-<span>-<flags>" into exactly four fields.
bool split_traceparent(std::string_view header, std::array<std::string_view, 4>& parts) {
    std::size_t field = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= header.size(); ++i) {
        if (i == header.size() || header[i] == '-') {
            if (field >= parts.size()) {
                return false;
            }
            parts[field++] = header.substr(start, i - start);
            start = i + 1;
        }
    }
    return field == parts.size();
}

}  // namespace

bool is_reserved_key(std::string_view key) noexcept {
    return key == traceparent_key || key == tracestate_key || key == baggage_key;
}

std::string ContextPropagator::format_traceparent(const TraceContext& context) {
    std::string header;
    header.reserve(traceparent_length);
    header.append(supported_version);
    header.push_back('-');
    header.append(context.trace_id().to_hex());
    header.push_back('-');
    header.append(context.span_id().to_hex());
    header.append(context.sampled() ? "-01" : "-00");
    return header;
}

void ContextPropagator::inject(const std::optional<TraceContext>& context, Carrier& carrier) {
    if (context) {
        inject(*context, carrier);
    }
}

void ContextPropagator::inject(const TraceContext& context, Carrier& carrier) {
    carrier[traceparent_key] = format_traceparent(context);
    if (!context.trace_state().empty()) {
        carrier[tracestate_key] = context.trace_state();
    } else {
        carrier.erase(tracestate_key);
    }
    if (!context.baggage().empty()) {
        carrier[baggage_key] = encode_baggage(context.baggage());
    } else {
        carrier.erase(baggage_key);
    }
}

void ContextPropagator::inject_with_baggage(const TraceContext& context, const Baggage& extra, Carrier& carrier) {
    inject(context.with_baggage(extra), carrier);
}

std::optional<TraceContext> ContextPropagator::extract(const Carrier& carrier) {
    auto it = carrier.find(traceparent_key);
    if (it == carrier.end()) {
        return std::nullopt;
    }

    const std::string_view header = it->second;
    if (header.size() != traceparent_length) {
        return std::nullopt;
    }

    std::array<std::string_view, 4> parts;
    if (!split_traceparent(header, parts)) {
        return std::nullopt;
    }

    const auto version = parts[0];
    const auto flags = parts[3];
    if (version != supported_version || flags.size() != 2 || !is_lower_hex(flags)) {
        return std::nullopt;
    }

    auto trace_id = TraceId::from_hex(parts[1]);
    auto span_id = SpanId::from_hex(parts[2]);
    if (!trace_id || !span_id || !trace_id->is_valid() || !span_id->is_valid()) {
        return std::nullopt;
    }

    const bool sampled = (hex_nibble(flags[1]) & 0x01) != 0;

    std::string trace_state;
    if (auto state = carrier.find(tracestate_key); state != carrier.end()) {
        trace_state = state->second;
    }

    Baggage baggage;
    if (auto entry = carrier.find(baggage_key); entry != carrier.end()) {
        baggage = decode_baggage(entry->second);
    }

    return TraceContext{*trace_id, *span_id, sampled, std::move(baggage), std::move(trace_state)};
}

std::string ContextPropagator::encode_baggage(const Baggage& baggage) {
    std::string header;
    for (const auto& [key, value] : baggage) {
        if (key.empty()) {
            continue;
        }
        if (!header.empty()) {
            header.push_back(',');
        }
        header.append(percent_encode(key));
        header.push_back('=');
        header.append(percent_encode(value));
    }
    return header;
}

Baggage ContextPropagator::decode_baggage(std::string_view header) {
    Baggage baggage;
    std::size_t start = 0;
    while (start <= header.size()) {
        std::size_t end = header.find(',', start);
        if (end == std::string_view::npos) {
            end = header.size();
        }
        std::string_view member = header.substr(start, end - start);
        start = end + 1;

        // Member properties after ';' are not carried.
        if (auto semicolon = member.find(';'); semicolon != std::string_view::npos) {
            member = member.substr(0, semicolon);
        }
        auto equals = member.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }
        auto key = percent_decode(config::Configuration::trim(member.substr(0, equals)));
        auto value = percent_decode(config::Configuration::trim(member.substr(equals + 1)));
        if (!key || !value || key->empty()) {
            continue;
        }
        baggage[*key] = *value;
    }
    return baggage;
}

}  // namespace msgtrace::core::tracing
