#include "msgtrace/core/tracing/trace_context.hpp"

#include <stdexcept>
#include <utility>

namespace msgtrace::core::tracing {
namespace {

constexpr char hex_digits[] = "0123456789abcdef";

int hex_value(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    return -1;
}

bool parse_u64(std::string_view hex, std::uint64_t& out) noexcept {
    std::uint64_t value = 0;
    for (char ch : hex) {
        int digit = hex_value(ch);
        if (digit < 0) {
            return false;
        }
        value = (value << 4) | static_cast<std::uint64_t>(digit);
    }
    out = value;
    return true;
}

void append_u64(std::string& out, std::uint64_t value) {
    for (int shift = 60; shift >= 0; shift -= 4) {
        out.push_back(hex_digits[(value >> shift) & 0xF]);
    }
}

}  // namespace

std::optional<TraceId> TraceId::from_hex(std::string_view hex) {
    if (hex.size() != hex_length) {
        return std::nullopt;
    }
    std::uint64_t high = 0;
    std::uint64_t low = 0;
    if (!parse_u64(hex.substr(0, 16), high) || !parse_u64(hex.substr(16), low)) {
        return std::nullopt;
    }
    return TraceId{high, low};
}

std::string TraceId::to_hex() const {
    std::string out;
    out.reserve(hex_length);
    append_u64(out, high_);
    append_u64(out, low_);
    return out;
}

std::optional<SpanId> SpanId::from_hex(std::string_view hex) {
    if (hex.size() != hex_length) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    if (!parse_u64(hex, value)) {
        return std::nullopt;
    }
    return SpanId{value};
}

std::string SpanId::to_hex() const {
    std::string out;
    out.reserve(hex_length);
    append_u64(out, value_);
    return out;
}

TraceContext::TraceContext(TraceId trace_id, SpanId span_id, bool sampled,
                           Baggage baggage, std::string trace_state)
    : trace_id_(trace_id),
      span_id_(span_id),
      sampled_(sampled),
      baggage_(std::move(baggage)),
      trace_state_(std::move(trace_state)) {
    if (!trace_id_.is_valid() || !span_id_.is_valid()) {
        throw std::invalid_argument("TraceContext requires non-zero trace and span ids");
    }
    // A baggage member needs a key to be propagated.
    std::erase_if(baggage_, [](const auto& entry) { return entry.first.empty(); });
}

TraceContext TraceContext::with_baggage(const Baggage& extra) const {
    Baggage merged = baggage_;
    for (const auto& [key, value] : extra) {
        merged[key] = value;
    }
    return TraceContext{trace_id_, span_id_, sampled_, std::move(merged), trace_state_};
}

}  // namespace msgtrace::core::tracing
