#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace msgtrace::core::tracing {

/**
 * @brief 128-bit trace identifier. The all-zero value is invalid.
 */
class TraceId {
public:
    static constexpr std::size_t hex_length = 32;

    constexpr TraceId() noexcept = default;
    constexpr TraceId(std::uint64_t high, std::uint64_t low) noexcept : high_(high), low_(low) {}

    // Lower-case hex only; returns nullopt on wrong length or any other character.
    [[nodiscard]] static std::optional<TraceId> from_hex(std::string_view hex);
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return high_ != 0 || low_ != 0; }
    [[nodiscard]] constexpr std::uint64_t high() const noexcept { return high_; }
    [[nodiscard]] constexpr std::uint64_t low() const noexcept { return low_; }

    friend constexpr bool operator==(const TraceId&, const TraceId&) noexcept = default;

private:
    std::uint64_t high_{0};
    std::uint64_t low_{0};
};

/**
 * @brief 64-bit span identifier. Zero is invalid.
 */
class SpanId {
public:
    static constexpr std::size_t hex_length = 16;

    constexpr SpanId() noexcept = default;
    constexpr explicit SpanId(std::uint64_t value) noexcept : value_(value) {}

    [[nodiscard]] static std::optional<SpanId> from_hex(std::string_view hex);
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ != 0; }
    [[nodiscard]] constexpr std::uint64_t value() const noexcept { return value_; }

    friend constexpr bool operator==(const SpanId&, const SpanId&) noexcept = default;

private:
    std::uint64_t value_{0};
};

using Baggage = std::map<std::string, std::string>;

/**
 * @brief Immutable position inside a trace: which trace, which span, whether the
 * trace was sampled at its root, plus baggage and opaque vendor trace state.
 *
 * A TraceContext always holds valid ids; "no context" is std::nullopt.
 */
class TraceContext {
public:
    // Throws std::invalid_argument if either id is zero. Baggage entries with an
    // empty key are dropped.
    TraceContext(TraceId trace_id, SpanId span_id, bool sampled,
                 Baggage baggage = {}, std::string trace_state = {});

    [[nodiscard]] const TraceId& trace_id() const noexcept { return trace_id_; }
    [[nodiscard]] const SpanId& span_id() const noexcept { return span_id_; }
    [[nodiscard]] bool sampled() const noexcept { return sampled_; }
    [[nodiscard]] const Baggage& baggage() const noexcept { return baggage_; }
    [[nodiscard]] const std::string& trace_state() const noexcept { return trace_state_; }

    // Same trace position with `extra` overlaid on the current baggage.
    [[nodiscard]] TraceContext with_baggage(const Baggage& extra) const;

    friend bool operator==(const TraceContext&, const TraceContext&) = default;

private:
    TraceId trace_id_;
    SpanId span_id_;
    bool sampled_;
    Baggage baggage_;
    std::string trace_state_;
};

}  // namespace msgtrace::core::tracing
