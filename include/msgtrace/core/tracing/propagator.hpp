#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "msgtrace/core/tracing/trace_context.hpp"

namespace msgtrace::core::tracing {

/// Flat message metadata. The propagator owns the keys below and leaves every other key alone.
using Carrier = std::map<std::string, std::string>;

inline constexpr const char* traceparent_key = "traceparent";
inline constexpr const char* tracestate_key = "tracestate";
inline constexpr const char* baggage_key = "baggage";

[[nodiscard]] bool is_reserved_key(std::string_view key) noexcept;

/**
 * @brief W3C trace-context codec over a Carrier.
 *
 * traceparent: "00-{trace id, 32 hex}-{span id, 16 hex}-{flags, 2 hex}", lower-case.
 * tracestate is carried verbatim; baggage uses the W3C "k=v,k=v" form with
 * percent-encoded keys and values.
 *
 * Neither operation throws on bad input: injecting an absent context writes
 * nothing, extracting from a missing or malformed carrier yields nullopt.
 */
class ContextPropagator {
public:
    static constexpr std::string_view supported_version = "00";
    static constexpr std::size_t traceparent_length = 55;

    static void inject(const std::optional<TraceContext>& context, Carrier& carrier);
    static void inject(const TraceContext& context, Carrier& carrier);
    static void inject_with_baggage(const TraceContext& context, const Baggage& extra, Carrier& carrier);

    [[nodiscard]] static std::optional<TraceContext> extract(const Carrier& carrier);

    [[nodiscard]] static std::string format_traceparent(const TraceContext& context);

    // Exposed for the propagation tests.
    [[nodiscard]] static std::string encode_baggage(const Baggage& baggage);
    [[nodiscard]] static Baggage decode_baggage(std::string_view header);
};

}  // namespace msgtrace::core::tracing
