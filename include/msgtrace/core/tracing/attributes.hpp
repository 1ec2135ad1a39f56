#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>

namespace msgtrace::core::tracing {

using AttributeValue = std::variant<std::string, std::int64_t, double, bool>;
using Attributes = std::map<std::string, AttributeValue>;

/// Demangled type name, or the raw name if demangling fails.
[[nodiscard]] std::string demangle(const char* mangled);
[[nodiscard]] std::string type_name(const std::type_info& info);

/// Text rendering used for logs and error tags: strings verbatim, bools as true/false.
[[nodiscard]] std::string to_string(const AttributeValue& value);

namespace detail {

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

}  // namespace detail

/**
 * @brief Total conversion into the closed attribute variant.
 *
 * bool, integers, floating point and string-likes map onto their own alternative.
 * Unsigned values above INT64_MAX and every other streamable type become their
 * stream output; anything else becomes its demangled type name.
 */
template <typename T>
AttributeValue to_attribute_value(const T& value) {
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, AttributeValue>) {
        return value;
    } else if constexpr (std::is_same_v<U, bool>) {
        return value;
    } else if constexpr (std::is_integral_v<U>) {
        if constexpr (std::is_unsigned_v<U> && sizeof(U) >= sizeof(std::int64_t)) {
            if (value > static_cast<U>(std::numeric_limits<std::int64_t>::max())) {
                return std::to_string(value);
            }
        }
        return static_cast<std::int64_t>(value);
    } else if constexpr (std::is_floating_point_v<U>) {
        return static_cast<double>(value);
    } else if constexpr (std::is_convertible_v<const U&, std::string_view>) {
        return std::string(std::string_view(value));
    } else if constexpr (detail::is_streamable<U>::value) {
        std::ostringstream out;
        out << value;
        return out.str();
    } else {
        return type_name(typeid(U));
    }
}

}  // namespace msgtrace::core::tracing
