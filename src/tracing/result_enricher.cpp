#include "msgtrace/core/tracing/result_enricher.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <typeinfo>
#include <utility>

namespace msgtrace::core::tracing {
namespace {

template <typename T>
bool try_primitive(const std::any& result, std::optional<AttributeValue>& out) {
    if (const auto* value = std::any_cast<T>(&result)) {
        out = to_attribute_value(*value);
        return true;
    }
    return false;
}

std::optional<AttributeValue> primitive_value(const std::any& result) {
    std::optional<AttributeValue> value;
    if (try_primitive<std::string>(result, value) || try_primitive<const char*>(result, value) ||
        try_primitive<bool>(result, value) || try_primitive<int>(result, value) ||
        try_primitive<long>(result, value) || try_primitive<long long>(result, value) ||
        try_primitive<unsigned>(result, value) || try_primitive<unsigned long>(result, value) ||
        try_primitive<unsigned long long>(result, value) || try_primitive<double>(result, value) ||
        try_primitive<float>(result, value)) {
        return value;
    }
    return std::nullopt;
}

}  // namespace

void enrich_with_result(Span& span, MessageKind kind, const std::any& result) {
    const std::string prefix{to_string(kind)};
    span.set_attribute(prefix + ".result_type", result_type_name(result));
    if (auto value = primitive_value(result)) {
        span.set_attribute(prefix + ".result", std::move(*value));
    }
}

std::string result_type_name(const std::any& result) {
    if (!result.has_value()) {
        return "void";
    }
    // std::string demangles to its allocator-laden full name.
    if (result.type() == typeid(std::string)) {
        return "std::string";
    }
    return type_name(result.type());
}

}  // namespace msgtrace::core::tracing
