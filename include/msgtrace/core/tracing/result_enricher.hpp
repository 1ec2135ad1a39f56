#pragma once

#include <any>
#include <string>

#include "msgtrace/core/tracing/message.hpp"
#include "msgtrace/core/tracing/span.hpp"

namespace msgtrace::core::tracing {

/**
 * @brief Records what a handler returned.
 *
 * `{kind}.result_type` is "void" for an empty result, else the demangled type
 * name. Strings, booleans and arithmetic values are also recorded as
 * `{kind}.result`.
 */
void enrich_with_result(Span& span, MessageKind kind, const std::any& result);

// "void" for an empty result, else the demangled type name of its value.
[[nodiscard]] std::string result_type_name(const std::any& result);

}  // namespace msgtrace::core::tracing
