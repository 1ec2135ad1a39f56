#include "msgtrace/core/tracing/attributes.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace msgtrace::core::tracing {

// MSVC's type_info::name() is already human-readable.
std::string demangle(const char* mangled) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> result{
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free};
    if (status != 0 || !result) {
        return mangled;
    }
    return result.get();
#else
    return mangled;
#endif
}

std::string type_name(const std::type_info& info) {
    return demangle(info.name());
}

std::string to_string(const AttributeValue& value) {
    return std::visit(
        [](const auto& alternative) -> std::string {
            using V = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<V, std::string>) {
                return alternative;
            } else if constexpr (std::is_same_v<V, bool>) {
                return alternative ? "true" : "false";
            } else if constexpr (std::is_same_v<V, double>) {
                std::ostringstream out;
                out << alternative;
                return out.str();
            } else {
                return std::to_string(alternative);
            }
        },
        value);
}

}  // namespace msgtrace::core::tracing
