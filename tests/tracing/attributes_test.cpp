#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

#include "msgtrace/core/tracing/attributes.hpp"

using namespace msgtrace::core::tracing;

namespace {

struct OrderId {
    int value;
};

std::ostream& operator<<(std::ostream& out, const OrderId& id) {
    return out << "order-" << id.value;
}

struct Opaque {};

}  // namespace

TEST_CASE("Values map onto attribute alternatives", "[tracing][attributes]") {
    REQUIRE(std::get<bool>(to_attribute_value(true)));
    REQUIRE(std::get<std::int64_t>(to_attribute_value(42)) == 42);
    REQUIRE(std::get<std::int64_t>(to_attribute_value(std::uint16_t{7})) == 7);
    REQUIRE(std::get<double>(to_attribute_value(2.5f)) == 2.5);
    REQUIRE(std::get<std::string>(to_attribute_value("text")) == "text");
    REQUIRE(std::get<std::string>(to_attribute_value(std::string{"owned"})) == "owned");
}

TEST_CASE("Values outside the alternatives", "[tracing][attributes]") {
    SECTION("Large unsigned values become strings") {
        auto value = to_attribute_value(std::numeric_limits<std::uint64_t>::max());
        REQUIRE(std::get<std::string>(value) == "18446744073709551615");
    }

    SECTION("Streamable types use their stream output") {
        REQUIRE(std::get<std::string>(to_attribute_value(OrderId{12})) == "order-12");
    }

    SECTION("Other types become their type name") {
        auto value = std::get<std::string>(to_attribute_value(Opaque{}));
        REQUIRE(value.find("Opaque") != std::string::npos);
    }
}

TEST_CASE("Attribute text rendering", "[tracing][attributes]") {
    REQUIRE(to_string(AttributeValue{std::string{"abc"}}) == "abc");
    REQUIRE(to_string(AttributeValue{std::int64_t{-3}}) == "-3");
    REQUIRE(to_string(AttributeValue{false}) == "false");
    REQUIRE(to_string(AttributeValue{0.5}) == "0.5");
    REQUIRE(type_name(typeid(int)) == "int");
}

TEST_CASE("Type names", "[tracing][attributes]") {
    REQUIRE(type_name(typeid(std::string)).find("basic_string") != std::string::npos);
    REQUIRE(type_name(typeid(std::runtime_error)).find("runtime_error") != std::string::npos);
    // Text that is not a mangled name comes back unchanged.
    REQUIRE(demangle("not a mangled name") == "not a mangled name");
}
