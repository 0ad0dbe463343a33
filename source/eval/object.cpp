#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

#include "object.hpp"

#include <ast/statements.hpp>
#include <ast/util.hpp>
#include <builtin/builtin.hpp>
#include <fmt/format.h>
#include <overloaded.hpp>

auto object::type() const -> object_type
{
    return std::visit(overloaded {
                          [](const null_type&) { return object_type::null; },
                          [](const bool) { return object_type::boolean; },
                          [](const double) { return object_type::number; },
                          [](const std::string&) { return object_type::string; },
                          [](const bound_function&) { return object_type::function; },
                          [](const builtin_function&) { return object_type::builtin; },
                      },
                      value);
}

// Only nil and false are falsy, zero and the empty string are truthy.
auto object::is_truthy() const -> bool
{
    return std::visit(overloaded {
                          [](const null_type&) { return false; },
                          [](const bool val) { return val; },
                          [](const double) { return true; },
                          [](const std::string&) { return true; },
                          [](const bound_function&) { return true; },
                          [](const builtin_function&) { return true; },
                      },
                      value);
}

auto object::inspect() const -> std::string
{
    return std::visit(
        overloaded {
            [](const null_type&) -> std::string { return "nil"; },
            [](const bool val) -> std::string { return val ? "true" : "false"; },
            [](const double val) -> std::string { return decimal_to_string(val); },
            [](const std::string& val) -> std::string { return val; },
            [](const bound_function& func) -> std::string { return fmt::format("<fn {}>", func.declaration->name); },
            [](const builtin_function& func) -> std::string { return fmt::format("<native fn {}>", func.native->name); },
        },
        value);
}

auto operator==(const object& lhs, const object& rhs) -> bool
{
    return std::visit(
        []<typename L, typename R>(const L& left, const R& right) -> bool
        {
            if constexpr (std::is_same_v<L, R>) {
                return left == right;
            } else {
                return false;
            }
        },
        lhs.value,
        rhs.value);
}

auto operator<<(std::ostream& ostrm, object::object_type type) -> std::ostream&
{
    using enum object::object_type;
    switch (type) {
        case null:
            return ostrm << "nil";
        case boolean:
            return ostrm << "boolean";
        case number:
            return ostrm << "number";
        case string:
            return ostrm << "string";
        case function:
            return ostrm << "function";
        case builtin:
            return ostrm << "builtin";
    }
    return ostrm << "unknown";
}
