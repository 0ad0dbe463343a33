#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include <fmt/ostream.h>

struct function_statement;
struct builtin;
struct environment;

using null_type = std::monostate;

/// A user function together with the scope it was declared in.
struct bound_function
{
    const function_statement* declaration {};
    environment* closure {};
    auto operator==(const bound_function& other) const -> bool = default;
};

struct builtin_function
{
    const builtin* native {};
    auto operator==(const builtin_function& other) const -> bool = default;
};

using value_type = std::variant<null_type, bool, double, std::string, bound_function, builtin_function>;

struct object
{
    enum class object_type : std::uint8_t
    {
        null,
        boolean,
        number,
        string,
        function,
        builtin,
    };

    object() = default;

    object(value_type val)  // NOLINT(google-explicit-constructor)
        : value {std::move(val)}
    {
    }

    template<typename T>
    [[nodiscard]] auto is() const -> bool
    {
        return std::holds_alternative<T>(value);
    }

    [[nodiscard]] auto is_null() const -> bool { return is<null_type>(); }

    // throws std::bad_variant_access when the value holds another type
    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        return std::get<T>(value);
    }

    [[nodiscard]] auto type() const -> object_type;
    [[nodiscard]] auto is_truthy() const -> bool;
    [[nodiscard]] auto inspect() const -> std::string;

    value_type value;
};

auto operator==(const object& lhs, const object& rhs) -> bool;

auto operator<<(std::ostream& ostrm, object::object_type type) -> std::ostream&;

template<>
struct fmt::formatter<object::object_type> : ostream_formatter
{
};
