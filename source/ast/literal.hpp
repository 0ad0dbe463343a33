#pragma once

#include <string>
#include <utility>
#include <variant>

#include <lexer/location.hpp>

#include "expression.hpp"

struct literal final : expression
{
    using value_type = std::variant<std::monostate, bool, double, std::string>;

    literal(value_type val, location loc)
        : expression {loc}
        , value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    value_type value;
};
