#pragma once

#include <string>
#include <utility>

#include <lexer/location.hpp>

#include "expression.hpp"

struct grouping_expression final : expression
{
    grouping_expression(expression_ptr expr, location loc)
        : expression {loc}
        , inner {std::move(expr)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr inner;
};
