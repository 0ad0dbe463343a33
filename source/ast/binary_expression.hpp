#pragma once

#include <string>
#include <utility>

#include <lexer/location.hpp>
#include <lexer/token_type.hpp>

#include "expression.hpp"

struct binary_expression final : expression
{
    binary_expression(expression_ptr lhs, token_type oper, expression_ptr rhs, location loc)
        : expression {loc}
        , left {std::move(lhs)}
        , op {oper}
        , right {std::move(rhs)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr left;
    token_type op;
    expression_ptr right;
};
