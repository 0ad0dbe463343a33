#pragma once

#include <string>
#include <utility>

#include <lexer/location.hpp>
#include <lexer/token_type.hpp>

#include "expression.hpp"

struct unary_expression final : expression
{
    unary_expression(token_type oper, expression_ptr rhs, location loc)
        : expression {loc}
        , op {oper}
        , right {std::move(rhs)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token_type op;
    expression_ptr right;
};
