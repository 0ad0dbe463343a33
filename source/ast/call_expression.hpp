#pragma once

#include <string>
#include <utility>

#include <lexer/location.hpp>

#include "expression.hpp"

struct call_expression final : expression
{
    call_expression(expression_ptr function, expressions args, location loc)
        : expression {loc}
        , callee {std::move(function)}
        , arguments {std::move(args)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr callee;
    expressions arguments;
};
