#pragma once

#include <string>
#include <utility>

#include <lexer/location.hpp>

#include "expression.hpp"

struct assign_expression final : expression
{
    assign_expression(std::string nam, expression_ptr val, location loc)
        : expression {loc}
        , name {std::move(nam)}
        , value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string name;
    expression_ptr value;
};
