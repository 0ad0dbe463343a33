#include <string>

#include "statements.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "util.hpp"
#include "visitor.hpp"

auto let_statement::string() const -> std::string
{
    if (initializer) {
        return fmt::format("let {} = {};", name, initializer->string());
    }
    return fmt::format("let {};", name);
}

void let_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto function_statement::string() const -> std::string
{
    return fmt::format("fn {}({}) {{ {} }}", name, fmt::join(parameters, ", "), join(body, " "));
}

void function_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto expression_statement::string() const -> std::string
{
    return fmt::format("{};", expr->string());
}

void expression_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto print_statement::string() const -> std::string
{
    return fmt::format("print {};", expr->string());
}

void print_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto return_statement::string() const -> std::string
{
    if (value) {
        return fmt::format("return {};", value->string());
    }
    return "return;";
}

void return_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto if_statement::string() const -> std::string
{
    if (alternative) {
        return fmt::format(
            "if {} {} else {}", condition->string(), consequence->string(), alternative->string());
    }
    return fmt::format("if {} {}", condition->string(), consequence->string());
}

void if_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto while_statement::string() const -> std::string
{
    return fmt::format("while {} {}", condition->string(), body->string());
}

void while_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto block_statement::string() const -> std::string
{
    return fmt::format("{{ {} }}", join(body, " "));
}

void block_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
