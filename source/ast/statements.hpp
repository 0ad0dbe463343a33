#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <lexer/location.hpp>

#include "expression.hpp"

struct statement
{
    explicit statement(location loc)
        : l {loc}
    {
    }

    virtual ~statement() = default;
    statement(const statement&) = delete;
    statement(statement&&) = delete;
    auto operator=(const statement&) -> statement& = delete;
    auto operator=(statement&&) -> statement& = delete;

    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(struct visitor& visitor) const = 0;

    [[nodiscard]] auto loc() const { return l; }

    location l;
};

using statement_ptr = std::unique_ptr<statement>;
using statements = std::vector<statement_ptr>;

struct let_statement final : statement
{
    let_statement(std::string nam, expression_ptr init, location loc)
        : statement {loc}
        , name {std::move(nam)}
        , initializer {std::move(init)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string name;
    expression_ptr initializer;
};

struct function_statement final : statement
{
    function_statement(std::string nam, std::vector<std::string> params, statements bod, location loc)
        : statement {loc}
        , name {std::move(nam)}
        , parameters {std::move(params)}
        , body {std::move(bod)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string name;
    std::vector<std::string> parameters;
    statements body;
};

struct expression_statement final : statement
{
    expression_statement(expression_ptr exp, location loc)
        : statement {loc}
        , expr {std::move(exp)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};

struct print_statement final : statement
{
    print_statement(expression_ptr exp, location loc)
        : statement {loc}
        , expr {std::move(exp)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};

struct return_statement final : statement
{
    return_statement(expression_ptr val, location loc)
        : statement {loc}
        , value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr value;
};

struct if_statement final : statement
{
    if_statement(expression_ptr cond, statement_ptr then, statement_ptr otherwise, location loc)
        : statement {loc}
        , condition {std::move(cond)}
        , consequence {std::move(then)}
        , alternative {std::move(otherwise)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    statement_ptr consequence;
    statement_ptr alternative;
};

struct while_statement final : statement
{
    while_statement(expression_ptr cond, statement_ptr bod, location loc)
        : statement {loc}
        , condition {std::move(cond)}
        , body {std::move(bod)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    statement_ptr body;
};

struct block_statement final : statement
{
    block_statement(statements stmts, location loc)
        : statement {loc}
        , body {std::move(stmts)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    statements body;
};
