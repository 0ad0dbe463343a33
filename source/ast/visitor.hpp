#pragma once

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/call_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/identifier.hpp>
#include <ast/literal.hpp>
#include <ast/logical_expression.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const assign_expression& expr) = 0;
    virtual void visit(const binary_expression& expr) = 0;
    virtual void visit(const block_statement& stmt) = 0;
    virtual void visit(const call_expression& expr) = 0;
    virtual void visit(const expression_statement& stmt) = 0;
    virtual void visit(const function_statement& stmt) = 0;
    virtual void visit(const grouping_expression& expr) = 0;
    virtual void visit(const identifier& expr) = 0;
    virtual void visit(const if_statement& stmt) = 0;
    virtual void visit(const let_statement& stmt) = 0;
    virtual void visit(const literal& expr) = 0;
    virtual void visit(const logical_expression& expr) = 0;
    virtual void visit(const print_statement& stmt) = 0;
    virtual void visit(const return_statement& stmt) = 0;
    virtual void visit(const unary_expression& expr) = 0;
    virtual void visit(const while_statement& stmt) = 0;
};
