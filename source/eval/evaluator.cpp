#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "evaluator.hpp"

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
#include <builtin/builtin.hpp>
#include <error.hpp>
#include <fmt/ostream.h>
#include <lexer/location.hpp>
#include <lexer/token_type.hpp>
#include <overloaded.hpp>

#include "environment.hpp"
#include "gc.hpp"
#include "object.hpp"

namespace
{
constexpr std::size_t max_call_depth = 1024;

auto number_operands(token_type oper, const object& left, const object& right, const location& loc)
    -> std::pair<double, double>
{
    if (!left.is<double>() || !right.is<double>()) {
        fail<eval_error>(loc, "operands must be numbers for operator '{}'", oper);
    }
    return {left.as<double>(), right.as<double>()};
}

auto apply_binary_operator(token_type oper, const object& left, const object& right, const location& loc) -> object
{
    using enum token_type;
    switch (oper) {
        case plus:
            if (left.is<double>() && right.is<double>()) {
                return {left.as<double>() + right.as<double>()};
            }
            if (left.is<std::string>() || right.is<std::string>()) {
                return {left.inspect() + right.inspect()};
            }
            fail<eval_error>(loc, "operands must be two numbers or one must be a string");
        case minus: {
            const auto [lhs, rhs] = number_operands(oper, left, right, loc);
            return {lhs - rhs};
        }
        case asterisk: {
            const auto [lhs, rhs] = number_operands(oper, left, right, loc);
            return {lhs * rhs};
        }
        case slash: {
            const auto [lhs, rhs] = number_operands(oper, left, right, loc);
            if (rhs == 0.0) {
                fail<eval_error>(loc, "division by zero");
            }
            return {lhs / rhs};
        }
        case greater_than: {
            const auto [lhs, rhs] = number_operands(oper, left, right, loc);
            return {lhs > rhs};
        }
        case greater_equal: {
            const auto [lhs, rhs] = number_operands(oper, left, right, loc);
            return {lhs >= rhs};
        }
        case less_than: {
            const auto [lhs, rhs] = number_operands(oper, left, right, loc);
            return {lhs < rhs};
        }
        case less_equal: {
            const auto [lhs, rhs] = number_operands(oper, left, right, loc);
            return {lhs <= rhs};
        }
        case equals:
            return {left == right};
        case not_equals:
            return {!(left == right)};
        default:
            fail<eval_error>(loc, "unknown operator: {} {} {}", left.type(), oper, right.type());
    }
}

}  // namespace

evaluator::evaluator(environment* env, gc& heap, std::ostream& out, std::size_t depth)
    : m_env {env}
    , m_heap {heap}
    , m_out {out}
    , m_depth {depth}
{
    m_heap.push_scope(m_env);
}

evaluator::~evaluator()
{
    m_heap.pop_scope();
}

auto evaluator::execute(const statement& stmt) -> completion
{
    m_heap.collect_if_needed();
    m_completion = {};
    stmt.accept(*this);
    return std::move(m_completion);
}

auto evaluator::execute_block(const statements& stmts) -> completion
{
    for (const auto& stmt : stmts) {
        auto result = execute(*stmt);
        if (result.type == completion_type::returned) {
            return result;
        }
    }
    return {};
}

auto evaluator::evaluate(const expression& expr) -> object
{
    expr.accept(*this);
    return std::move(m_result);
}

void evaluator::visit(const let_statement& stmt)
{
    auto val = stmt.initializer ? evaluate(*stmt.initializer) : object {};
    m_env->define(stmt.name, std::move(val));
}

void evaluator::visit(const function_statement& stmt)
{
    m_env->define(stmt.name, object {bound_function {.declaration = &stmt, .closure = m_env}});
}

void evaluator::visit(const expression_statement& stmt)
{
    evaluate(*stmt.expr);
}

void evaluator::visit(const print_statement& stmt)
{
    const auto val = evaluate(*stmt.expr);
    fmt::print(m_out, "{}\n", val.inspect());
}

void evaluator::visit(const return_statement& stmt)
{
    auto val = stmt.value ? evaluate(*stmt.value) : object {};
    m_completion = {.type = completion_type::returned, .value = std::move(val)};
}

void evaluator::visit(const if_statement& stmt)
{
    if (evaluate(*stmt.condition).is_truthy()) {
        m_completion = execute(*stmt.consequence);
        return;
    }
    if (stmt.alternative) {
        m_completion = execute(*stmt.alternative);
    }
}

void evaluator::visit(const while_statement& stmt)
{
    while (evaluate(*stmt.condition).is_truthy()) {
        auto result = execute(*stmt.body);
        if (result.type == completion_type::returned) {
            m_completion = std::move(result);
            return;
        }
    }
}

void evaluator::visit(const block_statement& stmt)
{
    evaluator inner {m_heap.make_environment(m_env), m_heap, m_out, m_depth};
    m_completion = inner.execute_block(stmt.body);
}

void evaluator::visit(const literal& expr)
{
    m_result = std::visit([](const auto& val) { return object {val}; }, expr.value);
}

void evaluator::visit(const identifier& expr)
{
    m_result = m_env->get(expr.value, expr.loc());
}

void evaluator::visit(const assign_expression& expr)
{
    auto val = evaluate(*expr.value);
    m_env->assign(expr.name, val, expr.loc());
    m_result = std::move(val);
}

void evaluator::visit(const grouping_expression& expr)
{
    m_result = evaluate(*expr.inner);
}

void evaluator::visit(const unary_expression& expr)
{
    const auto right = evaluate(*expr.right);
    using enum token_type;
    switch (expr.op) {
        case minus:
            if (!right.is<double>()) {
                fail<eval_error>(expr.loc(), "operand must be a number for operator '-'");
            }
            m_result = object {-right.as<double>()};
            return;
        case exclamation:
            m_result = object {!right.is_truthy()};
            return;
        default:
            fail<eval_error>(expr.loc(), "unknown operator: {}{}", expr.op, right.type());
    }
}

void evaluator::visit(const binary_expression& expr)
{
    const auto left = evaluate(*expr.left);
    root_scope roots {m_heap};
    roots.add(left);
    const auto right = evaluate(*expr.right);
    m_result = apply_binary_operator(expr.op, left, right, expr.loc());
}

void evaluator::visit(const logical_expression& expr)
{
    auto left = evaluate(*expr.left);
    if (expr.op == token_type::logical_or) {
        if (left.is_truthy()) {
            m_result = std::move(left);
            return;
        }
    } else if (!left.is_truthy()) {
        m_result = std::move(left);
        return;
    }
    m_result = evaluate(*expr.right);
}

void evaluator::visit(const call_expression& expr)
{
    auto callee = evaluate(*expr.callee);
    if (!callee.is<bound_function>() && !callee.is<builtin_function>()) {
        fail<eval_error>(expr.loc(), "can only call functions, got {}", callee.type());
    }
    root_scope roots {m_heap};
    roots.add(callee);
    std::vector<object> args;
    args.reserve(expr.arguments.size());
    for (const auto& argument : expr.arguments) {
        roots.add(args.emplace_back(evaluate(*argument)));
    }
    apply_function(callee, std::move(args), expr);
}

void evaluator::apply_function(const object& callee, std::vector<object>&& args, const call_expression& expr)
{
    std::visit(
        overloaded {
            [&](const bound_function& func)
            {
                const auto& parameters = func.declaration->parameters;
                if (args.size() != parameters.size()) {
                    fail<eval_error>(
                        expr.loc(), "expected {} arguments but got {}", parameters.size(), args.size());
                }
                if (m_depth + 1 > max_call_depth) {
                    fail<eval_error>(expr.loc(), "stack overflow calling {}", func.declaration->name);
                }
                auto* locals = m_heap.make_environment(func.closure);
                for (auto arg_itr = args.begin(); const auto& parameter : parameters) {
                    locals->define(parameter, std::move(*(arg_itr++)));
                }
                evaluator frame {locals, m_heap, m_out, m_depth + 1};
                auto result = frame.execute_block(func.declaration->body);
                m_result = result.type == completion_type::returned ? std::move(result.value) : object {};
            },
            [&](const builtin_function& func)
            {
                if (args.size() != func.native->arity) {
                    fail<eval_error>(
                        expr.loc(), "expected {} arguments but got {}", func.native->arity, args.size());
                }
                m_result = func.native->body(args);
            },
            [&](const auto& /*not callable*/)
            { fail<eval_error>(expr.loc(), "can only call functions, got {}", callee.type()); },
        },
        callee.value);
}
