#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include <ast/expression.hpp>
#include <ast/statements.hpp>
#include <ast/visitor.hpp>

#include "environment.hpp"
#include "gc.hpp"
#include "object.hpp"

enum class completion_type : std::uint8_t
{
    normal,
    returned,
};

/// Outcome of executing a statement. A `returned` completion carries the
/// function result outwards through enclosing blocks and loops.
struct completion
{
    completion_type type {completion_type::normal};
    object value {};
};

/// Executes statements and evaluates expressions against one environment.
///
/// Entering a block or calling a function creates a nested evaluator bound to
/// the new scope, so the environment of an evaluator never changes and is
/// still intact after an error unwinds out of the nested scope. While alive,
/// an evaluator keeps its scope registered as a root of the gc.
struct evaluator final : visitor
{
    evaluator(environment* env, gc& heap, std::ostream& out, std::size_t depth = 0);
    evaluator(const evaluator&) = delete;
    evaluator(evaluator&&) = delete;
    auto operator=(const evaluator&) -> evaluator& = delete;
    auto operator=(evaluator&&) -> evaluator& = delete;
    ~evaluator() override;

    auto execute(const statement& stmt) -> completion;
    auto execute_block(const statements& stmts) -> completion;
    auto evaluate(const expression& expr) -> object;

  protected:
    void visit(const assign_expression& expr) final;
    void visit(const binary_expression& expr) final;
    void visit(const block_statement& stmt) final;
    void visit(const call_expression& expr) final;
    void visit(const expression_statement& stmt) final;
    void visit(const function_statement& stmt) final;
    void visit(const grouping_expression& expr) final;
    void visit(const identifier& expr) final;
    void visit(const if_statement& stmt) final;
    void visit(const let_statement& stmt) final;
    void visit(const literal& expr) final;
    void visit(const logical_expression& expr) final;
    void visit(const print_statement& stmt) final;
    void visit(const return_statement& stmt) final;
    void visit(const unary_expression& expr) final;
    void visit(const while_statement& stmt) final;

  private:
    void apply_function(const object& callee, std::vector<object>&& args, const call_expression& expr);

    environment* m_env;
    gc& m_heap;
    std::ostream& m_out;
    std::size_t m_depth;
    object m_result {};
    completion m_completion {};
};
