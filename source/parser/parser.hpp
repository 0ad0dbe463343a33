#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

/// Recursive-descent parser over a fully scanned token sequence.
///
/// Each precedence level of the expression grammar is one member function;
/// the binary levels fold their operands into left-leaning trees. The first
/// grammar violation throws a parse_error, there is no recovery.
class parser final
{
  public:
    explicit parser(std::vector<token> tokens);
    auto parse_program() -> program_ptr;

  private:
    using operand_parser = expression_ptr (parser::*)();

    auto parse_declaration() -> statement_ptr;
    auto parse_let_statement() -> statement_ptr;
    auto parse_function_statement() -> statement_ptr;
    auto parse_function_parameters() -> std::vector<std::string>;
    auto parse_statement() -> statement_ptr;
    auto parse_if_statement() -> statement_ptr;
    auto parse_while_statement() -> statement_ptr;
    auto parse_for_statement() -> statement_ptr;
    auto parse_print_statement() -> statement_ptr;
    auto parse_return_statement() -> statement_ptr;
    auto parse_block_statement() -> statements;
    auto parse_expression_statement() -> statement_ptr;

    auto parse_expression() -> expression_ptr;
    auto parse_assignment() -> expression_ptr;
    auto parse_logical_or() -> expression_ptr;
    auto parse_logical_and() -> expression_ptr;
    auto parse_equality() -> expression_ptr;
    auto parse_comparison() -> expression_ptr;
    auto parse_term() -> expression_ptr;
    auto parse_factor() -> expression_ptr;
    auto parse_unary() -> expression_ptr;
    auto parse_call() -> expression_ptr;
    auto parse_call_arguments(expression_ptr callee) -> expression_ptr;
    auto parse_primary() -> expression_ptr;

    template<typename Node>
    auto parse_left_associative(std::initializer_list<token_type> operators, operand_parser operand)
        -> expression_ptr;

    [[nodiscard]] auto current() const -> const token&;
    [[nodiscard]] auto previous() const -> const token&;
    [[nodiscard]] auto at_end() const -> bool;
    [[nodiscard]] auto current_token_is(token_type type) const -> bool;
    auto match(std::initializer_list<token_type> types) -> bool;
    auto next_token() -> const token&;
    auto expect(token_type type, std::string_view context) -> const token&;
    [[noreturn]] auto unsupported(const token& tok) const -> void;

    std::vector<token> m_tokens;
    std::size_t m_current {0};
};
