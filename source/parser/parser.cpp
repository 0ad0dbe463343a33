#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "parser.hpp"

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/call_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/identifier.hpp>
#include <ast/literal.hpp>
#include <ast/logical_expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <error.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
constexpr std::size_t max_arguments = 255;

auto token_text(const token& tok) -> std::string_view
{
    if (tok.type == token_type::eof) {
        return "end of input";
    }
    return tok.lexeme;
}
}  // namespace

parser::parser(std::vector<token> tokens)
    : m_tokens {std::move(tokens)}
{
    if (m_tokens.empty() || m_tokens.back().type != token_type::eof) {
        const auto loc = m_tokens.empty() ? location {} : m_tokens.back().loc;
        m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .loc = loc});
    }
}

auto parser::parse_program() -> program_ptr
{
    statements stmts;
    while (!at_end()) {
        stmts.push_back(parse_declaration());
    }
    return std::make_unique<program>(std::move(stmts));
}

auto parser::parse_declaration() -> statement_ptr
{
    if (match({token_type::let})) {
        return parse_let_statement();
    }
    if (match({token_type::function})) {
        return parse_function_statement();
    }
    return parse_statement();
}

auto parser::parse_let_statement() -> statement_ptr
{
    using enum token_type;
    const auto loc = previous().loc;
    const auto& name = expect(ident, "variable name");
    expression_ptr initializer;
    if (match({assign})) {
        initializer = parse_expression();
    }
    expect(semicolon, "after variable declaration");
    return std::make_unique<let_statement>(std::string {name.lexeme}, std::move(initializer), loc);
}

auto parser::parse_function_statement() -> statement_ptr
{
    using enum token_type;
    const auto loc = previous().loc;
    const auto& name = expect(ident, "function name");
    expect(lparen, "after function name");
    auto parameters = parse_function_parameters();
    expect(lsquirly, "before function body");
    auto body = parse_block_statement();
    return std::make_unique<function_statement>(
        std::string {name.lexeme}, std::move(parameters), std::move(body), loc);
}

auto parser::parse_function_parameters() -> std::vector<std::string>
{
    using enum token_type;
    std::vector<std::string> parameters;
    if (!current_token_is(rparen)) {
        do {
            if (parameters.size() >= max_arguments) {
                fail<parse_error>(current().loc, "cannot have more than {} parameters", max_arguments);
            }
            parameters.emplace_back(expect(ident, "parameter name").lexeme);
        } while (match({comma}));
    }
    expect(rparen, "after parameters");
    return parameters;
}

auto parser::parse_statement() -> statement_ptr
{
    using enum token_type;
    if (is_reserved(current().type)) {
        unsupported(current());
    }
    if (match({fore})) {
        return parse_for_statement();
    }
    if (match({print})) {
        return parse_print_statement();
    }
    if (match({ret})) {
        return parse_return_statement();
    }
    if (match({eef})) {
        return parse_if_statement();
    }
    if (match({hwile})) {
        return parse_while_statement();
    }
    if (match({lsquirly})) {
        const auto loc = previous().loc;
        return std::make_unique<block_statement>(parse_block_statement(), loc);
    }
    return parse_expression_statement();
}

auto parser::parse_if_statement() -> statement_ptr
{
    using enum token_type;
    const auto loc = previous().loc;
    expect(lparen, "after 'if'");
    auto condition = parse_expression();
    expect(rparen, "after if condition");
    auto consequence = parse_statement();
    statement_ptr alternative;
    if (match({elze})) {
        alternative = parse_statement();
    }
    return std::make_unique<if_statement>(std::move(condition), std::move(consequence), std::move(alternative), loc);
}

auto parser::parse_while_statement() -> statement_ptr
{
    using enum token_type;
    const auto loc = previous().loc;
    expect(lparen, "after 'while'");
    auto condition = parse_expression();
    expect(rparen, "after while condition");
    auto body = parse_statement();
    return std::make_unique<while_statement>(std::move(condition), std::move(body), loc);
}

// for (init; cond; incr) body  becomes  { init; while (cond) { body; incr; } }
auto parser::parse_for_statement() -> statement_ptr
{
    using enum token_type;
    const auto loc = previous().loc;
    expect(lparen, "after 'for'");

    statement_ptr initializer;
    if (match({semicolon})) {
        initializer = nullptr;
    } else if (match({let})) {
        initializer = parse_let_statement();
    } else {
        initializer = parse_expression_statement();
    }

    expression_ptr condition;
    if (!current_token_is(semicolon)) {
        condition = parse_expression();
    }
    expect(semicolon, "after loop condition");

    expression_ptr increment;
    if (!current_token_is(rparen)) {
        increment = parse_expression();
    }
    expect(rparen, "after for clauses");

    auto body = parse_statement();

    if (increment) {
        const auto increment_loc = increment->loc();
        statements body_with_increment;
        body_with_increment.push_back(std::move(body));
        body_with_increment.push_back(std::make_unique<expression_statement>(std::move(increment), increment_loc));
        body = std::make_unique<block_statement>(std::move(body_with_increment), loc);
    }
    if (!condition) {
        condition = std::make_unique<literal>(true, loc);
    }

    statements desugared;
    if (initializer) {
        desugared.push_back(std::move(initializer));
    }
    desugared.push_back(std::make_unique<while_statement>(std::move(condition), std::move(body), loc));
    return std::make_unique<block_statement>(std::move(desugared), loc);
}

auto parser::parse_print_statement() -> statement_ptr
{
    const auto loc = previous().loc;
    auto value = parse_expression();
    expect(token_type::semicolon, "after value");
    return std::make_unique<print_statement>(std::move(value), loc);
}

auto parser::parse_return_statement() -> statement_ptr
{
    using enum token_type;
    const auto loc = previous().loc;
    expression_ptr value;
    if (!current_token_is(semicolon)) {
        value = parse_expression();
    }
    expect(semicolon, "after return value");
    return std::make_unique<return_statement>(std::move(value), loc);
}

auto parser::parse_block_statement() -> statements
{
    using enum token_type;
    statements block;
    while (!current_token_is(rsquirly) && !at_end()) {
        block.push_back(parse_declaration());
    }
    expect(rsquirly, "after block");
    return block;
}

auto parser::parse_expression_statement() -> statement_ptr
{
    const auto loc = current().loc;
    auto expr = parse_expression();
    expect(token_type::semicolon, "after expression");
    return std::make_unique<expression_statement>(std::move(expr), loc);
}

auto parser::parse_expression() -> expression_ptr
{
    return parse_assignment();
}

auto parser::parse_assignment() -> expression_ptr
{
    auto expr = parse_logical_or();
    if (match({token_type::assign})) {
        const auto loc = previous().loc;
        auto value = parse_assignment();
        if (const auto* target = dynamic_cast<const identifier*>(expr.get()); target != nullptr) {
            return std::make_unique<assign_expression>(target->value, std::move(value), target->loc());
        }
        fail<parse_error>(loc, "invalid assignment target");
    }
    return expr;
}

template<typename Node>
auto parser::parse_left_associative(std::initializer_list<token_type> operators, operand_parser operand)
    -> expression_ptr
{
    auto left = (this->*operand)();
    while (match(operators)) {
        const auto& oper = previous();
        auto right = (this->*operand)();
        left = std::make_unique<Node>(std::move(left), oper.type, std::move(right), oper.loc);
    }
    return left;
}

auto parser::parse_logical_or() -> expression_ptr
{
    return parse_left_associative<logical_expression>({token_type::logical_or}, &parser::parse_logical_and);
}

auto parser::parse_logical_and() -> expression_ptr
{
    return parse_left_associative<logical_expression>({token_type::logical_and}, &parser::parse_equality);
}

auto parser::parse_equality() -> expression_ptr
{
    using enum token_type;
    return parse_left_associative<binary_expression>({equals, not_equals}, &parser::parse_comparison);
}

auto parser::parse_comparison() -> expression_ptr
{
    using enum token_type;
    return parse_left_associative<binary_expression>({greater_than, greater_equal, less_than, less_equal},
                                                     &parser::parse_term);
}

auto parser::parse_term() -> expression_ptr
{
    using enum token_type;
    return parse_left_associative<binary_expression>({plus, minus}, &parser::parse_factor);
}

auto parser::parse_factor() -> expression_ptr
{
    using enum token_type;
    return parse_left_associative<binary_expression>({asterisk, slash}, &parser::parse_unary);
}

auto parser::parse_unary() -> expression_ptr
{
    using enum token_type;
    if (match({exclamation, minus})) {
        const auto& oper = previous();
        auto right = parse_unary();
        return std::make_unique<unary_expression>(oper.type, std::move(right), oper.loc);
    }
    return parse_call();
}

auto parser::parse_call() -> expression_ptr
{
    using enum token_type;
    auto expr = parse_primary();
    while (true) {
        if (match({lparen})) {
            expr = parse_call_arguments(std::move(expr));
        } else if (current_token_is(dot)) {
            fail<parse_error>(current().loc, "unsupported construct `.`: property access");
        } else {
            return expr;
        }
    }
}

auto parser::parse_call_arguments(expression_ptr callee) -> expression_ptr
{
    using enum token_type;
    const auto loc = previous().loc;
    expressions arguments;
    if (!current_token_is(rparen)) {
        do {
            if (arguments.size() >= max_arguments) {
                fail<parse_error>(current().loc, "cannot have more than {} arguments", max_arguments);
            }
            arguments.push_back(parse_expression());
        } while (match({comma}));
    }
    expect(rparen, "after arguments");
    return std::make_unique<call_expression>(std::move(callee), std::move(arguments), loc);
}

auto parser::parse_primary() -> expression_ptr
{
    using enum token_type;
    const auto& tok = current();
    switch (tok.type) {
        case fals:
            next_token();
            return std::make_unique<literal>(false, tok.loc);
        case tru:
            next_token();
            return std::make_unique<literal>(true, tok.loc);
        case nil:
            next_token();
            return std::make_unique<literal>(std::monostate {}, tok.loc);
        case number:
            next_token();
            return std::make_unique<literal>(std::get<double>(tok.literal), tok.loc);
        case string:
            next_token();
            return std::make_unique<literal>(std::string {std::get<std::string_view>(tok.literal)}, tok.loc);
        case ident:
            next_token();
            return std::make_unique<identifier>(std::string {tok.lexeme}, tok.loc);
        case lparen: {
            next_token();
            auto inner = parse_expression();
            expect(rparen, "after expression");
            return std::make_unique<grouping_expression>(std::move(inner), tok.loc);
        }
        default:
            break;
    }
    if (is_reserved(tok.type)) {
        unsupported(tok);
    }
    fail<parse_error>(tok.loc, "expected expression, got `{}`", token_text(tok));
}

auto parser::current() const -> const token&
{
    return m_tokens[m_current];
}

auto parser::previous() const -> const token&
{
    return m_tokens[m_current - 1];
}

auto parser::at_end() const -> bool
{
    return current().type == token_type::eof;
}

auto parser::current_token_is(token_type type) const -> bool
{
    return current().type == type;
}

auto parser::match(std::initializer_list<token_type> types) -> bool
{
    for (const auto type : types) {
        if (current_token_is(type)) {
            next_token();
            return true;
        }
    }
    return false;
}

auto parser::next_token() -> const token&
{
    if (!at_end()) {
        m_current++;
    }
    return previous();
}

auto parser::expect(token_type type, std::string_view context) -> const token&
{
    if (current_token_is(type)) {
        return next_token();
    }
    if (type == token_type::ident) {
        fail<parse_error>(current().loc, "expected {}, got `{}`", context, token_text(current()));
    }
    fail<parse_error>(current().loc, "expected `{}` {}, got `{}`", type, context, token_text(current()));
}

auto parser::unsupported(const token& tok) const -> void
{
    fail<parse_error>(tok.loc, "unsupported construct `{}`", tok.lexeme);
}
