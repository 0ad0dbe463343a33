#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lexer.hpp"

#include <error.hpp>

#include "location.hpp"
#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table =
    std::array<std::optional<token_type>, std::numeric_limits<unsigned char>::max() + 1>;

namespace
{
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr['*'] = asterisk;
    arr['}'] = rsquirly;
    arr[')'] = rparen;
    arr[':'] = colon;
    arr[','] = comma;
    arr['='] = assign;
    arr['>'] = greater_than;
    arr['<'] = less_than;
    arr['{'] = lsquirly;
    arr['('] = lparen;
    arr[';'] = semicolon;
    arr['.'] = dot;
    arr['/'] = slash;
    arr['+'] = plus;
    arr['-'] = minus;
    arr['!'] = exclamation;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();
constexpr auto keyword_count = 29;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"let", token_type::let},
        std::pair {"fn", token_type::function},
        std::pair {"return", token_type::ret},
        std::pair {"print", token_type::print},
        std::pair {"if", token_type::eef},
        std::pair {"else", token_type::elze},
        std::pair {"while", token_type::hwile},
        std::pair {"for", token_type::fore},
        std::pair {"true", token_type::tru},
        std::pair {"false", token_type::fals},
        std::pair {"nil", token_type::nil},
        std::pair {"and", token_type::logical_and},
        std::pair {"or", token_type::logical_or},
        std::pair {"class", token_type::klass},
        std::pair {"struct", token_type::strukt},
        std::pair {"enum", token_type::enumeration},
        std::pair {"interface", token_type::interface},
        std::pair {"public", token_type::pub},
        std::pair {"private", token_type::priv},
        std::pair {"protected", token_type::prot},
        std::pair {"static", token_type::stat},
        std::pair {"final", token_type::fin},
        std::pair {"abstract", token_type::abstract},
        std::pair {"async", token_type::async},
        std::pair {"extends", token_type::extends},
        std::pair {"super", token_type::super},
        std::pair {"this", token_type::self},
        std::pair {"break", token_type::brake},
        std::pair {"continue", token_type::cont},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

using token_pair = std::pair<token_type, token_type>;

struct token_pair_hash
{
    auto operator()(const token_pair& pair) const -> size_t
    {
        return static_cast<uint8_t>(pair.first) ^ static_cast<size_t>(static_cast<uint8_t>(pair.second) << 8U);
    }
};

using two_token_lookup = std::unordered_map<token_pair, token_type, token_pair_hash>;

auto build_two_token_lookup() -> two_token_lookup
{
    using enum token_type;
    two_token_lookup lookup;
    lookup.insert({{assign, assign}, equals});
    lookup.insert({{exclamation, assign}, not_equals});
    lookup.insert({{greater_than, assign}, greater_equal});
    lookup.insert({{less_than, assign}, less_equal});
    return lookup;
}

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

auto equals_ignore_case(std::string_view keyword, std::string_view word) -> bool
{
    return std::ranges::equal(keyword,
                              word,
                              [](char lhs, char rhs)
                              {
                                  return lhs
                                      == static_cast<char>(std::tolower(static_cast<unsigned char>(rhs)));
                              });
}

}  // namespace

lexer::lexer(std::string_view input, std::string_view filename)
    : m_input {input}
    , m_filename {filename}
{
    read_char();
}

auto lexer::next_token() -> token
{
    using enum token_type;
    skip_whitespace();
    const auto loc = current_loc();
    if (at_end()) {
        return token {.type = eof, .lexeme = "", .loc = loc};
    }
    if (m_byte == '"') {
        return read_string();
    }
    if (is_letter(m_byte)) {
        return read_identifier_or_keyword();
    }
    if (is_digit(m_byte)) {
        return read_number();
    }
    const auto char_token_type = char_literal_tokens[static_cast<unsigned char>(m_byte)];
    if (!char_token_type.has_value()) {
        fail<lex_error>(loc, "unexpected character `{}`", m_byte);
    }
    const static auto two_token = build_two_token_lookup();
    if (const auto peek_token_type = char_literal_tokens[static_cast<unsigned char>(peek_char())];
        peek_token_type.has_value())
    {
        if (const auto itr = two_token.find({*char_token_type, *peek_token_type}); itr != two_token.end()) {
            const auto lexeme = m_input.substr(m_position, 2);
            return read_char(), read_char(), token {.type = itr->second, .lexeme = lexeme, .loc = loc};
        }
    }
    const auto lexeme = m_input.substr(m_position, 1);
    return read_char(), token {.type = *char_token_type, .lexeme = lexeme, .loc = loc};
}

auto lexer::scan_tokens() -> std::vector<token>
{
    std::vector<token> tokens;
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().type == token_type::eof) {
            return tokens;
        }
    }
}

auto lexer::read_char() -> void
{
    if (m_byte == '\n') {
        m_line++;
        m_line_start = m_read_position;
    }
    if (m_read_position >= m_input.size()) {
        m_byte = '\0';
    } else {
        m_byte = m_input[m_read_position];
    }
    m_position = m_read_position;
    m_read_position++;
}

auto lexer::skip_whitespace() -> void
{
    while (!at_end()) {
        if (m_byte == ' ' || m_byte == '\t' || m_byte == '\n' || m_byte == '\r') {
            read_char();
        } else if (m_byte == '/' && peek_char() == '/') {
            skip_comment();
        } else {
            return;
        }
    }
}

auto lexer::skip_comment() -> void
{
    while (!at_end() && m_byte != '\n') {
        read_char();
    }
}

auto lexer::at_end() const -> bool
{
    return m_position >= m_input.size();
}

auto lexer::peek_char() const -> std::string_view::value_type
{
    if (m_read_position >= m_input.size()) {
        return '\0';
    }
    return m_input[m_read_position];
}

auto lexer::read_identifier_or_keyword() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (!at_end() && (is_letter(m_byte) || is_digit(m_byte))) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(position, m_position - position);
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr = std::find_if(keyword_tokens.cbegin(),
                                  keyword_tokens.cend(),
                                  [&identifier_or_keyword](auto pair) -> bool
                                  { return equals_ignore_case(pair.first, identifier_or_keyword); });
    if (itr != keyword_tokens.end()) {
        return token {.type = itr->second, .lexeme = identifier_or_keyword, .loc = loc};
    }
    // NOLINTEND(*-qualified-auto)
    return token {.type = token_type::ident, .lexeme = identifier_or_keyword, .loc = loc};
}

auto lexer::read_number() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (!at_end() && is_digit(m_byte)) {
        read_char();
    }
    if (m_byte == '.' && is_digit(peek_char())) {
        read_char();
        while (!at_end() && is_digit(m_byte)) {
            read_char();
        }
    }
    const auto lexeme = m_input.substr(position, m_position - position);
    // literals beyond the double range become inf, ones below it become 0
    const auto value = std::strtod(std::string {lexeme}.c_str(), nullptr);
    return token {.type = token_type::number, .lexeme = lexeme, .literal = value, .loc = loc};
}

auto lexer::read_string() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    read_char();
    while (!at_end() && m_byte != '"') {
        read_char();
    }
    if (at_end()) {
        fail<lex_error>(loc, "unterminated string");
    }
    read_char();
    const auto lexeme = m_input.substr(position, m_position - position);
    return token {
        .type = token_type::string,
        .lexeme = lexeme,
        .literal = lexeme.substr(1, lexeme.size() - 2),
        .loc = loc,
    };
}

auto lexer::current_loc() const -> location
{
    return location {.filename = m_filename, .line = m_line, .column = m_position - m_line_start + 1};
}
