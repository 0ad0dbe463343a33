#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "location.hpp"
#include "token.hpp"

class lexer final
{
  public:
    explicit lexer(std::string_view input, std::string_view filename = "<stdin>");

    auto next_token() -> token;
    auto scan_tokens() -> std::vector<token>;

  private:
    auto read_char() -> void;
    auto skip_whitespace() -> void;
    auto skip_comment() -> void;
    [[nodiscard]] auto at_end() const -> bool;
    [[nodiscard]] auto peek_char() const -> std::string_view::value_type;
    auto read_identifier_or_keyword() -> token;
    auto read_number() -> token;
    auto read_string() -> token;
    [[nodiscard]] auto current_loc() const -> location;

    std::string_view m_input;
    std::string_view m_filename;
    std::string_view::size_type m_position {0};
    std::string_view::size_type m_read_position {0};
    std::string_view::value_type m_byte {0};
    std::size_t m_line {1};
    std::string_view::size_type m_line_start {0};
};
