#pragma once

#include <iostream>
#include <string_view>
#include <variant>

#include "location.hpp"
#include "token_type.hpp"

struct token final
{
    using literal_type = std::variant<std::monostate, double, std::string_view>;

    token_type type;
    std::string_view lexeme;
    literal_type literal {};
    location loc {};
    auto operator==(const token& other) const -> bool;
};

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&;

template<>
struct fmt::formatter<token> : ostream_formatter
{
};
