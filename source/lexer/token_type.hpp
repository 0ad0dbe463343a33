#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    eof,

    // single character tokens
    assign,
    asterisk,
    colon,
    comma,
    dot,
    exclamation,
    greater_than,
    less_than,
    lparen,
    lsquirly,
    minus,
    plus,
    rparen,
    rsquirly,
    semicolon,
    slash,

    // two character tokens
    equals,
    not_equals,
    greater_equal,
    less_equal,

    // multi character tokens
    ident,
    number,
    string,

    // keywords
    let,
    function,
    ret,
    print,
    eef,
    elze,
    hwile,
    fore,
    tru,
    fals,
    nil,
    logical_and,
    logical_or,

    // reserved keywords without execution semantics
    klass,
    strukt,
    enumeration,
    interface,
    pub,
    priv,
    prot,
    stat,
    fin,
    abstract,
    async,
    extends,
    super,
    self,
    brake,
    cont,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

auto is_reserved(token_type type) -> bool;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
