#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case eof:
            return ostream << "eof";
        case assign:
            return ostream << "=";
        case asterisk:
            return ostream << "*";
        case colon:
            return ostream << ":";
        case comma:
            return ostream << ",";
        case dot:
            return ostream << ".";
        case exclamation:
            return ostream << "!";
        case greater_than:
            return ostream << ">";
        case less_than:
            return ostream << "<";
        case lparen:
            return ostream << "(";
        case lsquirly:
            return ostream << "{";
        case minus:
            return ostream << "-";
        case plus:
            return ostream << "+";
        case rparen:
            return ostream << ")";
        case rsquirly:
            return ostream << "}";
        case semicolon:
            return ostream << ";";
        case slash:
            return ostream << "/";
        case equals:
            return ostream << "==";
        case not_equals:
            return ostream << "!=";
        case greater_equal:
            return ostream << ">=";
        case less_equal:
            return ostream << "<=";
        case ident:
            return ostream << "identifier";
        case number:
            return ostream << "number";
        case string:
            return ostream << "string";
        case let:
            return ostream << "let";
        case function:
            return ostream << "fn";
        case ret:
            return ostream << "return";
        case print:
            return ostream << "print";
        case eef:
            return ostream << "if";
        case elze:
            return ostream << "else";
        case hwile:
            return ostream << "while";
        case fore:
            return ostream << "for";
        case tru:
            return ostream << "true";
        case fals:
            return ostream << "false";
        case nil:
            return ostream << "nil";
        case logical_and:
            return ostream << "and";
        case logical_or:
            return ostream << "or";
        case klass:
            return ostream << "class";
        case strukt:
            return ostream << "struct";
        case enumeration:
            return ostream << "enum";
        case interface:
            return ostream << "interface";
        case pub:
            return ostream << "public";
        case priv:
            return ostream << "private";
        case prot:
            return ostream << "protected";
        case stat:
            return ostream << "static";
        case fin:
            return ostream << "final";
        case abstract:
            return ostream << "abstract";
        case async:
            return ostream << "async";
        case extends:
            return ostream << "extends";
        case super:
            return ostream << "super";
        case self:
            return ostream << "this";
        case brake:
            return ostream << "break";
        case cont:
            return ostream << "continue";
    }
    throw std::invalid_argument("invalid token_type");
}

auto is_reserved(token_type type) -> bool
{
    using enum token_type;
    switch (type) {
        case klass:
        case strukt:
        case enumeration:
        case interface:
        case pub:
        case priv:
        case prot:
        case stat:
        case fin:
        case abstract:
        case async:
        case extends:
        case super:
        case self:
        case brake:
        case cont:
            return true;
        default:
            return false;
    }
}
