#include <string>
#include <variant>

#include "literal.hpp"

#include <fmt/format.h>
#include <overloaded.hpp>

#include "util.hpp"
#include "visitor.hpp"

auto literal::string() const -> std::string
{
    return std::visit(overloaded {
                          [](const std::monostate /*nil*/) -> std::string { return "nil"; },
                          [](const bool val) -> std::string { return val ? "true" : "false"; },
                          [](const double val) -> std::string { return decimal_to_string(val); },
                          [](const std::string& val) -> std::string { return fmt::format(R"("{}")", val); },
                      },
                      value);
}

void literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
