#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <lexer/location.hpp>

struct script_error : std::runtime_error
{
    script_error(const std::string& message, location loc);

    [[nodiscard]] virtual auto kind() const -> std::string_view = 0;

    [[nodiscard]] auto loc() const -> const location& { return m_loc; }

  private:
    location m_loc;
};

struct lex_error final : script_error
{
    using script_error::script_error;

    [[nodiscard]] auto kind() const -> std::string_view final { return "lex"; }
};

struct parse_error final : script_error
{
    using script_error::script_error;

    [[nodiscard]] auto kind() const -> std::string_view final { return "parse"; }
};

struct eval_error final : script_error
{
    using script_error::script_error;

    [[nodiscard]] auto kind() const -> std::string_view final { return "runtime"; }
};

/// Renders an error as `file:line:column: kind error: message`, dropping the
/// position when the error was raised without one.
auto describe(const script_error& err) -> std::string;

template<typename Error, typename... T>
[[noreturn]] auto fail(location loc, fmt::format_string<T...> fmt, T&&... args) -> void
{
    throw Error(fmt::format(fmt, std::forward<T>(args)...), loc);
}
