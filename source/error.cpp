#include <string>
#include <utility>

#include "error.hpp"

#include <fmt/format.h>

script_error::script_error(const std::string& message, location loc)
    : std::runtime_error {message}
    , m_loc {loc}
{
}

auto describe(const script_error& err) -> std::string
{
    if (err.loc().line == 0) {
        return fmt::format("{} error: {}", err.kind(), err.what());
    }
    return fmt::format("{}: {} error: {}", err.loc(), err.kind(), err.what());
}
