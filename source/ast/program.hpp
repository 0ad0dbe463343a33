#pragma once

#include <memory>
#include <string>
#include <utility>

#include "statements.hpp"

struct program final
{
    explicit program(statements stmts)
        : body {std::move(stmts)}
    {
    }

    [[nodiscard]] auto string() const -> std::string;

    statements body;
};

using program_ptr = std::unique_ptr<program>;
