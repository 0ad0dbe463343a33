#pragma once

#include <string>
#include <unordered_map>

#include <lexer/location.hpp>

#include "object.hpp"

/// One lexical scope. Lookups and assignments walk the chain of outer scopes,
/// definitions always land in this one. Scopes created while running a
/// program are owned by the interpreter's gc, `outer` never owns.
struct environment final
{
    explicit environment(environment* outer_env = nullptr);

    auto define(const std::string& name, object val) -> void;
    [[nodiscard]] auto get(const std::string& name, const location& loc = {}) const -> object;
    auto assign(const std::string& name, object val, const location& loc = {}) -> void;

    void debug() const;

    std::unordered_map<std::string, object> store;
    environment* outer;
    bool marked {false};
};
