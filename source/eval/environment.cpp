#include <string>
#include <utility>

#include "environment.hpp"

#include <error.hpp>
#include <fmt/core.h>

#include "object.hpp"

environment::environment(environment* outer_env)
    : outer(outer_env)
{
}

auto environment::define(const std::string& name, object val) -> void
{
    store.insert_or_assign(name, std::move(val));
}

auto environment::get(const std::string& name, const location& loc) const -> object
{
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->outer) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            return itr->second;
        }
    }
    fail<eval_error>(loc, "undefined variable '{}'", name);
}

auto environment::assign(const std::string& name, object val, const location& loc) -> void
{
    for (auto* ptr = this; ptr != nullptr; ptr = ptr->outer) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            itr->second = std::move(val);
            return;
        }
    }
    fail<eval_error>(loc, "undefined variable '{}'", name);
}

auto environment::debug() const -> void
{
    for (const auto& [k, v] : store) {
        fmt::print("[{}] = {}\n", k, v.inspect());
    }
}
