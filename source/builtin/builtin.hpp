#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <eval/object.hpp>

struct builtin final
{
    builtin(std::string name, std::size_t arity, std::function<object(const std::vector<object>& arguments)> bod);

    static auto builtins() -> const std::vector<const builtin*>&;

    std::string name;
    std::size_t arity;
    std::function<object(const std::vector<object>& arguments)> body;
};
