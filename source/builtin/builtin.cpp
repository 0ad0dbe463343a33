#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "builtin.hpp"

#include <eval/object.hpp>

builtin::builtin(std::string name,
                 std::size_t arity,
                 std::function<object(const std::vector<object>& arguments)> bod)
    : name {std::move(name)}
    , arity {arity}
    , body {std::move(bod)}
{
}

namespace
{

const builtin clock_builtin {"clock",
                             0,
                             [](const std::vector<object>& /*arguments*/) -> object
                             {
                                 const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
                                 return object {std::chrono::duration<double>(since_epoch).count()};
                             }};

}  // namespace

auto builtin::builtins() -> const std::vector<const builtin*>&
{
    static const std::vector<const builtin*> all {&clock_builtin};
    return all;
}
