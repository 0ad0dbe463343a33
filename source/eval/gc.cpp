#include <algorithm>
#include <cstddef>
#include <memory>
#include <vector>

#include "gc.hpp"

#include "environment.hpp"
#include "object.hpp"

gc::gc(bool stress)
    : m_stress {stress}
{
}

gc::~gc() = default;

auto gc::make_environment(environment* outer) -> environment*
{
    return m_environments.emplace_back(std::make_unique<environment>(outer)).get();
}

auto gc::push_scope(environment* env) -> void
{
    m_scopes.push_back(env);
}

auto gc::pop_scope() -> void
{
    m_scopes.pop_back();
}

auto gc::collect_if_needed() -> void
{
    if (m_stress || m_environments.size() >= m_next_collection) {
        collect();
    }
}

auto gc::mark(const object& val, std::vector<environment*>& pending) const -> void
{
    if (val.is<bound_function>()) {
        pending.push_back(val.as<bound_function>().closure);
    }
}

auto gc::collect() -> void
{
    std::vector<environment*> pending {m_scopes};
    for (const auto* root : m_roots) {
        mark(*root, pending);
    }
    while (!pending.empty()) {
        auto* env = pending.back();
        pending.pop_back();
        if (env == nullptr || env->marked) {
            continue;
        }
        env->marked = true;
        pending.push_back(env->outer);
        for (const auto& [name, val] : env->store) {
            mark(val, pending);
        }
    }

    std::erase_if(m_environments, [](const auto& env) { return !env->marked; });
    for (const auto& env : m_environments) {
        env->marked = false;
    }
    m_next_collection = std::max(default_threshold, 2 * m_environments.size());
}

root_scope::root_scope(gc& heap)
    : m_heap {heap}
    , m_mark {heap.m_roots.size()}
{
}

root_scope::~root_scope()
{
    m_heap.m_roots.resize(m_mark);
}

auto root_scope::add(const object& val) -> void
{
    m_heap.m_roots.push_back(&val);
}
