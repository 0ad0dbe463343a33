#pragma once

#include <cstddef>
#include <memory>
#include <vector>

struct environment;
struct object;

/// Owns every environment the interpreter creates and reclaims the ones that
/// can no longer be reached.
///
/// Roots are the scopes of live evaluation frames plus the values an
/// evaluator holds while it evaluates further subexpressions. Collection only
/// runs at statement boundaries, when every such value is registered.
class gc final
{
  public:
    static constexpr std::size_t default_threshold = 1024;

    /// In stress mode every statement boundary collects.
    explicit gc(bool stress = false);
    gc(const gc&) = delete;
    gc(gc&&) = delete;
    auto operator=(const gc&) -> gc& = delete;
    auto operator=(gc&&) -> gc& = delete;
    ~gc();

    auto make_environment(environment* outer = nullptr) -> environment*;

    auto push_scope(environment* env) -> void;
    auto pop_scope() -> void;

    auto collect_if_needed() -> void;
    auto collect() -> void;

    [[nodiscard]] auto live() const -> std::size_t { return m_environments.size(); }

  private:
    friend class root_scope;

    auto mark(const object& val, std::vector<environment*>& pending) const -> void;

    std::vector<std::unique_ptr<environment>> m_environments;
    std::vector<environment*> m_scopes;
    std::vector<const object*> m_roots;
    std::size_t m_next_collection {default_threshold};
    bool m_stress;
};

/// Registers temporaries with the collector until the end of the enclosing
/// C++ scope. A registered object must not move while the scope is open.
class root_scope final
{
  public:
    explicit root_scope(gc& heap);
    root_scope(const root_scope&) = delete;
    root_scope(root_scope&&) = delete;
    auto operator=(const root_scope&) -> root_scope& = delete;
    auto operator=(root_scope&&) -> root_scope& = delete;
    ~root_scope();

    auto add(const object& val) -> void;

  private:
    gc& m_heap;
    std::size_t m_mark;
};
