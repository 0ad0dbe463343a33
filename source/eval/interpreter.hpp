#pragma once

#include <iostream>
#include <ostream>

#include <ast/program.hpp>

#include "environment.hpp"
#include "gc.hpp"

/// Runs programs against one long-lived global scope which has the builtins
/// bound. Definitions survive between calls to run, which is what the REPL
/// relies on.
class interpreter final
{
  public:
    /// With `stress_gc` set, unreachable scopes are reclaimed before every
    /// statement instead of once the heap has grown.
    explicit interpreter(std::ostream& out = std::cout, bool stress_gc = false);

    /// Executes the top-level statements in order. The first runtime error
    /// propagates as an eval_error, side effects up to that point stay.
    auto run(const program& prgrm) -> void;

    [[nodiscard]] auto globals() const -> environment* { return m_globals; }
    [[nodiscard]] auto heap() -> gc& { return m_heap; }

  private:
    gc m_heap;
    environment* m_globals;
    std::ostream& m_out;
};
