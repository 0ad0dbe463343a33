#include <ostream>

#include "interpreter.hpp"

#include <ast/program.hpp>
#include <builtin/builtin.hpp>
#include <error.hpp>

#include "environment.hpp"
#include "evaluator.hpp"
#include "gc.hpp"
#include "object.hpp"

interpreter::interpreter(std::ostream& out, bool stress_gc)
    : m_heap {stress_gc}
    , m_globals {m_heap.make_environment()}
    , m_out {out}
{
    m_heap.push_scope(m_globals);
    for (const auto* native : builtin::builtins()) {
        m_globals->define(native->name, object {builtin_function {.native = native}});
    }
}

auto interpreter::run(const program& prgrm) -> void
{
    evaluator top_level {m_globals, m_heap, m_out};
    for (const auto& stmt : prgrm.body) {
        if (top_level.execute(*stmt).type == completion_type::returned) {
            fail<eval_error>(stmt->loc(), "cannot return from top-level code");
        }
    }
}
