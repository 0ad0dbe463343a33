#include <array>
#include <sstream>
#include <string>
#include <string_view>

#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <doctest/doctest.h>
#include <error.hpp>
#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <eval/gc.hpp>
#include <eval/object.hpp>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

namespace
{
auto parse(std::string_view input) -> program_ptr
{
    INFO("while parsing: `", input, "`");
    auto prsr = parser {lexer {input, "doctest"}.scan_tokens()};
    return prsr.parse_program();
}

/// Evaluates the expression of a single expression statement.
auto evaluate(std::string_view input, gc& heap, environment* env) -> object
{
    const auto prgrm = parse(input);
    REQUIRE(prgrm->body.size() == 1);
    const auto* stmt = dynamic_cast<const expression_statement*>(prgrm->body.front().get());
    REQUIRE(stmt != nullptr);
    std::ostringstream out;
    evaluator ev {env, heap, out};
    return ev.evaluate(*stmt->expr);
}

auto evaluate(std::string_view input) -> object
{
    gc heap;
    return evaluate(input, heap, heap.make_environment());
}

auto require_eq(const object& obj, double expected, std::string_view input) -> void
{
    INFO(input, " expected: number with: ", expected, " got: ", obj.type(), " with: ", obj.inspect());
    REQUIRE(obj.is<double>());
    REQUIRE(obj.as<double>() == doctest::Approx(expected));
}

auto require_eq(const object& obj, bool expected, std::string_view input) -> void
{
    INFO(input, " expected: boolean with: ", expected, " got: ", obj.type(), " with: ", obj.inspect());
    REQUIRE(obj.is<bool>());
    REQUIRE(obj.as<bool>() == expected);
}

auto require_eq(const object& obj, const std::string& expected, std::string_view input) -> void
{
    INFO(input, " expected: string with: ", expected, " got: ", obj.type(), " with: ", obj.inspect());
    REQUIRE(obj.is<std::string>());
    REQUIRE(obj.as<std::string>() == expected);
}
}  // namespace

// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("evaluator");

TEST_CASE("numberExpressions")
{
    struct et
    {
        std::string_view input;
        double expected;
    };

    std::array tests {
        et {"5;", 5},
        et {"-5;", -5},
        et {"20 + 2 * -10;", 0},
        et {"3 * (3 * 3) + 10;", 37},
        et {"1 / 4;", 0.25},
        et {"(5 + 10 * 2 + 15 / 3) * 2 + -10;", 50},
    };
    for (const auto& [input, expected] : tests) {
        require_eq(evaluate(input), expected, input);
    }
}

TEST_CASE("booleanExpressions")
{
    struct et
    {
        std::string_view input;
        bool expected;
    };

    std::array tests {
        et {"true;", true},
        et {"1 < 2;", true},
        et {"1 >= 2;", false},
        et {"nil == nil;", true},
        et {"nil == 0;", false},
        et {"nil != false;", true},
        et {R"("a" != "b";)", true},
        et {"!nil;", true},
        et {"!0;", false},
        et {R"(!"";)", false},
    };
    for (const auto& [input, expected] : tests) {
        require_eq(evaluate(input), expected, input);
    }
}

TEST_CASE("logicalOperatorsReturnDecidingOperand")
{
    require_eq(evaluate(R"(nil or "default";)"), std::string {"default"}, "nil or default");
    require_eq(evaluate("1 and 2;"), 2.0, "1 and 2");
    CHECK(evaluate("nil and 1;").is_null());
    require_eq(evaluate("false and (1 / 0);"), false, "short circuit and");
    require_eq(evaluate("true or (1 / 0);"), true, "short circuit or");
}

TEST_CASE("assignmentEvaluatesToValue")
{
    gc heap;
    auto* env = heap.make_environment();
    env->define("a", object {});
    require_eq(evaluate("a = 40 + 2;", heap, env), 42.0, "a = 40 + 2");
    require_eq(env->get("a"), 42.0, "a");
}

TEST_CASE("executeReportsReturnedCompletion")
{
    const auto prgrm = parse("if (true) { return 1; } print 2;");
    std::ostringstream out;
    gc heap;
    evaluator ev {heap.make_environment(), heap, out};
    const auto result = ev.execute_block(prgrm->body);
    CHECK(result.type == completion_type::returned);
    require_eq(result.value, 1.0, "return 1");
    CHECK(out.str().empty());
}

TEST_CASE("functionValuesCaptureTheirScope")
{
    const auto prgrm = parse("let x = 1; fn f() { return x; }");
    gc heap;
    auto* env = heap.make_environment();
    std::ostringstream out;
    evaluator ev {env, heap, out};
    CHECK(ev.execute_block(prgrm->body).type == completion_type::normal);

    const auto func = env->get("f");
    REQUIRE(func.is<bound_function>());
    CHECK(func.as<bound_function>().closure == env);
    CHECK(func.inspect() == "<fn f>");
    CHECK(func == env->get("f"));
}

TEST_CASE("collectKeepsScopesOfReachableFunctions")
{
    const auto prgrm = parse("fn make() { let n = 7; fn get() { return n; } return get; } let g = make(); make();");
    gc heap;
    auto* env = heap.make_environment();
    std::ostringstream out;
    evaluator ev {env, heap, out};
    CHECK(ev.execute_block(prgrm->body).type == completion_type::normal);

    heap.collect();
    // globals, plus the call scope captured by g; the second call scope is gone
    CHECK(heap.live() == 2);
    require_eq(evaluate("g();", heap, env), 7.0, "g()");
}

TEST_CASE("errorsCarryLocation")
{
    try {
        evaluate("\n  1 - nil;");
        FAIL("expected an eval error");
    } catch (const eval_error& err) {
        CHECK(std::string {err.what()} == "operands must be numbers for operator '-'");
        CHECK(err.loc().line == 2);
        CHECK(err.loc().column == 5);
        CHECK(describe(err) == "doctest:2:5: runtime error: operands must be numbers for operator '-'");
    }
}

TEST_SUITE_END();
// NOLINTEND(*)
