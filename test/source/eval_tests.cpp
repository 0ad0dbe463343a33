#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <error.hpp>
#include <eval/environment.hpp>
#include <eval/gc.hpp>
#include <eval/interpreter.hpp>
#include <eval/object.hpp>
#include <gtest/gtest.h>

#include "testutils.hpp"

namespace
{
struct output_test
{
    std::string_view input;
    std::string_view expected;
};

template<std::size_t N>
auto assert_outputs(const std::array<output_test, N>& tests) -> void
{
    for (const auto& [input, expected] : tests) {
        EXPECT_EQ(run(input), expected) << "while running: `" << input << "`";
    }
}

auto eval_error_of(std::string_view input) -> std::string
{
    try {
        run(input);
    } catch (const eval_error& err) {
        return err.what();
    }
    ADD_FAILURE() << "expected an eval error for: " << input;
    return {};
}
}  // namespace

// NOLINTBEGIN(*-magic-numbers)
TEST(eval, testNumberExpressions)
{
    assert_outputs(std::array {
        output_test {"print 5;", "5\n"},
        output_test {"print -5;", "-5\n"},
        output_test {"print 5 + 5 + 5 + 5 - 10;", "10\n"},
        output_test {"print 2 * 2 * 2 * 2 * 2;", "32\n"},
        output_test {"print -50 + 100 + -50;", "0\n"},
        output_test {"print 5 * 2 + 10;", "20\n"},
        output_test {"print 5 + 2 * 10;", "25\n"},
        output_test {"print 50 / 2 * 2 + 10;", "60\n"},
        output_test {"print 2 * (5 + 10);", "30\n"},
        output_test {"print (5 + 10 * 2 + 15 / 3) * 2 + -10;", "50\n"},
        output_test {"print 7 / 2;", "3.5\n"},
        output_test {"print 0.1 + 0.2;", "0.30000000000000004\n"},
        output_test {"print 1.5 * 2;", "3\n"},
    });
}

TEST(eval, testBooleanExpressions)
{
    assert_outputs(std::array {
        output_test {"print true;", "true\n"},
        output_test {"print false;", "false\n"},
        output_test {"print 1 < 2;", "true\n"},
        output_test {"print 1 > 2;", "false\n"},
        output_test {"print 1 <= 1;", "true\n"},
        output_test {"print 1 >= 2;", "false\n"},
        output_test {"print 1 == 1;", "true\n"},
        output_test {"print 1 != 1;", "false\n"},
        output_test {"print true == true;", "true\n"},
        output_test {"print true != false;", "true\n"},
        output_test {"print (1 < 2) == true;", "true\n"},
        output_test {R"(print "a" == "a";)", "true\n"},
        output_test {R"(print "a" == "b";)", "false\n"},
        output_test {R"(print 1 == "1";)", "false\n"},
    });
}

TEST(eval, testNilEqualityAndTruthiness)
{
    assert_outputs(std::array {
        output_test {"print nil == nil;", "true\n"},
        output_test {"print nil == 0;", "false\n"},
        output_test {"print nil == false;", "false\n"},
        output_test {"print nil;", "nil\n"},
        output_test {"if (0) print \"yes\"; else print \"no\";", "yes\n"},
        output_test {R"(if ("") print "yes"; else print "no";)", "yes\n"},
        output_test {R"(if (nil) print "yes"; else print "no";)", "no\n"},
        output_test {R"(if (false) print "yes"; else print "no";)", "no\n"},
        output_test {"print !nil;", "true\n"},
        output_test {"print !0;", "false\n"},
        output_test {"print !!true;", "true\n"},
    });
}

TEST(eval, testStringConcatenation)
{
    assert_outputs(std::array {
        output_test {R"(print "foo" + "bar";)", "foobar\n"},
        output_test {R"(print 1 + "x";)", "1x\n"},
        output_test {R"(print "x" + 2.5;)", "x2.5\n"},
        output_test {R"(print "is " + true;)", "is true\n"},
        output_test {R"(print "is " + nil;)", "is nil\n"},
        output_test {R"(print "multi
line";)",
                     "multi\nline\n"},
    });
}

TEST(eval, testLogicalOperators)
{
    assert_outputs(std::array {
        output_test {"print true and false;", "false\n"},
        output_test {"print nil or \"fallback\";", "fallback\n"},
        output_test {"print 1 and 2;", "2\n"},
        output_test {"print nil and 2;", "nil\n"},
        output_test {"print false or nil;", "nil\n"},
        output_test {"print false and (1 / 0);", "false\n"},
        output_test {"print true or (1 / 0);", "true\n"},
        output_test {"let a = 0; false and (a = 1); print a;", "0\n"},
    });
}

TEST(eval, testVariables)
{
    assert_outputs(std::array {
        output_test {"let a = 5; print a;", "5\n"},
        output_test {"let a = 5 * 5; print a;", "25\n"},
        output_test {"let a; print a;", "nil\n"},
        output_test {"let a = 5; let b = a; let c = a + b + 5; print c;", "15\n"},
        output_test {"let a = 1; a = a + 1; print a;", "2\n"},
        output_test {"let a; let b; a = b = 3; print a + b;", "6\n"},
        output_test {"let a = 1; let a = 2; print a;", "2\n"},
        output_test {"let a = 1; print a = 7;", "7\n"},
    });
}

TEST(eval, testBlockScoping)
{
    assert_outputs(std::array {
        output_test {"let x = 1; { let x = 2; print x; } print x;", "2\n1\n"},
        output_test {"let x = 1; { x = 2; } print x;", "2\n"},
        output_test {"let x = 1; { { x = 3; } } print x;", "3\n"},
        output_test {"let x = \"global\"; { let y = x; { let x = \"inner\"; print x + y; } }", "innerglobal\n"},
    });
    EXPECT_EQ(eval_error_of("{ let inner = 1; } print inner;"), "undefined variable 'inner'");
}

TEST(eval, testIfStatements)
{
    assert_outputs(std::array {
        output_test {"if (true) print 10;", "10\n"},
        output_test {"if (false) print 10;", ""},
        output_test {"if (1 < 2) { print 10; }", "10\n"},
        output_test {"if (1 > 2) { print 10; } else { print 20; }", "20\n"},
        output_test {"if (false) print 1; else if (true) print 2; else print 3;", "2\n"},
    });
}

TEST(eval, testLoops)
{
    assert_outputs(std::array {
        output_test {"let i = 0; while (i < 3) { print i; i = i + 1; }", "0\n1\n2\n"},
        output_test {"for (let j = 0; j < 3; j = j + 1) { print j; }", "0\n1\n2\n"},
        output_test {"let k = 5; for (; k > 3;) k = k - 1; print k;", "3\n"},
        output_test {"let s = 0; for (let i = 1; i <= 100; i = i + 1) s = s + i; print s;", "5050\n"},
        output_test {"while (false) print 1;", ""},
    });
    EXPECT_EQ(eval_error_of("for (let j = 0; j < 1; j = j + 1) {} print j;"), "undefined variable 'j'");
}

TEST(eval, testFunctions)
{
    assert_outputs(std::array {
        output_test {"let x = 5; let y = 10; fn add(a, b) { return a + b; } print(add(x, y));", "15\n"},
        output_test {"fn identity(x) { return x; } print identity(5);", "5\n"},
        output_test {"fn double(x) { return x * 2; } print double(5);", "10\n"},
        output_test {"fn noop() {} print noop();", "nil\n"},
        output_test {"fn early() { return; print 1; } print early();", "nil\n"},
        output_test {"fn add(a, b) { return a + b; } print add(5 + 5, add(5, 5));", "20\n"},
        output_test {"fn f() { while (true) { if (true) { return 7; } } } print f();", "7\n"},
        output_test {"fn f() { for (let i = 0;; i = i + 1) { if (i == 3) return i; } } print f();", "3\n"},
        output_test {"fn f() {} print f;", "<fn f>\n"},
        output_test {"print clock;", "<native fn clock>\n"},
        output_test {"fn f() {} let g = f; print f == g;", "true\n"},
        output_test {"fn f() {} fn g() {} print f == g;", "false\n"},
    });
}

TEST(eval, testRecursion)
{
    constexpr auto input = R"(
fn fib(n) {
  if (n < 2) return n;
  return fib(n - 1) + fib(n - 2);
}
print fib(15);
)";
    EXPECT_EQ(run(input), "610\n");
}

TEST(eval, testClosures)
{
    assert_outputs(std::array {
        output_test {R"(
fn make_counter() {
  let count = 0;
  fn counter() {
    count = count + 1;
    return count;
  }
  return counter;
}
let c = make_counter();
c();
c();
print c();
let d = make_counter();
print d();
)",
                     "3\n1\n"},
        output_test {R"(
fn adder(x) {
  fn add(y) { return x + y; }
  return add;
}
print adder(2)(3);
)",
                     "5\n"},
        output_test {R"(
let greeting = "hello";
fn greet() { print greeting; }
greeting = "goodbye";
greet();
)",
                     "goodbye\n"},
        output_test {R"(
let x = "outer";
fn show() { print x; }
{
  let x = "block";
  show();
}
)",
                     "outer\n"},
    });
}

TEST(eval, testBuiltinClock)
{
    test_session session;
    EXPECT_EQ(session.run("let t = clock(); print t > 0;"), "true\n");
    EXPECT_TRUE(session.intrprtr.globals()->get("t").is<double>());
}

TEST(eval, testSessionKeepsState)
{
    test_session session;
    EXPECT_EQ(session.run("let a = 2; fn twice(x) { return x * a; }"), "");
    EXPECT_EQ(session.run("print twice(21);"), "42\n");
    EXPECT_EQ(session.run("a = 3; print twice(2);"), "6\n");
}

TEST(eval, testUnreachableScopesAreReclaimed)
{
    test_session session;
    EXPECT_EQ(session.run(R"(
fn outer(n) { fn inner() { return n; } return inner(); }
let i = 0;
let total = 0;
while (i < 1000) {
  total = total + outer(i);
  i = i + 1;
}
print total;
)"),
              "499500\n");
    auto& heap = session.intrprtr.heap();
    EXPECT_LE(heap.live(), gc::default_threshold + 8);
    heap.collect();
    EXPECT_EQ(heap.live(), 1U);
}

TEST(eval, testCapturedScopesSurviveCollection)
{
    test_session session;
    EXPECT_EQ(session.run(R"(
fn make_counter() {
  let count = 0;
  fn counter() { count = count + 1; return count; }
  return counter;
}
let c = make_counter();
)"),
              "");
    session.intrprtr.heap().collect();
    EXPECT_EQ(session.intrprtr.heap().live(), 2U);
    EXPECT_EQ(session.run("c(); print c();"), "2\n");

    EXPECT_EQ(session.run("c = nil;"), "");
    session.intrprtr.heap().collect();
    EXPECT_EQ(session.intrprtr.heap().live(), 1U);
}

TEST(eval, testClosuresUnderCollectionOnEveryStatement)
{
    const std::array tests {
        output_test {R"(
fn make_counter() {
  let count = 0;
  fn counter() { count = count + 1; return count; }
  return counter;
}
let c = make_counter();
c();
print c();
)",
                     "2\n"},
        output_test {R"(
fn adder(a) { fn add(b) { return a + b; } return add; }
print adder(2)(3);
)",
                     "5\n"},
        output_test {R"(
fn make(x) { fn get() { let y = x; return y; } return get; }
fn apply(f, g) { let unused = 0; return f() + g(); }
print apply(make(1), make(2));
)",
                     "3\n"},
        output_test {R"(
fn adder(a) { fn add(b) { let sum = a + b; return sum; } return add; }
fn make_counter() {
  let count = 10;
  fn counter() { count = count + 1; return count; }
  return counter;
}
print adder(2)(make_counter()());
)",
                     "13\n"},
        output_test {R"(
fn make(x) { fn get() { let y = x; return y; } return get; }
fn call(f) { let unused = 0; return f(); }
print make("left ")() + call(make("right"));
)",
                     "left right\n"},
    };
    for (const auto& [input, expected] : tests) {
        test_session session {true};
        EXPECT_EQ(session.run(input), expected) << "while running: `" << input << "`";
    }
}

TEST(eval, testErrors)
{
    struct error_test
    {
        std::string_view input;
        std::string_view expected;
    };
    const std::array tests {
        error_test {"print undeclared;", "undefined variable 'undeclared'"},
        error_test {"undeclared = 1;", "undefined variable 'undeclared'"},
        error_test {R"(print 1 - "x";)", "operands must be numbers for operator '-'"},
        error_test {"print true * 2;", "operands must be numbers for operator '*'"},
        error_test {"print nil < 1;", "operands must be numbers for operator '<'"},
        error_test {"print 1 / 0;", "division by zero"},
        error_test {"print true + 1;", "operands must be two numbers or one must be a string"},
        error_test {R"(print -"x";)", "operand must be a number for operator '-'"},
        error_test {R"("not a function"();)", "can only call functions, got string"},
        error_test {"let a = 1; a();", "can only call functions, got number"},
        error_test {"fn f(a, b) {} f(1);", "expected 2 arguments but got 1"},
        error_test {"clock(1);", "expected 0 arguments but got 1"},
        error_test {"return 1;", "cannot return from top-level code"},
        error_test {"if (true) { return; }", "cannot return from top-level code"},
        error_test {"fn f() { return f(); } f();", "stack overflow calling f"},
    };
    for (const auto& [input, expected] : tests) {
        EXPECT_EQ(eval_error_of(input), expected) << "while running: `" << input << "`";
    }
}

TEST(eval, testErrorStopsExecution)
{
    test_session session;
    EXPECT_THROW(session.run("print 1; print undeclared; print 2;"), eval_error);
    EXPECT_EQ(session.out.str(), "1\n");

    EXPECT_THROW(session.run("print undeclared;"), eval_error);
    EXPECT_EQ(session.out.str(), "");
}

TEST(eval, testErrorLeavesScopesIntact)
{
    test_session session;
    EXPECT_THROW(session.run("let x = 1; { let x = 2; print y; }"), eval_error);
    EXPECT_EQ(session.run("print x;"), "1\n");
}

TEST(eval, testErrorDescription)
{
    try {
        run("let a = 1;\nprint a + nil;");
        FAIL() << "expected an eval error";
    } catch (const eval_error& err) {
        EXPECT_EQ(describe(err), "test:2:9: runtime error: operands must be two numbers or one must be a string");
    }
}

// NOLINTEND(*-magic-numbers)
