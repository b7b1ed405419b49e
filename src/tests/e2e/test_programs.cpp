//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/e2e/test_programs.cpp
// Purpose: Run complete scripts through compile() and run() and check their
//          observable results.
// Key invariants: Compiled programs are immutable and may be executed by
//                 several VMs at once.
// Ownership/Lifetime: Programs and registries are owned by each test.
// Links: include/pgs/Engine.hpp, include/pgs/StdLib.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "pgs/Engine.hpp"
#include "pgs/StdLib.hpp"

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace pgs;
using support::ErrorKind;

namespace
{

struct Script
{
    std::ostringstream out;
    NativeRegistry registry;

    Script()
    {
        auto r = registerStdLib(registry, out);
        EXPECT_TRUE(r.hasValue());
    }

    support::Expected<Value> run(const std::string &src,
                                 const std::string &entry = "main",
                                 const std::vector<Value> &args = {})
    {
        auto program = compile(src, registry);
        if (!program)
            return program.error();
        return pgs::run(program.value(), entry, registry, args);
    }
};

// ============================================================================
// Arithmetic and calls
// ============================================================================

TEST(Programs, IntegerExpression)
{
    Script s;
    auto r = s.run("fn: main() ~ bool { return (2 + 3) * 4 == 20; }");
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_TRUE(r.value().asBool());
}

TEST(Programs, MixedPrecedence)
{
    Script s;
    auto r = s.run("fn: main() ~ int { return 100 - 6 * 7 / 2 + -(3 - 5); }");
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value().asInt(), 100 - 6 * 7 / 2 + 2);
}

TEST(Programs, Fibonacci)
{
    Script s;
    const char *src = R"(
        fn: fib(n: int) ~ int { if n < 2 { return n; } return fib(n-1) + fib(n-2); }
    )";
    auto r = s.run(src, "fib", {Value::integer(10)});
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_EQ(r.value().asInt(), 55);
}

TEST(Programs, IterativeFactorialWithFloats)
{
    Script s;
    auto r = s.run(R"(
        fn: fact(n: int) ~ float {
            var acc: float = 1.0;
            var f: float = 1.0;
            for i in n { acc *= f; f += 1.0; }
            return acc;
        }
        fn: main() ~ float { return fact(10); }
    )");
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_DOUBLE_EQ(r.value().asFloat(), 3628800.0);
}

// ============================================================================
// Modules and imports
// ============================================================================

TEST(Programs, ImportAliasMatchesQualifiedCall)
{
    const char *src = R"(
        mod: geo {
            mod: metric {
                fn: dist(a: float, b: float) ~ float {
                    var d: float = a - b;
                    if d < 0.0 { d = -d; }
                    return d;
                }
            }
        }
        import geo::metric::dist = d;
        fn: viaAlias() ~ float { return d(1.5, 4.0); }
        fn: viaPath() ~ float { return geo::metric::dist(1.5, 4.0); }
    )";
    Script s;
    auto alias = s.run(src, "viaAlias");
    auto path = s.run(src, "viaPath");
    ASSERT_TRUE(alias.hasValue()) << alias.error().message;
    ASSERT_TRUE(path.hasValue());
    EXPECT_EQ(alias.value(), path.value());
    EXPECT_EQ(alias.value().toString(), "2.5");
}

TEST(Programs, ModuleAliasQualifiesFurtherSegments)
{
    Script s;
    auto r = s.run(R"(
        mod: very { mod: long { mod: path { fn: k() ~ int { return 9; } } } }
        import very::long::path = p;
        fn: main() ~ int { return p::k(); }
    )");
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_EQ(r.value().asInt(), 9);
}

// ============================================================================
// Containers and methods
// ============================================================================

TEST(Programs, VectorLength)
{
    Script s;
    auto r = s.run(R"(
        cont: Vec { x: float; y: float; }
        impl: Vec {
            fn: length() ~ float { return std::sqrt(x * x + y * y); }
        }
        fn: main() ~ float {
            var v: Vec = Vec { x: 3.0, y: 4.0 };
            return v.length();
        }
    )");
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_DOUBLE_EQ(r.value().asFloat(), 5.0);
}

TEST(Programs, NestedContainersAndMethodArguments)
{
    Script s;
    auto r = s.run(R"(
        cont: Point { x: int; y: int; }
        cont: Rect { min: Point; max: Point; }
        impl: Rect {
            fn: area() ~ int { return (max.x - min.x) * (max.y - min.y); }
            fn: grow(by: int) { max.x += by; max.y += by; }
        }
        fn: main() ~ int {
            var r: Rect = Rect { min: Point { x: 0, y: 0 }, max: Point { x: 2, y: 3 } };
            r.grow(1);
            return r.area();
        }
    )");
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_EQ(r.value().asInt(), 12);
}

TEST(Programs, FieldInitializersRunInDeclarationOrder)
{
    Script s;
    auto r = s.run(R"(
        cont: P { a: int; b: int; }
        fn: main() ~ int {
            var p: P = P { b: std::printi(2), a: std::printi(1) };
            return p.a;
        }
    )");
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_EQ(s.out.str(), "12");
}

// ============================================================================
// Loops
// ============================================================================

TEST(Programs, WhileWithZeroIterations)
{
    Script s;
    auto r = s.run(R"(
        fn: main() ~ int {
            var n: int = 0;
            while n > 0 { n = n - 1; std::print("x"); }
            return n;
        }
    )");
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value().asInt(), 0);
    EXPECT_TRUE(s.out.str().empty());
}

TEST(Programs, CountedWhile)
{
    Script s;
    auto r = s.run(R"(
        fn: count(limit: int) ~ int {
            var i: int = 0;
            var steps: int = 0;
            while i < limit { i += 1; steps += 1; }
            return steps;
        }
    )",
                   "count",
                   {Value::integer(37)});
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value().asInt(), 37);
}

TEST(Programs, BreakAndContinueInEveryLoopForm)
{
    Script s;
    auto r = s.run(R"(
        fn: main() ~ int {
            var total: int = 0;

            var i: int = 0;
            while true {
                i += 1;
                if i > 10 { break; }
                if i == 5 { continue; }
                total += i;
            }

            var j: int = 0;
            loop {
                j += 1;
                if j == 3 { continue; }
                if j == 6 { break; }
                total += 100;
            }

            for k in 10 {
                if k == 2 { continue; }
                if k == 4 { break; }
                total += 1000;
            }
            return total;
        }
    )");
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    // while: 1..10 without 5 = 50; loop: j = 1, 2, 4, 5 -> 400; for: k = 0, 1, 3 -> 3000
    EXPECT_EQ(r.value().asInt(), 3450);
}

TEST(Programs, NestedLoopsBreakInnerOnly)
{
    Script s;
    auto r = s.run(R"(
        fn: main() ~ int {
            var hits: int = 0;
            for a in 4 {
                loop { hits += 1; break; }
                for b in 3 { if b == 1 { break; } hits += 10; }
            }
            return hits;
        }
    )");
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value().asInt(), 44);
}

TEST(Programs, StringLoopBuildsOutput)
{
    Script s;
    auto r = s.run(R"(
        fn: main() {
            for c in "abc" { std::print(c); std::print("-"); }
            std::println("");
        }
    )");
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(s.out.str(), "a-b-c-\n");
}

// ============================================================================
// Scoping
// ============================================================================

TEST(Programs, ShadowingInNestedBlocks)
{
    Script s;
    auto r = s.run(R"(
        fn: main() ~ int {
            var x: int = 1;
            {
                var x: int = 10;
                x += 5;
            }
            if true { var x: int = 100; }
            return x;
        }
    )");
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value().asInt(), 1);
}

TEST(Programs, UndefinedIdentifierIsResolveError)
{
    Script s;
    auto r = s.run("fn: main() ~ int {\n    var a: int = 2;\n    return a * b;\n}");
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().stage(), support::Stage::Resolve);
    EXPECT_EQ(r.error().kind, ErrorKind::UnknownSymbol);
    EXPECT_EQ(r.error().loc.line, 3u);
    EXPECT_EQ(r.error().loc.column, 16u);
    EXPECT_NE(r.error().message.find("'b'"), std::string::npos);
}

// ============================================================================
// Sharing compiled programs
// ============================================================================

TEST(Programs, IndependentVMsShareOneProgram)
{
    NativeRegistry registry;
    auto program = compile(R"(
        fn: sum(n: int) ~ int {
            var total: int = 0;
            for i in n { total += i; }
            return total;
        }
    )");
    ASSERT_TRUE(program.hasValue());
    const CompiledProgram &shared = program.value();

    std::vector<int64_t> results(4, 0);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < results.size(); ++t)
    {
        workers.emplace_back(
            [&, t]
            {
                auto r = run(shared, "sum", registry, {Value::integer(1000 * (int64_t(t) + 1))});
                results[t] = r ? r.value().asInt() : -1;
            });
    }
    for (auto &w : workers)
        w.join();

    for (size_t t = 0; t < results.size(); ++t)
    {
        const int64_t n = 1000 * (int64_t(t) + 1);
        EXPECT_EQ(results[t], n * (n - 1) / 2);
    }
}

} // namespace
