//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_vm.cpp
// Purpose: Exercise the bytecode VM: arithmetic semantics, traps, resource
//          limits, host interruption and struct reference sharing.
// Key invariants: Traps surface as runtime diagnostics carrying the source
//                 line; a finished run holds no references to script values.
// Ownership/Lifetime: Each test owns its registry and compiled program.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "bytecode/BytecodeVM.hpp"
#include "pgs/Engine.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using namespace pgs;
using support::ErrorKind;

namespace
{
CompiledProgram build(const std::string &src)
{
    auto program = compile(src);
    EXPECT_TRUE(program.hasValue()) << (program ? "" : program.error().message);
    if (!program)
        return CompiledProgram(std::make_shared<const bytecode::BytecodeModule>());
    return program.value();
}

support::Expected<Value> runMain(const std::string &src, const RunConfig &config = {})
{
    NativeRegistry registry;
    return run(build(src), "main", registry, {}, config);
}
} // namespace

TEST(BytecodeVM, RecursiveCalls)
{
    auto result = runMain(R"(
        fn: fib(n: int) ~ int {
            if n < 2 { return n; }
            return fib(n - 1) + fib(n - 2);
        }
        fn: main() ~ int { return fib(10); }
    )");
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_EQ(result.value(), Value::integer(55));
}

TEST(BytecodeVM, HostArgumentsBecomeParameters)
{
    NativeRegistry registry;
    auto program = build("fn: add(a: int, b: int) ~ int { return a + b; }");
    auto result = run(program, "add", registry, {Value::integer(2), Value::integer(40)});
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().asInt(), 42);

    auto qualified = run(program, "root::add", registry, {Value::integer(1), Value::integer(1)});
    ASSERT_TRUE(qualified.hasValue());
    EXPECT_EQ(qualified.value().asInt(), 2);
}

TEST(BytecodeVM, EntryArgumentCountIsChecked)
{
    NativeRegistry registry;
    auto program = build("fn: add(a: int, b: int) ~ int { return a + b; }");
    auto result = run(program, "add", registry, {Value::integer(2)});
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::RuntimeTypeMismatch);
}

TEST(BytecodeVM, UnknownEntryFunction)
{
    NativeRegistry registry;
    auto result = run(build("fn: main() { }"), "start", registry);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::UnknownFunction);
    EXPECT_EQ(result.error().stage(), support::Stage::Runtime);
}

TEST(BytecodeVM, UnitEntryReturnsUnit)
{
    auto result = runMain("fn: main() { var x: int = 1; }");
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().is(ValueKind::Unit));
}

TEST(BytecodeVM, IntegerArithmeticWraps)
{
    auto result = runMain(R"(
        fn: main() ~ int { return 9223372036854775807 + 1; }
    )");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().asInt(), std::numeric_limits<int64_t>::min());
}

TEST(BytecodeVM, MinDividedByMinusOne)
{
    auto result = runMain(R"(
        fn: main() ~ int {
            var min: int = -9223372036854775807 - 1;
            return min / -1;
        }
    )");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().asInt(), std::numeric_limits<int64_t>::min());
}

TEST(BytecodeVM, IntegerDivisionTruncates)
{
    auto result = runMain("fn: main() ~ int { return -7 / 2; }");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().asInt(), -3);
}

TEST(BytecodeVM, DivisionByZeroTrapsWithLine)
{
    auto result = runMain(R"(fn: div(a: int, b: int) ~ int {
    return a / b;
}
fn: main() ~ int { return div(1, 0); }
)");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::DivisionByZero);
    EXPECT_EQ(result.error().loc.line, 2u);
}

TEST(BytecodeVM, FloatDivisionByZeroIsInfinite)
{
    auto result = runMain("fn: main() ~ float { return 1.0 / 0.0; }");
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(std::isinf(result.value().asFloat()));
}

TEST(BytecodeVM, ComparisonsAndEquality)
{
    auto ok = runMain(R"(
        fn: main() ~ bool {
            var a: bool = 2.5 >= 2.5;
            var b: bool = "ab" != "ab";
            return a == !b;
        }
    )");
    ASSERT_TRUE(ok.hasValue());
    EXPECT_TRUE(ok.value().asBool());
}

TEST(BytecodeVM, DeepRecursionOverflows)
{
    RunConfig config;
    config.maxCallDepth = 64;
    auto result = runMain(R"(
        fn: down(n: int) ~ int { return down(n + 1); }
        fn: main() ~ int { return down(0); }
    )",
                          config);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::StackOverflow);
}

TEST(BytecodeVM, SmallValueStackOverflows)
{
    RunConfig config;
    config.maxStackSlots = 32;
    auto result = runMain(R"(
        fn: down(n: int) ~ int { if n == 0 { return 0; } return down(n - 1); }
        fn: main() ~ int { return down(100); }
    )",
                          config);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::StackOverflow);
}

TEST(BytecodeVM, StepLimitInterruptsEndlessLoop)
{
    RunConfig config;
    config.maxSteps = 1000;
    auto result = runMain("fn: main() { loop { } }", config);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::Interrupted);
}

TEST(BytecodeVM, HostPollCanInterrupt)
{
    int polls = 0;
    RunConfig config;
    config.interruptEveryN = 10;
    config.pollCallback = [&polls](bytecode::BytecodeVM &vm)
    {
        ++polls;
        EXPECT_EQ(vm.state(), bytecode::VMState::Running);
        return polls < 3;
    };
    auto result = runMain("fn: main() { var i: int = 0; loop { i += 1; } }", config);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::Interrupted);
    EXPECT_EQ(polls, 3);
}

TEST(BytecodeVM, PollSeesTheExecutingFunctionAndLine)
{
    NativeRegistry registry;
    auto program = build("fn: main() {\n    var i: int = 0;\n    loop { i += 1; }\n}");

    std::string function;
    uint32_t line = 0;
    uint64_t steps = 0;
    RunConfig config;
    config.interruptEveryN = 10;
    config.pollCallback = [&](bytecode::BytecodeVM &vm)
    {
        function = vm.currentFunction() ? vm.currentFunction()->name : "";
        line = vm.currentSourceLine();
        steps = vm.instrCount();
        return false;
    };

    bytecode::BytecodeVM vm(program.shared(), registry, config);
    auto result = vm.exec("main");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(function, "root::main");
    EXPECT_EQ(line, 3u);
    EXPECT_EQ(steps, 10u);

    EXPECT_EQ(vm.state(), bytecode::VMState::Trapped);
    EXPECT_EQ(vm.trapKind(), ErrorKind::Interrupted);
    EXPECT_EQ(vm.trapMessage(), result.error().message);
}

TEST(BytecodeVM, TrapStateIsKeptAfterExec)
{
    NativeRegistry registry;
    auto program = build("fn: main() ~ int {\n    var z: int = 0;\n    return 1 / z;\n}");
    bytecode::BytecodeVM vm(program.shared(), registry);

    auto result = vm.exec("main");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(vm.state(), bytecode::VMState::Trapped);
    EXPECT_EQ(vm.trapKind(), ErrorKind::DivisionByZero);
    EXPECT_EQ(vm.trapMessage(), "integer division by zero");
    EXPECT_EQ(result.error().loc.line, 3u);
    EXPECT_EQ(vm.currentSourceLine(), 0u);
}

TEST(BytecodeVM, PollThatContinuesDoesNotInterfere)
{
    int polls = 0;
    RunConfig config;
    config.interruptEveryN = 5;
    config.pollCallback = [&polls](bytecode::BytecodeVM &)
    {
        ++polls;
        return true;
    };
    auto result = runMain(R"(
        fn: main() ~ int {
            var total: int = 0;
            for i in 100 { total += i; }
            return total;
        }
    )",
                          config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().asInt(), 4950);
    EXPECT_GT(polls, 0);
}

TEST(BytecodeVM, StructsAreSharedByReference)
{
    auto result = runMain(R"(
        cont: Box { v: int; }
        fn: set(b: Box, v: int) { b.v = v; }
        fn: main() ~ int {
            var a: Box = Box { v: 1 };
            var b: Box = a;
            set(b, 7);
            return a.v;
        }
    )");
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_EQ(result.value().asInt(), 7);
}

TEST(BytecodeVM, MethodsMutateTheirReceiver)
{
    auto result = runMain(R"(
        cont: Counter { n: int; }
        impl: Counter {
            fn: bump() ~ int { n += 1; return n; }
        }
        fn: main() ~ int {
            var c: Counter = Counter { n: 0 };
            c.bump();
            c.bump();
            return c.bump();
        }
    )");
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_EQ(result.value().asInt(), 3);
}

TEST(BytecodeVM, ReturnedStructIsOwnedByTheHostOnly)
{
    auto result = runMain(R"(
        cont: Pair { a: int; b: string; }
        fn: main() ~ Pair { return Pair { b: "x", a: 2 }; }
    )");
    ASSERT_TRUE(result.hasValue());
    const Value &pair = result.value();
    ASSERT_TRUE(pair.is(ValueKind::Struct));
    EXPECT_EQ(pair.asStruct().use_count(), 1);
    EXPECT_EQ(pair.asStruct()->typeName, "Pair");
    EXPECT_EQ(pair.toString(), "Pair{2, x}");
}

TEST(BytecodeVM, StringIterationYieldsCharacters)
{
    auto result = runMain(R"(
        fn: main() ~ int {
            var count: int = 0;
            for c in "banana" { if c == "a" { count += 1; } }
            return count;
        }
    )");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().asInt(), 3);
}

TEST(BytecodeVM, VmCanBeReused)
{
    NativeRegistry registry;
    auto program = build("fn: sq(x: int) ~ int { return x * x; }");
    bytecode::BytecodeVM vm(program.shared(), registry);
    auto first = vm.exec("sq", {Value::integer(3)});
    auto second = vm.exec("sq", {Value::integer(4)});
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(first.value().asInt(), 9);
    EXPECT_EQ(second.value().asInt(), 16);
    EXPECT_EQ(vm.state(), bytecode::VMState::Halted);
    EXPECT_EQ(vm.callDepth(), 0u);
}
