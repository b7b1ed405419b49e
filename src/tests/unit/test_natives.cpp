//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_natives.cpp
// Purpose: Cover the native registry, prototype injection, the std module and
//          the signature checks performed before a native runs.
// Key invariants: A native whose call does not match its registered
//                 signature is never invoked.
// Ownership/Lifetime: Registries live on the test stack and outlive runs.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "bytecode/BytecodeModule.hpp"
#include "pgs/Engine.hpp"
#include "pgs/NativeRegistry.hpp"
#include "pgs/StdLib.hpp"

#include <memory>
#include <sstream>
#include <string>

using namespace pgs;
using support::ErrorKind;

namespace
{
/// @brief Register `module::name` with a handler that counts its calls.
void registerCounting(NativeRegistry &registry,
                      const std::string &module,
                      const std::string &name,
                      NativeSignature sig,
                      int &calls,
                      Value result = Value::integer(1))
{
    auto r = registry.registerFunction(module,
                                       name,
                                       std::move(sig),
                                       [&calls, result](const Value *, uint32_t, Value *out)
                                       {
                                           ++calls;
                                           *out = result;
                                       });
    ASSERT_TRUE(r.hasValue());
}

support::Expected<Value> compileAndRun(const std::string &src, const NativeRegistry &registry)
{
    auto program = compile(src, registry);
    if (!program)
        return program.error();
    return run(program.value(), "main", registry);
}
} // namespace

TEST(NativeRegistry, RegistersAndFinds)
{
    NativeRegistry registry;
    int calls = 0;
    registerCounting(registry, "host", "a", {{ValueKind::Int}, ValueKind::Int}, calls);
    registerCounting(registry, "gfx", "b", {{}, ValueKind::Unit}, calls);
    registerCounting(registry, "host", "c", {{}, ValueKind::Unit}, calls);

    EXPECT_EQ(registry.size(), 3u);
    ASSERT_NE(registry.find("host::a"), nullptr);
    EXPECT_EQ(registry.find("host::a")->signature.params.size(), 1u);
    EXPECT_EQ(registry.find("a"), nullptr);
    std::vector<std::string> modules = {"host", "gfx"};
    EXPECT_EQ(registry.modules(), modules);
}

TEST(NativeRegistry, DuplicateNameIsRejected)
{
    NativeRegistry registry;
    auto noop = [](const Value *, uint32_t, Value *) {};
    ASSERT_TRUE(registry.registerFunction("m", "f", {}, noop).hasValue());
    auto again = registry.registerFunction("m", "f", {}, noop);
    ASSERT_FALSE(again.hasValue());
    EXPECT_EQ(again.error().kind, ErrorKind::DuplicateDefinition);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(NativeRegistry, EmptyNameIsRejected)
{
    NativeRegistry registry;
    auto r = registry.registerFunction("m", "", {}, [](const Value *, uint32_t, Value *) {});
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, ErrorKind::UnknownSymbol);
}

TEST(Natives, RegisteredFunctionsNeedNoPrototype)
{
    NativeRegistry registry;
    ASSERT_TRUE(registry
                    .registerFunction("math",
                                      "twice",
                                      {{ValueKind::Int}, ValueKind::Int},
                                      [](const Value *args, uint32_t, Value *out)
                                      { *out = Value::integer(args[0].asInt() * 2); })
                    .hasValue());

    auto result = compileAndRun("fn: main() ~ int { return math::twice(21); }", registry);
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_EQ(result.value().asInt(), 42);
}

TEST(Natives, InjectedPrototypeMergesIntoScriptModule)
{
    NativeRegistry registry;
    int calls = 0;
    registerCounting(registry, "util", "one", {{}, ValueKind::Int}, calls);

    auto result = compileAndRun(R"(
        mod: util { fn: two() ~ int { return one() + one(); } }
        fn: main() ~ int { return util::two(); }
    )",
                                registry);
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_EQ(result.value().asInt(), 2);
    EXPECT_EQ(calls, 2);
}

TEST(Natives, HandleSignaturesAreNotExposed)
{
    NativeRegistry registry;
    int calls = 0;
    registerCounting(registry,
                     "fs",
                     "open",
                     {{ValueKind::Str}, ValueKind::NativeHandle},
                     calls,
                     Value::handle(NativeHandle{std::make_shared<int>(0), "file"}));

    auto program = compile("fn: main() { fs::open(\"x\"); }", registry);
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().kind, ErrorKind::UnknownSymbol);
}

TEST(Natives, ClashWithScriptItemPointsAtTheScript)
{
    NativeRegistry registry;
    int calls = 0;
    registerCounting(registry, "host", "f", {{}, ValueKind::Int}, calls);

    auto program = compile("mod: host {\n    cont: f { x: int; }\n}\nfn: main() { }", registry);
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().kind, ErrorKind::DuplicateDefinition);
    EXPECT_EQ(program.error().loc.line, 2u);
    EXPECT_EQ(program.error().loc.column, 5u);
}

TEST(Natives, ModuleClashWithScriptItemPointsAtTheScript)
{
    NativeRegistry registry;
    int calls = 0;
    registerCounting(registry, "host", "f", {{}, ValueKind::Int}, calls);

    auto program = compile("fn: main() { }\n  fn: host() { }", registry);
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().kind, ErrorKind::DuplicateDefinition);
    EXPECT_EQ(program.error().loc.line, 2u);
    EXPECT_EQ(program.error().loc.column, 3u);
}

TEST(Natives, ArityMismatchDoesNotInvoke)
{
    NativeRegistry registry;
    int calls = 0;
    registerCounting(registry, "host", "f", {{ValueKind::Int}, ValueKind::Int}, calls);

    auto result = compileAndRun(R"(
        mod: host { fn: f(a: int, b: int) ~ int; }
        fn: main() ~ int { return host::f(1, 2); }
    )",
                                registry);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::NativeArityMismatch);
    EXPECT_EQ(calls, 0);
}

TEST(Natives, ArgumentKindMismatchDoesNotInvoke)
{
    NativeRegistry registry;
    int calls = 0;
    registerCounting(registry, "host", "g", {{ValueKind::Str}, ValueKind::Int}, calls);

    auto result = compileAndRun(R"(
        mod: host { fn: g(a: int) ~ int; }
        fn: main() ~ int { return host::g(5); }
    )",
                                registry);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::RuntimeTypeMismatch);
    EXPECT_EQ(calls, 0);
}

TEST(Natives, DeclaredReturnMustMatchRegistration)
{
    NativeRegistry registry;
    int calls = 0;
    registerCounting(registry, "host", "h", {{}, ValueKind::Unit}, calls, Value::unit());

    auto result = compileAndRun(R"(
        mod: host { fn: h() ~ int; }
        fn: main() ~ int { return host::h(); }
    )",
                                registry);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::RuntimeTypeMismatch);
    EXPECT_EQ(calls, 0);
}

TEST(Natives, HandlerResultKindIsChecked)
{
    NativeRegistry registry;
    int calls = 0;
    registerCounting(
        registry, "host", "bad", {{}, ValueKind::Int}, calls, Value::string("not an int"));

    auto result = compileAndRun("fn: main() ~ int { return host::bad(); }", registry);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::RuntimeTypeMismatch);
    EXPECT_EQ(calls, 1);
}

TEST(Natives, UnregisteredPrototypeFailsAtCallTime)
{
    NativeRegistry empty;
    auto program = compile(R"(
        mod: host { fn: missing() ~ int; }
        fn: safe() ~ int { return 1; }
        fn: main() ~ int { return host::missing(); }
    )");
    ASSERT_TRUE(program.hasValue());

    auto ok = run(program.value(), "safe", empty);
    ASSERT_TRUE(ok.hasValue());

    auto result = run(program.value(), "main", empty);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ErrorKind::UnknownFunction);
}

TEST(StdLib, PrintFunctionsWriteToStream)
{
    std::ostringstream out;
    NativeRegistry registry;
    ASSERT_TRUE(registerStdLib(registry, out).hasValue());

    auto result = compileAndRun(R"(
        fn: main() ~ float {
            std::println("hello");
            std::printi(-42);
            std::print(" ");
            std::printf(2.0);
            std::print(std::itos(7));
            return std::sqrt(16.0);
        }
    )",
                                registry);
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_EQ(out.str(), "hello\n-42 2.07");
    EXPECT_DOUBLE_EQ(result.value().asFloat(), 4.0);
}

TEST(StdLib, PrintReturnsZero)
{
    std::ostringstream out;
    NativeRegistry registry;
    ASSERT_TRUE(registerStdLib(registry, out).hasValue());
    auto result = compileAndRun("fn: main() ~ int { return std::print(\"\"); }", registry);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().asInt(), 0);
}

TEST(StdLib, RegisteringTwiceFails)
{
    std::ostringstream out;
    NativeRegistry registry;
    ASSERT_TRUE(registerStdLib(registry, out).hasValue());
    auto again = registerStdLib(registry, out);
    ASSERT_FALSE(again.hasValue());
    EXPECT_EQ(again.error().kind, ErrorKind::DuplicateDefinition);
}

TEST(StdLib, NativeTableHoldsCalledNativesInFirstUseOrder)
{
    std::ostringstream out;
    NativeRegistry registry;
    ASSERT_TRUE(registerStdLib(registry, out).hasValue());

    auto idle = compile("fn: main() { }", registry);
    ASSERT_TRUE(idle.hasValue());
    EXPECT_TRUE(idle.value().module().nativeFuncs.empty());

    auto program = compile("fn: main() { std::println(std::itos(1)); std::print(\"\"); }", registry);
    ASSERT_TRUE(program.hasValue()) << program.error().message;
    const auto &natives = program.value().module().nativeFuncs;
    ASSERT_EQ(natives.size(), 3u);
    EXPECT_EQ(natives[0].name, "std::itos");
    EXPECT_EQ(natives[1].name, "std::println");
    EXPECT_EQ(natives[2].name, "std::print");
}

TEST(Natives, LargeRegistryDoesNotLimitCompilation)
{
    NativeRegistry registry;
    for (int i = 0; i < 300; ++i)
    {
        ASSERT_TRUE(registry
                        .registerFunction("host",
                                          "f" + std::to_string(i),
                                          {{}, ValueKind::Int},
                                          [i](const Value *, uint32_t, Value *out)
                                          { *out = Value::integer(i); })
                        .hasValue());
    }

    auto plain = compileAndRun("fn: main() ~ int { return 7; }", registry);
    ASSERT_TRUE(plain.hasValue()) << plain.error().message;
    EXPECT_EQ(plain.value().asInt(), 7);

    auto calling = compileAndRun("fn: main() ~ int { return host::f299() + host::f1(); }", registry);
    ASSERT_TRUE(calling.hasValue()) << calling.error().message;
    EXPECT_EQ(calling.value().asInt(), 300);
}
