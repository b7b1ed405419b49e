//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_resolver.cpp
// Purpose: Exercise module scoping, import aliases, slot allocation and
//          static type checking.
// Key invariants: Resolution fails on the first diagnostic; successful runs
//                 bind every identifier and call in function bodies.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"
#include "frontend/Resolver.hpp"

#include <string>

using namespace pgs::frontend;
using pgs::support::ErrorKind;
using pgs::support::Expected;

namespace
{
Expected<ResolvedProgram> resolveSource(const std::string &src)
{
    auto tokens = tokenize(src);
    if (!tokens)
        return tokens.error();
    auto program = parse(std::move(tokens).value());
    if (!program)
        return program.error();
    return resolve(std::move(program).value());
}

ErrorKind resolveError(const std::string &src)
{
    auto resolved = resolveSource(src);
    EXPECT_FALSE(resolved.hasValue()) << src;
    return resolved ? ErrorKind::Interrupted : resolved.error().kind;
}
} // namespace

TEST(Resolver, NestedModulesGetQualifiedNames)
{
    auto rp = resolveSource(R"(
        mod: outer { mod: inner { fn: f() ~ int { return 1; } } }
        fn: main() ~ int { return outer::inner::f(); }
    )");
    ASSERT_TRUE(rp.hasValue()) << rp.error().message;
    const auto &r = rp.value();
    ASSERT_EQ(r.modules.size(), 3u);
    EXPECT_EQ(r.modules[0].qualifiedName, "root");
    EXPECT_EQ(r.modules[2].qualifiedName, "root::outer::inner");
    EXPECT_TRUE(r.findFunction("root::outer::inner::f").has_value());
    EXPECT_TRUE(r.findFunction("root::main").has_value());
}

TEST(Resolver, ForwardReferencesAcrossModules)
{
    auto rp = resolveSource(R"(
        fn: main() ~ float { return geo::half(3.0); }
        mod: geo { fn: half(x: float) ~ float { return x / 2.0; } }
    )");
    EXPECT_TRUE(rp.hasValue());
}

TEST(Resolver, InnerModuleSeesOuterItems)
{
    auto rp = resolveSource(R"(
        fn: one() ~ int { return 1; }
        mod: m { fn: two() ~ int { return one() + one(); } }
    )");
    EXPECT_TRUE(rp.hasValue());
}

TEST(Resolver, ImportAliasBindsTarget)
{
    auto rp = resolveSource(R"(
        import geo::dist = d;
        mod: geo { fn: dist(a: float) ~ float { return a; } }
        fn: main() ~ float { return d(1.0); }
    )");
    ASSERT_TRUE(rp.hasValue()) << rp.error().message;
    const auto &r = rp.value();
    ASSERT_EQ(r.imports.size(), 1u);
    ASSERT_TRUE(r.imports[0].target.has_value());
    EXPECT_EQ(r.imports[0].target->kind, SymbolKind::Function);
    EXPECT_EQ(r.functions[r.imports[0].target->id].qualifiedName, "root::geo::dist");
}

TEST(Resolver, AliasNamedLikeItsTargetLooksOutward)
{
    auto rp = resolveSource(R"(
        mod: util { fn: id(x: int) ~ int { return x; } }
        mod: app {
            import util;
            fn: run() ~ int { return util::id(4); }
        }
    )");
    EXPECT_TRUE(rp.hasValue());
}

TEST(Resolver, ImportCycleIsReported)
{
    EXPECT_EQ(resolveError("import a = b; import b = a;"), ErrorKind::ImportCycle);
}

TEST(Resolver, UnknownImportTarget)
{
    EXPECT_EQ(resolveError("import nowhere::thing;"), ErrorKind::UnknownSymbol);
}

TEST(Resolver, UndefinedIdentifierCarriesPosition)
{
    auto rp = resolveSource("fn: main() ~ int {\n    return missing + 1;\n}");
    ASSERT_FALSE(rp.hasValue());
    EXPECT_EQ(rp.error().kind, ErrorKind::UnknownSymbol);
    EXPECT_EQ(rp.error().loc.line, 2u);
    EXPECT_EQ(rp.error().loc.column, 12u);
    EXPECT_NE(rp.error().message.find("missing"), std::string::npos);
}

TEST(Resolver, DuplicateItemInModule)
{
    EXPECT_EQ(resolveError("fn: f() {} cont: f { x: int; }"), ErrorKind::DuplicateDefinition);
}

TEST(Resolver, SameBlockRedeclarationIsRejected)
{
    EXPECT_EQ(resolveError("fn: f() { var x: int = 1; var x: int = 2; }"),
              ErrorKind::DuplicateDefinition);
}

TEST(Resolver, ShadowingAllocatesNewSlots)
{
    auto rp = resolveSource(R"(
        fn: f(x: int) ~ int {
            var x: int = x + 1;
            { var x: float = 2.0; }
            return x;
        }
    )");
    ASSERT_TRUE(rp.hasValue()) << rp.error().message;
    const auto &fn = rp.value().functions[*rp.value().findFunction("root::f")];
    EXPECT_EQ(fn.numLocals, 3u);
}

TEST(Resolver, ForLoopReservesHiddenSlots)
{
    auto rp = resolveSource(R"(
        fn: f(n: int) ~ int {
            var total: int = 0;
            for i in n { total += i; }
            return total;
        }
    )");
    ASSERT_TRUE(rp.hasValue()) << rp.error().message;
    const auto &r = rp.value();
    ASSERT_EQ(r.forLoops.size(), 1u);
    const ForInfo &info = r.forLoops.begin()->second;
    EXPECT_FALSE(info.overString);
    EXPECT_EQ(r.functions[*r.findFunction("root::f")].numLocals, 5u);
}

TEST(Resolver, MethodsBindReceiverFields)
{
    auto rp = resolveSource(R"(
        cont: Counter { count: int; }
        impl: Counter {
            fn: bump() ~ int { count = count + 1; return count; }
        }
    )");
    ASSERT_TRUE(rp.hasValue()) << rp.error().message;
    const auto &r = rp.value();
    auto id = r.findFunction("root::Counter::bump");
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(r.functions[*id].receiver.has_value());
    EXPECT_EQ(r.functions[*id].paramSlots(), 1u);

    bool sawField = false;
    for (const auto &[expr, ref] : r.identRefs)
        sawField = sawField || ref.kind == IdentRef::Kind::ReceiverField;
    EXPECT_TRUE(sawField);
}

TEST(Resolver, StructLiteralRecordsDeclarationOrder)
{
    auto rp = resolveSource(R"(
        cont: P { a: int; b: int; }
        fn: mk() ~ P { return P { b: 2, a: 1 }; }
    )");
    ASSERT_TRUE(rp.hasValue()) << rp.error().message;
    const auto &r = rp.value();
    ASSERT_EQ(r.structLiterals.size(), 1u);
    const auto &order = r.structLiterals.begin()->second.initOrder;
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 1u);
    EXPECT_EQ(order[1], 0u);
}

TEST(Resolver, TypeErrors)
{
    EXPECT_EQ(resolveError("fn: f() { var x: int = 1.5; }"), ErrorKind::TypeMismatch);
    EXPECT_EQ(resolveError("fn: f() ~ int { return 1 + 2.0; }"), ErrorKind::TypeMismatch);
    EXPECT_EQ(resolveError("fn: f() { if 1 { } }"), ErrorKind::TypeMismatch);
    EXPECT_EQ(resolveError("fn: f() ~ int { return; }"), ErrorKind::TypeMismatch);
    EXPECT_EQ(resolveError("fn: g(a: int) {} fn: f() { g(); }"), ErrorKind::TypeMismatch);
    EXPECT_EQ(resolveError("fn: g() {} fn: f() { var x: int = g; }"), ErrorKind::TypeMismatch);
    EXPECT_EQ(resolveError("fn: f() { for c in 1.0 { } }"), ErrorKind::TypeMismatch);
}

TEST(Resolver, StructLiteralErrors)
{
    EXPECT_EQ(resolveError("cont: P { a: int; } fn: f() ~ P { return P { }; }"),
              ErrorKind::TypeMismatch);
    EXPECT_EQ(resolveError("cont: P { a: int; } fn: f() ~ P { return P { a: 1, a: 2 }; }"),
              ErrorKind::DuplicateDefinition);
    EXPECT_EQ(resolveError("cont: P { a: int; } fn: f() ~ P { return P { z: 1 }; }"),
              ErrorKind::UnknownSymbol);
}

TEST(Resolver, ContainerCannotContainItself)
{
    EXPECT_EQ(resolveError("cont: A { b: B; } cont: B { a: A; }"), ErrorKind::TypeMismatch);
}

TEST(Resolver, ImplPrototypeIsRejected)
{
    EXPECT_EQ(resolveError("cont: A { x: int; } impl: A { fn: f() ~ int; }"),
              ErrorKind::TypeMismatch);
}

TEST(Resolver, DuplicateMethodAcrossImplBlocks)
{
    EXPECT_EQ(resolveError("cont: A { x: int; } impl: A { fn: f() {} } impl: A { fn: f() {} }"),
              ErrorKind::DuplicateDefinition);
}
