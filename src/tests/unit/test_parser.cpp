//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_parser.cpp
// Purpose: Check AST shape for declarations, statements and precedence, and
//          the classification of syntax errors.
// Key invariants: Parsing stops at the first error and reports its location.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/AST.hpp"
#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"

#include <string>

using namespace pgs::frontend;
using pgs::support::ErrorKind;
using pgs::support::Expected;

namespace
{
Expected<Program> parseSource(const std::string &src)
{
    auto tokens = tokenize(src);
    if (!tokens)
        return tokens.error();
    return parse(std::move(tokens).value());
}

Expected<ExprPtr> parseExpr(const std::string &src)
{
    auto tokens = tokenize(src);
    if (!tokens)
        return tokens.error();
    Parser parser(std::move(tokens).value());
    return parser.parseStandaloneExpression();
}

const FunctionDecl &asFunction(const DeclPtr &decl)
{
    EXPECT_EQ(decl->kind, DeclKind::Function);
    return static_cast<const FunctionDecl &>(*decl);
}
} // namespace

TEST(Parser, ItemsOfEveryKind)
{
    auto program = parseSource(R"(
        import geo::dist = d;
        mod: geo {
            fn: dist(a: float, b: float) ~ float { return a - b; }
        }
        cont: Vec { x: float; y: float; }
        impl: Vec { fn: len() ~ float { return x; } }
        fn: main() { }
    )");
    ASSERT_TRUE(program.hasValue()) << program.error().message;
    const auto &items = program.value().items;
    ASSERT_EQ(items.size(), 5u);

    EXPECT_EQ(items[0]->kind, DeclKind::Import);
    const auto &imp = static_cast<const ImportDecl &>(*items[0]);
    EXPECT_EQ(imp.name, "d");
    EXPECT_EQ(imp.target(), "geo::dist");
    EXPECT_TRUE(imp.explicitAlias);

    EXPECT_EQ(items[1]->kind, DeclKind::Module);
    const auto &geo = static_cast<const ModuleDecl &>(*items[1]);
    ASSERT_EQ(geo.items.size(), 1u);
    const auto &dist = asFunction(geo.items[0]);
    ASSERT_EQ(dist.params.size(), 2u);
    EXPECT_EQ(dist.params[1].name, "b");
    ASSERT_TRUE(dist.returnType);
    EXPECT_EQ(dist.returnType->spelling(), "float");

    const auto &vec = static_cast<const ContainerDecl &>(*items[2]);
    ASSERT_EQ(vec.fields.size(), 2u);
    EXPECT_EQ(vec.fields[0].name, "x");

    const auto &impl = static_cast<const ImplDecl &>(*items[3]);
    EXPECT_EQ(impl.name, "Vec");
    ASSERT_EQ(impl.methods.size(), 1u);

    const auto &main = asFunction(items[4]);
    EXPECT_FALSE(main.returnType);
    ASSERT_TRUE(main.body);
    EXPECT_TRUE(main.body->stmts.empty());
}

TEST(Parser, ImportAliasDefaultsToLastSegment)
{
    auto program = parseSource("import a::b::c;");
    ASSERT_TRUE(program.hasValue());
    const auto &imp = static_cast<const ImportDecl &>(*program.value().items[0]);
    EXPECT_EQ(imp.name, "c");
    EXPECT_FALSE(imp.explicitAlias);
}

TEST(Parser, PrototypeHasNoBody)
{
    auto program = parseSource("mod: std { fn: sqrt(x: float) ~ float; }");
    ASSERT_TRUE(program.hasValue());
    const auto &stdMod = static_cast<const ModuleDecl &>(*program.value().items[0]);
    const auto &sqrt = asFunction(stdMod.items[0]);
    EXPECT_TRUE(sqrt.isPrototype());
}

TEST(Parser, MultiplicationBindsTighterThanAddition)
{
    auto expr = parseExpr("1 + 2 * 3");
    ASSERT_TRUE(expr.hasValue());
    ASSERT_EQ(expr.value()->kind, ExprKind::Binary);
    const auto &add = static_cast<const BinaryExpr &>(*expr.value());
    EXPECT_EQ(add.op, BinaryOp::Add);
    ASSERT_EQ(add.right->kind, ExprKind::Binary);
    EXPECT_EQ(static_cast<const BinaryExpr &>(*add.right).op, BinaryOp::Mul);
}

TEST(Parser, SubtractionIsLeftAssociative)
{
    auto expr = parseExpr("10 - 4 - 3");
    ASSERT_TRUE(expr.hasValue());
    const auto &outer = static_cast<const BinaryExpr &>(*expr.value());
    EXPECT_EQ(outer.op, BinaryOp::Sub);
    ASSERT_EQ(outer.left->kind, ExprKind::Binary);
    EXPECT_EQ(outer.right->kind, ExprKind::IntLiteral);
}

TEST(Parser, ComparisonBelowArithmeticAboveEquality)
{
    auto expr = parseExpr("a + 1 < b == true");
    ASSERT_TRUE(expr.hasValue());
    const auto &eq = static_cast<const BinaryExpr &>(*expr.value());
    EXPECT_EQ(eq.op, BinaryOp::Eq);
    const auto &lt = static_cast<const BinaryExpr &>(*eq.left);
    EXPECT_EQ(lt.op, BinaryOp::Lt);
    EXPECT_EQ(lt.left->kind, ExprKind::Binary);
}

TEST(Parser, CompoundAssignmentDesugars)
{
    auto expr = parseExpr("x += 2");
    ASSERT_TRUE(expr.hasValue());
    ASSERT_EQ(expr.value()->kind, ExprKind::Assign);
    const auto &assign = static_cast<const AssignExpr &>(*expr.value());
    EXPECT_EQ(assign.target->kind, ExprKind::Ident);
    ASSERT_EQ(assign.value->kind, ExprKind::Binary);
    EXPECT_EQ(static_cast<const BinaryExpr &>(*assign.value).op, BinaryOp::Add);
}

TEST(Parser, PostfixChains)
{
    auto expr = parseExpr("v.inner.len(1, 2)");
    ASSERT_TRUE(expr.hasValue());
    ASSERT_EQ(expr.value()->kind, ExprKind::MethodCall);
    const auto &call = static_cast<const MethodCallExpr &>(*expr.value());
    EXPECT_EQ(call.method, "len");
    EXPECT_EQ(call.args.size(), 2u);
    EXPECT_EQ(call.receiver->kind, ExprKind::Field);
}

TEST(Parser, QualifiedCallAndStructLiteral)
{
    auto expr = parseExpr("geo::Vec { x: std::sqrt(2.0), y: 1.0 }");
    ASSERT_TRUE(expr.hasValue());
    ASSERT_EQ(expr.value()->kind, ExprKind::StructLiteral);
    const auto &lit = static_cast<const StructLiteralExpr &>(*expr.value());
    EXPECT_EQ(lit.type->spelling(), "geo::Vec");
    ASSERT_EQ(lit.fields.size(), 2u);
    EXPECT_EQ(lit.fields[0].value->kind, ExprKind::Call);
}

TEST(Parser, ConditionIsNotAStructLiteral)
{
    auto program = parseSource("fn: f(ok: bool) { if ok { return; } else if !ok { } }");
    ASSERT_TRUE(program.hasValue()) << program.error().message;
    const auto &f = asFunction(program.value().items[0]);
    ASSERT_EQ(f.body->stmts.size(), 1u);
    const auto &ifStmt = static_cast<const IfStmt &>(*f.body->stmts[0]);
    ASSERT_TRUE(ifStmt.elseBlock);
    ASSERT_EQ(ifStmt.elseBlock->stmts.size(), 1u);
    EXPECT_EQ(ifStmt.elseBlock->stmts[0]->kind, StmtKind::If);
}

TEST(Parser, LoopStatements)
{
    auto program = parseSource(R"(
        fn: f() {
            var i: int = 0;
            while i < 3 { i = i + 1; continue; }
            loop { break; }
            for c in "abc" { }
        }
    )");
    ASSERT_TRUE(program.hasValue()) << program.error().message;
    const auto &body = asFunction(program.value().items[0]).body->stmts;
    ASSERT_EQ(body.size(), 4u);
    EXPECT_EQ(body[0]->kind, StmtKind::VarDecl);
    EXPECT_EQ(body[1]->kind, StmtKind::While);
    EXPECT_EQ(body[2]->kind, StmtKind::Loop);
    ASSERT_EQ(body[3]->kind, StmtKind::For);
    EXPECT_EQ(static_cast<const ForStmt &>(*body[3]).var, "c");
}

TEST(Parser, MissingSemicolon)
{
    auto program = parseSource("fn: f() { var x: int = 1 }");
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().kind, ErrorKind::MissingTerminator);
}

TEST(Parser, UnclosedBlock)
{
    auto program = parseSource("fn: f() { return;");
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().kind, ErrorKind::UnbalancedDelimiter);
}

TEST(Parser, StrayClosingBrace)
{
    auto program = parseSource("}");
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().kind, ErrorKind::UnbalancedDelimiter);
}

TEST(Parser, UnexpectedTokenReportsPosition)
{
    auto program = parseSource("fn: f() {\n  var = 3;\n}");
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().kind, ErrorKind::UnexpectedToken);
    EXPECT_EQ(program.error().loc.line, 2u);
    EXPECT_EQ(program.error().loc.column, 7u);
}

TEST(Parser, InvalidAssignmentTarget)
{
    auto expr = parseExpr("1 = 2");
    ASSERT_FALSE(expr.hasValue());
    EXPECT_EQ(expr.error().kind, ErrorKind::UnexpectedToken);
}

TEST(Parser, ItemRequiresColonAfterKeyword)
{
    auto program = parseSource("fn main() {}");
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().kind, ErrorKind::UnexpectedToken);
}

// ============================================================================
// Nesting limits
// ============================================================================

namespace
{
std::string repeat(const std::string &piece, size_t count)
{
    std::string out;
    out.reserve(piece.size() * count);
    for (size_t i = 0; i < count; ++i)
        out += piece;
    return out;
}

void expectTooDeep(const Expected<Program> &program)
{
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().kind, ErrorKind::UnexpectedToken);
    EXPECT_NE(program.error().message.find("too deep"), std::string::npos)
        << program.error().message;
}
} // namespace

TEST(Parser, OperatorChainBelowLimitParses)
{
    auto expr = parseExpr("1" + repeat(" + 1", 200) + repeat(" * 2", 200));
    ASSERT_TRUE(expr.hasValue()) << expr.error().message;
}

TEST(Parser, LongOperatorChainIsRejected)
{
    expectTooDeep(parseSource("fn: main() ~ int { return 1" + repeat("+1", 30000) + "; }"));
    expectTooDeep(parseSource("fn: main() ~ bool { return 1" + repeat(" < 1 == true", 20000) + "; }"));
}

TEST(Parser, LongFieldChainIsRejected)
{
    expectTooDeep(parseSource("fn: main() { var x: int = p" + repeat(".f", 30000) + "; }"));
}

TEST(Parser, LongAssignmentChainIsRejected)
{
    expectTooDeep(parseSource("fn: main() { " + repeat("a = ", 30000) + "1; }"));
}

TEST(Parser, NestedBlocksBelowLimitParse)
{
    auto program = parseSource("fn: main() ~ int { " + repeat("{ ", 100) + "return 0; " +
                               repeat("} ", 100) + "}");
    ASSERT_TRUE(program.hasValue()) << program.error().message;
}

TEST(Parser, DeeplyNestedBlocksAreRejected)
{
    expectTooDeep(parseSource("fn: main() ~ int { " + repeat("{ ", 20000) + "return 0; " +
                              repeat("} ", 20000) + "}"));
    expectTooDeep(
        parseSource("fn: main() { " + repeat("if true { ", 5000) + repeat("} ", 5000) + "}"));
}

TEST(Parser, LongElseIfChainIsRejected)
{
    expectTooDeep(parseSource("fn: main() { if false { }" + repeat(" else if false { }", 20000) +
                              " }"));
}

TEST(Parser, DeeplyNestedModulesAreRejected)
{
    expectTooDeep(parseSource(repeat("mod: m { ", 20000) + repeat("} ", 20000)));
}
