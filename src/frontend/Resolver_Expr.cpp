//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Resolver_Expr.cpp
/// @brief Expression binding and type checking.
///
//===----------------------------------------------------------------------===//

#include "frontend/Resolver.hpp"

namespace pgs::frontend
{

using support::ErrorKind;
using support::makeError;

namespace
{

bool isArithmetic(BinaryOp op)
{
    return op == BinaryOp::Add || op == BinaryOp::Sub || op == BinaryOp::Mul ||
           op == BinaryOp::Div;
}

bool isEquality(BinaryOp op)
{
    return op == BinaryOp::Eq || op == BinaryOp::Ne;
}

} // namespace

/// @brief Bind @p expr and compute its type.
/// @param expr The expression to resolve.
/// @return The static type, or the first ResolveError found below @p expr.
support::Expected<TypeDesc> Resolver::resolveExpr(const Expr &expr)
{
    support::Expected<TypeDesc> type = TypeDesc::unit();
    switch (expr.kind)
    {
        case ExprKind::IntLiteral:
            type = TypeDesc::integer();
            break;
        case ExprKind::FloatLiteral:
            type = TypeDesc::floating();
            break;
        case ExprKind::StringLiteral:
            type = TypeDesc::string();
            break;
        case ExprKind::BoolLiteral:
            type = TypeDesc::boolean();
            break;
        case ExprKind::Ident:
            type = resolveIdent(static_cast<const IdentExpr &>(expr));
            break;
        case ExprKind::Binary:
            type = resolveBinary(static_cast<const BinaryExpr &>(expr));
            break;
        case ExprKind::Unary:
            type = resolveUnary(static_cast<const UnaryExpr &>(expr));
            break;
        case ExprKind::Call:
            type = resolveCall(static_cast<const CallExpr &>(expr));
            break;
        case ExprKind::Field:
            type = resolveField(static_cast<const FieldExpr &>(expr));
            break;
        case ExprKind::MethodCall:
            type = resolveMethodCall(static_cast<const MethodCallExpr &>(expr));
            break;
        case ExprKind::Assign:
            type = resolveAssign(static_cast<const AssignExpr &>(expr));
            break;
        case ExprKind::StructLiteral:
            type = resolveStructLiteral(static_cast<const StructLiteralExpr &>(expr));
            break;
    }

    if (type)
        out_.exprTypes[&expr] = type.value();
    return type;
}

/// @brief Bind an identifier used as a value.
/// @details Functions, containers and modules are not values; naming one
///          here is a TypeMismatch rather than an UnknownSymbol.
support::Expected<TypeDesc> Resolver::resolveIdent(const IdentExpr &expr)
{
    if (expr.path.size() == 1)
    {
        const std::string &name = expr.path.front();
        if (auto slot = findLocal(name))
        {
            out_.identRefs[&expr] = IdentRef{IdentRef::Kind::Local, *slot, 0};
            return body_->slotTypes[*slot];
        }

        const FunctionInfo &fn = currentFunction();
        if (fn.receiver)
        {
            const ContainerInfo &self = out_.containers[*fn.receiver];
            if (auto field = self.findField(name))
            {
                out_.identRefs[&expr] = IdentRef{IdentRef::Kind::ReceiverField, 0, *field};
                return self.fields[*field].type;
            }
        }
    }

    auto sym = lookupPath(currentFunction().module, expr.path, expr.loc);
    if (!sym)
        return sym.error();

    std::string what = std::string(symbolKindName(sym.value().kind)) + " '" + expr.spelling() + "'";
    if (sym.value().kind == SymbolKind::Function && out_.functions[sym.value().id].isNative())
        what = out_.typeName(TypeDesc::nativeFunction(sym.value().id));
    return makeError(ErrorKind::TypeMismatch, expr.loc, what + " cannot be used as a value");
}

/// @brief Type-check a binary operator.
/// @details Arithmetic and ordering need two ints or two floats; equality
///          needs operands of one type.
/// @return Bool for comparisons, otherwise the operand type.
support::Expected<TypeDesc> Resolver::resolveBinary(const BinaryExpr &expr)
{
    auto lhs = resolveExpr(*expr.left);
    if (!lhs)
        return lhs;
    auto rhs = resolveExpr(*expr.right);
    if (!rhs)
        return rhs;

    const TypeDesc l = lhs.value();
    const TypeDesc r = rhs.value();

    if (isEquality(expr.op))
    {
        if (l != r)
        {
            return makeError(ErrorKind::TypeMismatch,
                             expr.loc,
                             "cannot compare '" + out_.typeName(l) + "' with '" + out_.typeName(r) +
                                 "'");
        }
        return TypeDesc::boolean();
    }

    if (l != r || !l.isNumeric())
    {
        return makeError(ErrorKind::TypeMismatch,
                         expr.loc,
                         std::string("operator '") + binaryOpSpelling(expr.op) +
                             "' requires two 'int' or two 'float' operands, found '" +
                             out_.typeName(l) + "' and '" + out_.typeName(r) + "'");
    }
    return isArithmetic(expr.op) ? l : TypeDesc::boolean();
}

/// @brief Type-check `-x` (int or float) and `!x` (bool).
support::Expected<TypeDesc> Resolver::resolveUnary(const UnaryExpr &expr)
{
    auto operand = resolveExpr(*expr.operand);
    if (!operand)
        return operand;

    const TypeDesc t = operand.value();
    if (expr.op == UnaryOp::Neg)
    {
        if (!t.isNumeric())
        {
            return makeError(ErrorKind::TypeMismatch,
                             expr.loc,
                             "unary '-' requires 'int' or 'float', found '" + out_.typeName(t) +
                                 "'");
        }
        return t;
    }

    if (t.kind != TypeKind::Bool)
    {
        return makeError(ErrorKind::TypeMismatch,
                         expr.loc,
                         "unary '!' requires 'bool', found '" + out_.typeName(t) + "'");
    }
    return t;
}

/// @brief Match call arguments against @p callee's parameters.
/// @param callee Target function; for methods the receiver is not counted.
/// @param args Argument expressions in source order.
/// @param loc Call position used for count mismatches.
support::Expected<void> Resolver::checkArguments(const FunctionInfo &callee,
                                                 const std::vector<ExprPtr> &args,
                                                 SourceLoc loc)
{
    if (args.size() != callee.params.size())
    {
        return makeError(ErrorKind::TypeMismatch,
                         loc,
                         "'" + callee.name + "' expects " + std::to_string(callee.params.size()) +
                             " argument(s), found " + std::to_string(args.size()));
    }

    for (size_t i = 0; i < args.size(); ++i)
    {
        auto arg = resolveExpr(*args[i]);
        if (!arg)
            return arg.error();
        if (arg.value() != callee.params[i])
        {
            return makeError(ErrorKind::TypeMismatch,
                             args[i]->loc,
                             "argument " + std::to_string(i + 1) + " of '" + callee.name +
                                 "' must be '" + out_.typeName(callee.params[i]) + "', found '" +
                                 out_.typeName(arg.value()) + "'");
        }
    }
    return {};
}

/// @brief Bind the callee path of a free function call and check its arguments.
/// @return The callee's return type.
support::Expected<TypeDesc> Resolver::resolveCall(const CallExpr &expr)
{
    // The parser only builds calls on named callees.
    const auto &callee = static_cast<const IdentExpr &>(*expr.callee);

    if (callee.path.size() == 1 && findLocal(callee.path.front()))
    {
        return makeError(ErrorKind::TypeMismatch,
                         callee.loc,
                         "'" + callee.spelling() + "' is a local variable, not a function");
    }

    auto sym = lookupPath(currentFunction().module, callee.path, callee.loc);
    if (!sym)
        return sym.error();
    if (sym.value().kind != SymbolKind::Function)
    {
        return makeError(ErrorKind::TypeMismatch,
                         callee.loc,
                         "'" + callee.spelling() + "' is a " + symbolKindName(sym.value().kind) +
                             ", not a function");
    }

    const uint32_t target = sym.value().id;
    if (auto r = checkArguments(out_.functions[target], expr.args, expr.loc); !r)
        return r.error();

    out_.callTargets[&expr] = target;
    return out_.functions[target].ret;
}

/// @brief Bind `base.field` to a field index of the base's container.
support::Expected<TypeDesc> Resolver::resolveField(const FieldExpr &expr)
{
    auto base = resolveExpr(*expr.base);
    if (!base)
        return base;
    if (!base.value().isContainer())
    {
        return makeError(ErrorKind::TypeMismatch,
                         expr.loc,
                         "field access '." + expr.field + "' on non-container type '" +
                             out_.typeName(base.value()) + "'");
    }

    const ContainerInfo &c = out_.containers[base.value().id];
    auto field = c.findField(expr.field);
    if (!field)
    {
        return makeError(ErrorKind::UnknownSymbol,
                         expr.loc,
                         "container '" + c.name + "' has no field '" + expr.field + "'");
    }
    out_.fieldIndices[&expr] = *field;
    return c.fields[*field].type;
}

/// @brief Bind `receiver.method(args)` through the container's impl methods.
/// @return The method's return type.
support::Expected<TypeDesc> Resolver::resolveMethodCall(const MethodCallExpr &expr)
{
    auto receiver = resolveExpr(*expr.receiver);
    if (!receiver)
        return receiver;
    if (!receiver.value().isContainer())
    {
        return makeError(ErrorKind::TypeMismatch,
                         expr.loc,
                         "method call '." + expr.method + "()' on non-container type '" +
                             out_.typeName(receiver.value()) + "'");
    }

    const ContainerInfo &c = out_.containers[receiver.value().id];
    auto it = c.methods.find(expr.method);
    if (it == c.methods.end())
    {
        return makeError(ErrorKind::UnknownSymbol,
                         expr.loc,
                         "container '" + c.name + "' has no method '" + expr.method + "'");
    }

    const uint32_t target = it->second;
    if (auto r = checkArguments(out_.functions[target], expr.args, expr.loc); !r)
        return r.error();

    out_.callTargets[&expr] = target;
    return out_.functions[target].ret;
}

/// @brief Check that the assigned value matches the target's type.
/// @return The target type, which is also the type of the assignment.
support::Expected<TypeDesc> Resolver::resolveAssign(const AssignExpr &expr)
{
    auto target = resolveExpr(*expr.target);
    if (!target)
        return target;
    auto value = resolveExpr(*expr.value);
    if (!value)
        return value;

    if (target.value() != value.value())
    {
        return makeError(ErrorKind::TypeMismatch,
                         expr.value->loc,
                         "cannot assign '" + out_.typeName(value.value()) + "' to a target of type '" +
                             out_.typeName(target.value()) + "'");
    }
    return target;
}

/// @brief Check `Name { field: expr, ... }` against the container layout.
support::Expected<TypeDesc> Resolver::resolveStructLiteral(const StructLiteralExpr &expr)
{
    auto type = resolveType(currentFunction().module, *expr.type);
    if (!type)
        return type;
    if (!type.value().isContainer())
    {
        return makeError(ErrorKind::TypeMismatch,
                         expr.loc,
                         "'" + expr.type->spelling() + "' is not a container");
    }

    const uint32_t id = type.value().id;
    const ContainerInfo &c = out_.containers[id];
    constexpr uint32_t kUnset = ~0u;
    std::vector<uint32_t> initOrder(c.fields.size(), kUnset);

    for (size_t i = 0; i < expr.fields.size(); ++i)
    {
        const FieldInit &init = expr.fields[i];
        auto field = c.findField(init.name);
        if (!field)
        {
            return makeError(ErrorKind::UnknownSymbol,
                             init.loc,
                             "container '" + c.name + "' has no field '" + init.name + "'");
        }
        if (initOrder[*field] != kUnset)
        {
            return makeError(ErrorKind::DuplicateDefinition,
                             init.loc,
                             "field '" + init.name + "' is initialized more than once");
        }

        auto value = resolveExpr(*init.value);
        if (!value)
            return value;
        if (value.value() != c.fields[*field].type)
        {
            return makeError(ErrorKind::TypeMismatch,
                             init.value->loc,
                             "field '" + init.name + "' of '" + c.name + "' is '" +
                                 out_.typeName(c.fields[*field].type) + "', found '" +
                                 out_.typeName(value.value()) + "'");
        }
        initOrder[*field] = static_cast<uint32_t>(i);
    }

    for (size_t f = 0; f < initOrder.size(); ++f)
    {
        if (initOrder[f] == kUnset)
        {
            return makeError(ErrorKind::TypeMismatch,
                             expr.loc,
                             "missing field '" + c.fields[f].name + "' in literal of '" + c.name +
                                 "'");
        }
    }

    out_.structLiterals[&expr] = StructLiteralInfo{id, std::move(initOrder)};
    return type;
}

} // namespace pgs::frontend
