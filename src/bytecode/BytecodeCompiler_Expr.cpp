//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file BytecodeCompiler_Expr.cpp
/// @brief Expression lowering.
///
/// @details Every expression leaves exactly one value on the operand stack.
/// Calls to unit functions push unit, and assignments push the assigned value.
///
//===----------------------------------------------------------------------===//

#include "bytecode/BytecodeCompiler.hpp"

#include <limits>

namespace pgs::bytecode
{

using namespace frontend;

namespace
{

BCOpcode binaryOpcode(BinaryOp op, bool isFloat)
{
    switch (op)
    {
        case BinaryOp::Add:
            return isFloat ? BCOpcode::ADD_F64 : BCOpcode::ADD_I64;
        case BinaryOp::Sub:
            return isFloat ? BCOpcode::SUB_F64 : BCOpcode::SUB_I64;
        case BinaryOp::Mul:
            return isFloat ? BCOpcode::MUL_F64 : BCOpcode::MUL_I64;
        case BinaryOp::Div:
            return isFloat ? BCOpcode::DIV_F64 : BCOpcode::SDIV_I64_CHK;
        case BinaryOp::Eq:
            return BCOpcode::CMP_EQ;
        case BinaryOp::Ne:
            return BCOpcode::CMP_NE;
        case BinaryOp::Lt:
            return isFloat ? BCOpcode::CMP_LT_F64 : BCOpcode::CMP_LT_I64;
        case BinaryOp::Le:
            return isFloat ? BCOpcode::CMP_LE_F64 : BCOpcode::CMP_LE_I64;
        case BinaryOp::Gt:
            return isFloat ? BCOpcode::CMP_GT_F64 : BCOpcode::CMP_GT_I64;
        case BinaryOp::Ge:
            return isFloat ? BCOpcode::CMP_GE_F64 : BCOpcode::CMP_GE_I64;
    }
    return BCOpcode::NOP;
}

} // namespace

support::Expected<void> BytecodeCompiler::compileExpr(const Expr &expr)
{
    currentLine_ = expr.loc.line;

    switch (expr.kind)
    {
        case ExprKind::IntLiteral:
            return emitInt(static_cast<const IntLiteralExpr &>(expr).value, expr.loc);

        case ExprKind::FloatLiteral:
        {
            auto idx = index16(module_.addF64(static_cast<const FloatLiteralExpr &>(expr).value),
                               "float constants",
                               expr.loc);
            if (!idx)
                return idx.error();
            emit16(BCOpcode::LOAD_F64, idx.value());
            pushStack();
            return {};
        }

        case ExprKind::StringLiteral:
        {
            auto idx = index16(module_.addString(static_cast<const StringLiteralExpr &>(expr).value),
                               "string constants",
                               expr.loc);
            if (!idx)
                return idx.error();
            emit16(BCOpcode::LOAD_STR, idx.value());
            pushStack();
            return {};
        }

        case ExprKind::BoolLiteral:
            emit(static_cast<const BoolLiteralExpr &>(expr).value ? BCOpcode::LOAD_TRUE
                                                                  : BCOpcode::LOAD_FALSE);
            pushStack();
            return {};

        case ExprKind::Ident:
            return compileIdent(static_cast<const IdentExpr &>(expr));
        case ExprKind::Binary:
            return compileBinary(static_cast<const BinaryExpr &>(expr));
        case ExprKind::Unary:
            return compileUnary(static_cast<const UnaryExpr &>(expr));
        case ExprKind::Call:
            return compileCall(expr, nullptr, static_cast<const CallExpr &>(expr).args);

        case ExprKind::Field:
        {
            const auto &field = static_cast<const FieldExpr &>(expr);
            if (auto r = compileExpr(*field.base); !r)
                return r;
            currentLine_ = expr.loc.line;
            emit16(BCOpcode::LOAD_FIELD, static_cast<uint16_t>(program_->fieldIndices.at(&field)));
            return {};
        }

        case ExprKind::MethodCall:
        {
            const auto &call = static_cast<const MethodCallExpr &>(expr);
            return compileCall(expr, call.receiver.get(), call.args);
        }

        case ExprKind::Assign:
            return compileAssign(static_cast<const AssignExpr &>(expr));
        case ExprKind::StructLiteral:
            return compileStructLiteral(static_cast<const StructLiteralExpr &>(expr));
    }
    return {};
}

/// @brief Small integers are encoded inline; the rest go to the i64 pool.
support::Expected<void> BytecodeCompiler::emitInt(int64_t value, SourceLoc loc)
{
    if (value >= std::numeric_limits<int16_t>::min() &&
        value <= std::numeric_limits<int16_t>::max())
    {
        emitI16(BCOpcode::LOAD_I16, static_cast<int16_t>(value));
    }
    else
    {
        auto idx = index16(module_.addI64(value), "integer constants", loc);
        if (!idx)
            return idx.error();
        emit16(BCOpcode::LOAD_I64, idx.value());
    }
    pushStack();
    return {};
}

support::Expected<void> BytecodeCompiler::compileIdent(const IdentExpr &expr)
{
    const IdentRef &ref = program_->identRefs.at(&expr);
    emit16(BCOpcode::LOAD_LOCAL, static_cast<uint16_t>(ref.slot));
    pushStack();
    if (ref.kind == IdentRef::Kind::ReceiverField)
        emit16(BCOpcode::LOAD_FIELD, static_cast<uint16_t>(ref.field));
    return {};
}

support::Expected<void> BytecodeCompiler::compileBinary(const BinaryExpr &expr)
{
    if (auto r = compileExpr(*expr.left); !r)
        return r;
    if (auto r = compileExpr(*expr.right); !r)
        return r;

    currentLine_ = expr.loc.line;
    const bool isFloat = program_->typeOf(*expr.left).kind == TypeKind::Float;
    emit(binaryOpcode(expr.op, isFloat));
    popStack();
    return {};
}

support::Expected<void> BytecodeCompiler::compileUnary(const UnaryExpr &expr)
{
    if (auto r = compileExpr(*expr.operand); !r)
        return r;

    currentLine_ = expr.loc.line;
    if (expr.op == UnaryOp::Not)
        emit(BCOpcode::NOT_BOOL);
    else if (program_->typeOf(*expr.operand).kind == TypeKind::Float)
        emit(BCOpcode::NEG_F64);
    else
        emit(BCOpcode::NEG_I64);
    return {};
}

/// @brief Lower a call or method call.
/// @details A method's receiver is passed first and lands in slot 0 (`self`).
support::Expected<void> BytecodeCompiler::compileCall(const Expr &call,
                                                      const Expr *receiver,
                                                      const std::vector<ExprPtr> &args)
{
    const uint32_t target = program_->callTargets.at(&call);
    const FunctionInfo &callee = program_->functions[target];

    int32_t argc = static_cast<int32_t>(args.size());
    if (receiver)
    {
        if (auto r = compileExpr(*receiver); !r)
            return r;
        ++argc;
    }
    for (const auto &arg : args)
    {
        if (auto r = compileExpr(*arg); !r)
            return r;
    }

    currentLine_ = call.loc.line;
    if (callee.isNative())
    {
        auto index = nativeIndex(target, call.loc);
        if (!index)
            return index.error();
        emit88(BCOpcode::CALL_NATIVE,
               static_cast<uint8_t>(index.value()),
               static_cast<uint8_t>(argc));
    }
    else
    {
        emit16(BCOpcode::CALL, static_cast<uint16_t>(targetIndex_[target]));
    }
    popStack(argc);
    pushStack();
    return {};
}

support::Expected<void> BytecodeCompiler::compileAssign(const AssignExpr &expr)
{
    if (expr.target->kind == ExprKind::Ident)
    {
        const IdentRef &ref = program_->identRefs.at(static_cast<const IdentExpr *>(expr.target.get()));
        if (ref.kind == IdentRef::Kind::Local)
        {
            if (auto r = compileExpr(*expr.value); !r)
                return r;
            currentLine_ = expr.loc.line;
            emit(BCOpcode::DUP);
            pushStack();
            emit16(BCOpcode::STORE_LOCAL, static_cast<uint16_t>(ref.slot));
            popStack();
            return {};
        }

        // Bare field name inside a method: store through `self`.
        emit16(BCOpcode::LOAD_LOCAL, static_cast<uint16_t>(ref.slot));
        pushStack();
        if (auto r = compileExpr(*expr.value); !r)
            return r;
        currentLine_ = expr.loc.line;
        emit16(BCOpcode::STORE_FIELD, static_cast<uint16_t>(ref.field));
        popStack();
        return {};
    }

    const auto &field = static_cast<const FieldExpr &>(*expr.target);
    if (auto r = compileExpr(*field.base); !r)
        return r;
    if (auto r = compileExpr(*expr.value); !r)
        return r;
    currentLine_ = expr.loc.line;
    emit16(BCOpcode::STORE_FIELD, static_cast<uint16_t>(program_->fieldIndices.at(&field)));
    popStack();
    return {};
}

/// @brief Evaluate initializers in declaration order, then build the instance.
support::Expected<void> BytecodeCompiler::compileStructLiteral(const StructLiteralExpr &expr)
{
    const StructLiteralInfo &info = program_->structLiterals.at(&expr);
    const ContainerInfo &container = program_->containers[info.container];

    for (uint32_t init : info.initOrder)
    {
        if (auto r = compileExpr(*expr.fields[init].value); !r)
            return r;
    }

    StructLayout layout;
    layout.name = program_->typeName(TypeDesc::named(info.container));
    for (const auto &field : container.fields)
        layout.fieldNames.push_back(field.name);

    auto idx = index16(module_.addLayout(layout), "container layouts", expr.loc);
    if (!idx)
        return idx.error();

    currentLine_ = expr.loc.line;
    emit16(BCOpcode::NEW_STRUCT, idx.value());
    popStack(static_cast<int32_t>(info.initOrder.size()));
    pushStack();
    return {};
}

} // namespace pgs::bytecode
