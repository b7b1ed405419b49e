//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Resolver_Stmt.cpp
/// @brief Body pass: slot allocation and statement checking.
///
/// @details Slots are never reused within a function.  Parameters take the
/// first slots (after `self` for methods), then every `var`, every `for`
/// variable and the two hidden `for` slots are numbered in source order.
/// A shadowing declaration in a nested block therefore gets a slot distinct
/// from the one it hides.
///
//===----------------------------------------------------------------------===//

#include "frontend/Resolver.hpp"

namespace pgs::frontend
{

using support::ErrorKind;
using support::makeError;

uint32_t Resolver::allocateHidden(TypeDesc type)
{
    auto slot = static_cast<uint32_t>(body_->slotTypes.size());
    body_->slotTypes.push_back(type);
    return slot;
}

uint32_t Resolver::declareLocal(const std::string &name, TypeDesc type)
{
    uint32_t slot = allocateHidden(type);
    body_->blocks.back()[name] = slot;
    return slot;
}

std::optional<uint32_t> Resolver::findLocal(const std::string &name) const
{
    for (auto it = body_->blocks.rbegin(); it != body_->blocks.rend(); ++it)
    {
        auto found = it->find(name);
        if (found != it->end())
            return found->second;
    }
    return std::nullopt;
}

support::Expected<void> Resolver::resolveBody(uint32_t function)
{
    BodyScope scope;
    scope.function = function;
    scope.blocks.emplace_back();
    body_ = &scope;

    const FunctionInfo &fn = out_.functions[function];
    if (fn.receiver)
        declareLocal("self", TypeDesc::named(*fn.receiver));
    for (size_t i = 0; i < fn.params.size(); ++i)
        declareLocal(fn.decl->params[i].name, fn.params[i]);

    auto result = resolveBlock(*fn.decl->body);

    out_.functions[function].numLocals = static_cast<uint32_t>(scope.slotTypes.size());
    body_ = nullptr;
    return result;
}

support::Expected<void> Resolver::resolveBlock(const BlockStmt &block)
{
    body_->blocks.emplace_back();
    for (const auto &stmt : block.stmts)
    {
        if (auto r = resolveStmt(*stmt); !r)
            return r;
    }
    body_->blocks.pop_back();
    return {};
}

support::Expected<void> Resolver::resolveStmt(const Stmt &stmt)
{
    switch (stmt.kind)
    {
        case StmtKind::Block:
            return resolveBlock(static_cast<const BlockStmt &>(stmt));

        case StmtKind::VarDecl:
        {
            const auto &var = static_cast<const VarDeclStmt &>(stmt);
            // The initializer is checked first so it sees any outer binding
            // of the same name.
            auto init = resolveExpr(*var.init);
            if (!init)
                return init.error();
            auto declared = resolveType(currentFunction().module, *var.type);
            if (!declared)
                return declared.error();
            if (init.value() != declared.value())
            {
                return makeError(ErrorKind::TypeMismatch,
                                 var.init->loc,
                                 "cannot initialize '" + var.name + "' of type '" +
                                     out_.typeName(declared.value()) + "' with '" +
                                     out_.typeName(init.value()) + "'");
            }
            if (body_->blocks.back().count(var.name))
            {
                return makeError(ErrorKind::DuplicateDefinition,
                                 var.loc,
                                 "variable '" + var.name + "' is already declared in this block");
            }
            out_.varSlots[&var] = declareLocal(var.name, declared.value());
            return {};
        }

        case StmtKind::Return:
        {
            const auto &ret = static_cast<const ReturnStmt &>(stmt);
            const FunctionInfo &fn = currentFunction();
            if (!ret.value)
            {
                if (fn.ret.kind != TypeKind::Unit)
                {
                    return makeError(ErrorKind::TypeMismatch,
                                     ret.loc,
                                     "missing return value in function '" + fn.name +
                                         "' returning '" + out_.typeName(fn.ret) + "'");
                }
                return {};
            }
            auto value = resolveExpr(*ret.value);
            if (!value)
                return value.error();
            if (value.value() != fn.ret)
            {
                return makeError(ErrorKind::TypeMismatch,
                                 ret.value->loc,
                                 "function '" + fn.name + "' returns '" + out_.typeName(fn.ret) +
                                     "', found '" + out_.typeName(value.value()) + "'");
            }
            return {};
        }

        case StmtKind::If:
        case StmtKind::While:
        {
            const Expr *condition = nullptr;
            if (stmt.kind == StmtKind::If)
                condition = static_cast<const IfStmt &>(stmt).condition.get();
            else
                condition = static_cast<const WhileStmt &>(stmt).condition.get();

            auto cond = resolveExpr(*condition);
            if (!cond)
                return cond.error();
            if (cond.value().kind != TypeKind::Bool)
            {
                return makeError(ErrorKind::TypeMismatch,
                                 condition->loc,
                                 "condition must be 'bool', found '" +
                                     out_.typeName(cond.value()) + "'");
            }

            if (stmt.kind == StmtKind::While)
                return resolveBlock(*static_cast<const WhileStmt &>(stmt).body);

            const auto &ifStmt = static_cast<const IfStmt &>(stmt);
            if (auto r = resolveBlock(*ifStmt.thenBlock); !r)
                return r;
            if (ifStmt.elseBlock)
                return resolveBlock(*ifStmt.elseBlock);
            return {};
        }

        case StmtKind::Loop:
            return resolveBlock(*static_cast<const LoopStmt &>(stmt).body);

        case StmtKind::For:
        {
            const auto &loop = static_cast<const ForStmt &>(stmt);
            auto iterable = resolveExpr(*loop.iterable);
            if (!iterable)
                return iterable.error();

            TypeDesc element;
            bool overString = false;
            if (iterable.value().kind == TypeKind::Int)
            {
                element = TypeDesc::integer();
            }
            else if (iterable.value().kind == TypeKind::String)
            {
                element = TypeDesc::string();
                overString = true;
            }
            else
            {
                return makeError(ErrorKind::TypeMismatch,
                                 loop.iterable->loc,
                                 "cannot iterate over a value of type '" +
                                     out_.typeName(iterable.value()) + "'");
            }

            ForInfo info;
            info.seqSlot = allocateHidden(iterable.value());
            info.indexSlot = allocateHidden(TypeDesc::integer());
            info.overString = overString;

            body_->blocks.emplace_back();
            info.varSlot = declareLocal(loop.var, element);
            out_.forLoops[&loop] = info;
            auto r = resolveBlock(*loop.body);
            body_->blocks.pop_back();
            return r;
        }

        case StmtKind::Break:
        case StmtKind::Continue:
            return {};

        case StmtKind::Expr:
        {
            auto r = resolveExpr(*static_cast<const ExprStmt &>(stmt).expr);
            if (!r)
                return r.error();
            return {};
        }
    }
    return {};
}

} // namespace pgs::frontend
