//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Resolver_Decl.cpp
/// @brief Signature pass: field, parameter and return types, container
///        containment cycles and impl attachment.
///
//===----------------------------------------------------------------------===//

#include "frontend/Resolver.hpp"

namespace pgs::frontend
{

using support::ErrorKind;
using support::makeError;

namespace
{

enum class Mark : uint8_t
{
    Unvisited,
    Visiting,
    Done,
};

/// @brief Depth-first walk over by-value container fields.
/// @details Uses an explicit stack so long containment chains cannot exhaust
///          the native stack.
/// @return The container that closes a cycle, if any.
std::optional<uint32_t> findCycle(const ResolvedProgram &rp, uint32_t root, std::vector<Mark> &marks)
{
    struct Frame
    {
        uint32_t id;
        size_t nextField;
    };
    std::vector<Frame> stack{{root, 0}};
    marks[root] = Mark::Visiting;

    while (!stack.empty())
    {
        Frame &top = stack.back();
        const auto &fields = rp.containers[top.id].fields;
        if (top.nextField == fields.size())
        {
            marks[top.id] = Mark::Done;
            stack.pop_back();
            continue;
        }
        const auto &field = fields[top.nextField++];
        if (!field.type.isContainer())
            continue;
        uint32_t next = field.type.id;
        if (marks[next] == Mark::Visiting)
            return next;
        if (marks[next] == Mark::Unvisited)
        {
            marks[next] = Mark::Visiting;
            stack.push_back(Frame{next, 0});
        }
    }
    return std::nullopt;
}

} // namespace

support::Expected<void> Resolver::resolveSignatures()
{
    for (auto &container : out_.containers)
    {
        for (const auto &field : container.decl->fields)
        {
            if (container.findField(field.name))
            {
                return makeError(ErrorKind::DuplicateDefinition,
                                 field.loc,
                                 "duplicate field '" + field.name + "' in container '" +
                                     container.name + "'");
            }
            auto type = resolveType(container.module, *field.type);
            if (!type)
                return type.error();
            container.fields.push_back(FieldInfo{field.name, type.value(), field.loc});
        }
    }

    if (auto r = checkContainerCycles(); !r)
        return r;

    // Only free functions exist at this point; methods are appended below.
    for (auto &fn : out_.functions)
    {
        if (auto r = resolveFunctionSignature(fn); !r)
            return r;
    }

    for (const auto &impl : impls_)
    {
        if (auto r = attachImpl(impl); !r)
            return r;
    }
    return {};
}

support::Expected<TypeDesc> Resolver::resolveType(uint32_t module, const TypeNode &node)
{
    if (node.path.size() == 1)
    {
        if (auto builtin = builtinType(node.path.front()))
            return *builtin;
    }

    auto sym = lookupPath(module, node.path, node.loc);
    if (!sym)
        return sym.error();
    if (sym.value().kind != SymbolKind::Container)
    {
        return makeError(ErrorKind::TypeMismatch,
                         node.loc,
                         "'" + node.spelling() + "' is a " + symbolKindName(sym.value().kind) +
                             ", not a type");
    }
    return TypeDesc::named(sym.value().id);
}

support::Expected<void> Resolver::resolveFunctionSignature(FunctionInfo &fn)
{
    const FunctionDecl &decl = *fn.decl;
    for (size_t i = 0; i < decl.params.size(); ++i)
    {
        const Param &param = decl.params[i];
        bool clash = fn.receiver && param.name == "self";
        for (size_t j = 0; j < i && !clash; ++j)
            clash = decl.params[j].name == param.name;
        if (clash)
        {
            return makeError(ErrorKind::DuplicateDefinition,
                             param.loc,
                             "duplicate parameter '" + param.name + "' in function '" + fn.name +
                                 "'");
        }

        auto type = resolveType(fn.module, *param.type);
        if (!type)
            return type.error();
        fn.params.push_back(type.value());
    }

    if (decl.returnType)
    {
        auto ret = resolveType(fn.module, *decl.returnType);
        if (!ret)
            return ret.error();
        fn.ret = ret.value();
    }
    else
    {
        fn.ret = TypeDesc::unit();
    }
    return {};
}

support::Expected<void> Resolver::checkContainerCycles()
{
    std::vector<Mark> marks(out_.containers.size(), Mark::Unvisited);
    for (uint32_t id = 0; id < out_.containers.size(); ++id)
    {
        if (marks[id] != Mark::Unvisited)
            continue;
        if (auto hit = findCycle(out_, id, marks))
        {
            const ContainerInfo &c = out_.containers[*hit];
            return makeError(ErrorKind::TypeMismatch,
                             c.decl->loc,
                             "container '" + c.name + "' contains itself");
        }
    }
    return {};
}

/// @brief Attach the methods of one impl block to its container.
support::Expected<void> Resolver::attachImpl(const PendingImpl &impl)
{
    const ImplDecl &decl = *impl.decl;
    auto sym = lookupPath(impl.module, {decl.name}, decl.loc);
    if (!sym)
        return sym.error();
    if (sym.value().kind != SymbolKind::Container)
    {
        return makeError(ErrorKind::TypeMismatch,
                         decl.loc,
                         "impl target '" + decl.name + "' is a " +
                             symbolKindName(sym.value().kind) + ", not a container");
    }
    const uint32_t container = sym.value().id;

    for (const auto &method : decl.methods)
    {
        ContainerInfo &owner = out_.containers[container];
        auto prev = owner.methods.find(method->name);
        if (prev != owner.methods.end())
        {
            return makeError(ErrorKind::DuplicateDefinition,
                             method->loc,
                             "duplicate method '" + method->name + "' on container '" + owner.name +
                                 "' (previous at " +
                                 out_.functions[prev->second].decl->loc.str() + ")");
        }
        if (method->isPrototype())
        {
            return makeError(ErrorKind::TypeMismatch,
                             method->loc,
                             "method '" + owner.name + "::" + method->name + "' has no body");
        }

        FunctionInfo info;
        info.name = method->name;
        info.qualifiedName = owner.qualifiedName + "::" + method->name;
        info.module = impl.module;
        info.decl = method.get();
        info.receiver = container;
        if (auto r = resolveFunctionSignature(info); !r)
            return r;

        auto id = static_cast<uint32_t>(out_.functions.size());
        out_.functions.push_back(std::move(info));
        out_.containers[container].methods.emplace(method->name, id);
    }
    return {};
}

} // namespace pgs::frontend
