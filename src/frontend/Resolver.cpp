//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Resolver.cpp
/// @brief Resolver entry point, collect pass, import pass and path lookup.
///
//===----------------------------------------------------------------------===//

#include "frontend/Resolver.hpp"

namespace pgs::frontend
{

using support::ErrorKind;
using support::makeError;

namespace
{

constexpr const char *kRootModule = "root";

std::string stripRoot(const std::string &qualified)
{
    const std::string prefix = std::string(kRootModule) + "::";
    if (qualified.compare(0, prefix.size(), prefix) == 0)
        return qualified.substr(prefix.size());
    return qualified;
}

} // namespace

//===----------------------------------------------------------------------===//
// ResolvedProgram
//===----------------------------------------------------------------------===//

const char *symbolKindName(SymbolKind kind)
{
    switch (kind)
    {
        case SymbolKind::Module:
            return "module";
        case SymbolKind::Function:
            return "function";
        case SymbolKind::Container:
            return "container";
        case SymbolKind::ImportAlias:
            return "import alias";
    }
    return "symbol";
}

std::optional<uint32_t> ContainerInfo::findField(const std::string &field) const
{
    for (size_t i = 0; i < fields.size(); ++i)
    {
        if (fields[i].name == field)
            return static_cast<uint32_t>(i);
    }
    return std::nullopt;
}

TypeDesc ResolvedProgram::typeOf(const Expr &expr) const
{
    auto it = exprTypes.find(&expr);
    return it == exprTypes.end() ? TypeDesc::unit() : it->second;
}

std::optional<uint32_t> ResolvedProgram::findFunction(const std::string &qualifiedName) const
{
    for (size_t i = 0; i < functions.size(); ++i)
    {
        if (functions[i].qualifiedName == qualifiedName)
            return static_cast<uint32_t>(i);
    }
    return std::nullopt;
}

std::string ResolvedProgram::typeName(TypeDesc type) const
{
    switch (type.kind)
    {
        case TypeKind::Named:
            return stripRoot(containers[type.id].qualifiedName);
        case TypeKind::NativeFunction:
            return "native function '" + stripRoot(functions[type.id].qualifiedName) + "'";
        default:
            return typeKindName(type.kind);
    }
}

//===----------------------------------------------------------------------===//
// Driver
//===----------------------------------------------------------------------===//

support::Expected<void> Resolver::run()
{
    ModuleScope root;
    root.name = kRootModule;
    root.qualifiedName = kRootModule;
    out_.modules.push_back(std::move(root));

    if (auto r = collectItems(out_.program.items, 0); !r)
        return r;
    if (auto r = resolveImports(); !r)
        return r;
    if (auto r = resolveSignatures(); !r)
        return r;

    for (uint32_t i = 0; i < out_.functions.size(); ++i)
    {
        if (out_.functions[i].isNative())
            continue;
        if (auto r = resolveBody(i); !r)
            return r;
    }
    return {};
}

support::Expected<ResolvedProgram> resolve(Program program)
{
    ResolvedProgram resolved;
    resolved.program = std::move(program);

    Resolver resolver(resolved);
    auto result = resolver.run();
    if (!result)
        return result.error();
    return std::move(resolved);
}

//===----------------------------------------------------------------------===//
// Pass 1: Collect
//===----------------------------------------------------------------------===//

support::Expected<void> Resolver::declare(uint32_t module, const std::string &name, Symbol sym)
{
    auto &scope = out_.modules[module];
    auto [it, inserted] = scope.symbols.emplace(name, sym);
    if (!inserted)
    {
        return makeError(ErrorKind::DuplicateDefinition,
                         sym.loc,
                         "duplicate definition of '" + name + "' in module '" +
                             scope.qualifiedName + "' (previous " +
                             symbolKindName(it->second.kind) + " at " + it->second.loc.str() +
                             ")");
    }
    return {};
}

support::Expected<void> Resolver::collectItems(const std::vector<DeclPtr> &items, uint32_t module)
{
    for (const auto &item : items)
    {
        const std::string qualified = out_.modules[module].qualifiedName + "::" + item->name;

        switch (item->kind)
        {
            case DeclKind::Module:
            {
                const auto &decl = static_cast<const ModuleDecl &>(*item);
                auto id = static_cast<uint32_t>(out_.modules.size());
                if (auto r = declare(module, decl.name, Symbol{SymbolKind::Module, id, decl.loc}); !r)
                    return r;

                ModuleScope scope;
                scope.name = decl.name;
                scope.qualifiedName = qualified;
                scope.parent = module;
                out_.modules.push_back(std::move(scope));
                out_.modules[module].children.push_back(id);

                if (auto r = collectItems(decl.items, id); !r)
                    return r;
                break;
            }
            case DeclKind::Container:
            {
                const auto &decl = static_cast<const ContainerDecl &>(*item);
                auto id = static_cast<uint32_t>(out_.containers.size());
                if (auto r = declare(module, decl.name, Symbol{SymbolKind::Container, id, decl.loc}); !r)
                    return r;

                ContainerInfo info;
                info.name = decl.name;
                info.qualifiedName = qualified;
                info.module = module;
                info.decl = &decl;
                out_.containers.push_back(std::move(info));
                break;
            }
            case DeclKind::Function:
            {
                const auto &decl = static_cast<const FunctionDecl &>(*item);
                auto id = static_cast<uint32_t>(out_.functions.size());
                if (auto r = declare(module, decl.name, Symbol{SymbolKind::Function, id, decl.loc}); !r)
                    return r;

                FunctionInfo info;
                info.name = decl.name;
                info.qualifiedName = qualified;
                info.module = module;
                info.decl = &decl;
                out_.functions.push_back(std::move(info));
                break;
            }
            case DeclKind::Import:
            {
                const auto &decl = static_cast<const ImportDecl &>(*item);
                auto id = static_cast<uint32_t>(out_.imports.size());
                if (auto r = declare(module, decl.name, Symbol{SymbolKind::ImportAlias, id, decl.loc}); !r)
                    return r;
                out_.imports.push_back(ImportInfo{&decl, module, std::nullopt});
                break;
            }
            case DeclKind::Impl:
                impls_.push_back(PendingImpl{static_cast<const ImplDecl *>(item.get()), module});
                break;
        }
    }
    return {};
}

//===----------------------------------------------------------------------===//
// Pass 2: Imports
//===----------------------------------------------------------------------===//

support::Expected<void> Resolver::resolveImports()
{
    for (uint32_t i = 0; i < out_.imports.size(); ++i)
    {
        std::set<uint32_t> visiting;
        auto r = resolveAlias(i, visiting);
        if (!r)
            return r.error();
    }
    return {};
}

support::Expected<Symbol> Resolver::resolveAlias(uint32_t index, std::set<uint32_t> &visiting)
{
    if (out_.imports[index].target)
        return *out_.imports[index].target;

    const ImportDecl &decl = *out_.imports[index].decl;
    if (!visiting.insert(index).second)
    {
        return makeError(ErrorKind::ImportCycle,
                         decl.loc,
                         "import cycle through alias '" + decl.name + "' (" + decl.target() + ")");
    }

    auto target = lookupPath(out_.imports[index].module, decl.path, decl.loc, visiting, index);
    if (!target)
        return target;

    visiting.erase(index);
    out_.imports[index].target = target.value();
    return target;
}

support::Expected<Symbol> Resolver::lookupPath(uint32_t module,
                                               const std::vector<std::string> &path,
                                               SourceLoc loc)
{
    std::set<uint32_t> visiting;
    return lookupPath(module, path, loc, visiting);
}

/// @brief Walk @p path segment by segment.
/// @details The first segment is searched in @p module and then in each
///          enclosing module.  Every later segment must name a member of the
///          module reached so far.  Aliases are replaced by their targets as
///          they are met, so the returned symbol is never an ImportAlias.
support::Expected<Symbol> Resolver::lookupPath(uint32_t module,
                                               const std::vector<std::string> &path,
                                               SourceLoc loc,
                                               std::set<uint32_t> &visiting,
                                               std::optional<uint32_t> skipImport)
{
    std::optional<Symbol> found;
    for (std::optional<uint32_t> scope = module; scope; scope = out_.modules[*scope].parent)
    {
        const auto &symbols = out_.modules[*scope].symbols;
        auto it = symbols.find(path.front());
        if (it == symbols.end())
            continue;
        if (skipImport && it->second.kind == SymbolKind::ImportAlias && it->second.id == *skipImport)
            continue;
        found = it->second;
        break;
    }
    if (!found)
        return makeError(ErrorKind::UnknownSymbol, loc, "unknown symbol '" + path.front() + "'");

    Symbol current = *found;
    for (size_t i = 0;; ++i)
    {
        if (current.kind == SymbolKind::ImportAlias)
        {
            auto target = resolveAlias(current.id, visiting);
            if (!target)
                return target;
            current = target.value();
        }
        if (i + 1 == path.size())
            break;

        const std::string &segment = path[i + 1];
        if (current.kind != SymbolKind::Module)
        {
            return makeError(ErrorKind::UnknownSymbol,
                             loc,
                             "unknown symbol '" + segment + "': '" + path[i] + "' is a " +
                                 symbolKindName(current.kind) + ", not a module");
        }
        const ModuleScope &scope = out_.modules[current.id];
        auto it = scope.symbols.find(segment);
        if (it == scope.symbols.end())
        {
            return makeError(ErrorKind::UnknownSymbol,
                             loc,
                             "unknown symbol '" + segment + "' in module '" +
                                 stripRoot(scope.qualifiedName) + "'");
        }
        current = it->second;
    }
    return current;
}

} // namespace pgs::frontend
