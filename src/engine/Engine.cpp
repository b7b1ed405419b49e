//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/engine/Engine.cpp
// Purpose: Drive the pipeline (lex, parse, resolve, compile) and runs.
// Key invariants: Each stage runs only on the successful output of the
//                 previous one; the first diagnostic is returned unchanged.
// Links: include/pgs/Engine.hpp
//
//===----------------------------------------------------------------------===//

#include "pgs/Engine.hpp"

#include "bytecode/BytecodeCompiler.hpp"
#include "bytecode/BytecodeModule.hpp"
#include "bytecode/BytecodeVM.hpp"
#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"
#include "frontend/Resolver.hpp"

#include <iostream>
#include <optional>

namespace pgs
{

namespace
{

using frontend::DeclKind;

/// @brief Script spelling of a native parameter or return kind.
std::optional<std::string> scriptTypeName(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::Int:
            return std::string("int");
        case ValueKind::Float:
            return std::string("float");
        case ValueKind::Str:
            return std::string("string");
        case ValueKind::Bool:
            return std::string("bool");
        case ValueKind::Unit:
            return std::string("unit");
        case ValueKind::Struct:
        case ValueKind::NativeHandle:
            break;
    }
    return std::nullopt;
}

/// @brief Find the script's top-level module @p name, adding one if needed.
/// @details A module added next to a script item of the same name takes that
///          item's location, so the resulting duplicate points into the script.
frontend::ModuleDecl &topLevelModule(frontend::Program &program, const std::string &name)
{
    support::SourceLoc loc;
    for (auto &item : program.items)
    {
        if (item->name != name || item->kind == DeclKind::Impl)
            continue;
        if (item->kind == DeclKind::Module)
            return static_cast<frontend::ModuleDecl &>(*item);
        loc = item->loc;
    }
    program.items.push_back(std::make_unique<frontend::ModuleDecl>(loc, name));
    return static_cast<frontend::ModuleDecl &>(*program.items.back());
}

/// @brief Declare each registered native as a prototype in its module.
/// @details Bindings whose signature uses kinds scripts cannot spell are
///          left out, as are functions the script already declares.
void injectPrototypes(frontend::Program &program, const NativeRegistry &registry)
{
    for (const NativeBinding &binding : registry.bindings())
    {
        auto fn = std::make_unique<frontend::FunctionDecl>(support::SourceLoc{}, binding.name);
        bool expressible = true;
        for (size_t i = 0; i < binding.signature.params.size() && expressible; ++i)
        {
            auto type = scriptTypeName(binding.signature.params[i]);
            if (!type)
            {
                expressible = false;
                break;
            }
            fn->params.push_back(frontend::Param{
                {},
                "p" + std::to_string(i),
                std::make_unique<frontend::TypeNode>(support::SourceLoc{},
                                                     std::vector<std::string>{*type})});
        }
        auto ret = scriptTypeName(binding.signature.ret);
        if (!expressible || !ret)
            continue;
        if (binding.signature.ret != ValueKind::Unit)
        {
            fn->returnType = std::make_unique<frontend::TypeNode>(
                support::SourceLoc{}, std::vector<std::string>{*ret});
        }

        frontend::ModuleDecl &module = topLevelModule(program, binding.module);
        bool declared = false;
        for (const auto &item : module.items)
        {
            if (item->name != binding.name || item->kind == DeclKind::Impl)
                continue;
            if (item->kind == DeclKind::Function)
                declared = true;
            else
                fn->loc = item->loc;
        }
        if (!declared)
            module.items.push_back(std::move(fn));
    }
}

std::ostream &traceStream(const TraceConfig &cfg)
{
    return cfg.out ? *cfg.out : std::cerr;
}

support::Expected<CompiledProgram> compileImpl(std::string_view source,
                                               const NativeRegistry *registry,
                                               const CompileOptions &options)
{
    vm::TraceSink sink(options.trace);

    auto tokens = frontend::tokenize(std::string(source), options.fileId);
    if (!tokens)
        return tokens.error();
    sink.onStage("lex", "tokens=" + std::to_string(tokens.value().size()));

    frontend::Parser parser(std::move(tokens).value());
    auto program = parser.parseProgram();
    if (!program)
        return program.error();
    sink.onStage("parse", "items=" + std::to_string(program.value().items.size()));

    if (registry)
        injectPrototypes(program.value(), *registry);

    auto resolved = frontend::resolve(std::move(program).value());
    if (!resolved)
        return resolved.error();
    const frontend::ResolvedProgram &rp = resolved.value();
    sink.onStage("resolve",
                 "modules=" + std::to_string(rp.modules.size()) +
                     " functions=" + std::to_string(rp.functions.size()) +
                     " containers=" + std::to_string(rp.containers.size()));

    bytecode::BytecodeCompiler compiler;
    auto module = compiler.compile(rp);
    if (!module)
        return module.error();
    module.value().sourcePath = options.path;
    sink.onStage("compile",
                 "functions=" + std::to_string(module.value().functions.size()) +
                     " natives=" + std::to_string(module.value().nativeFuncs.size()));

    if (options.dumpBytecode)
        traceStream(options.trace) << bytecode::disassemble(module.value());

    return CompiledProgram(
        std::make_shared<const bytecode::BytecodeModule>(std::move(module).value()));
}

} // namespace

bool CompiledProgram::hasFunction(const std::string &name) const
{
    return module_->findFunction(name) || module_->findFunction("root::" + name);
}

support::Expected<CompiledProgram> compile(std::string_view source, const CompileOptions &options)
{
    return compileImpl(source, nullptr, options);
}

support::Expected<CompiledProgram> compile(std::string_view source,
                                           const NativeRegistry &registry,
                                           const CompileOptions &options)
{
    return compileImpl(source, &registry, options);
}

support::Expected<Value> run(const CompiledProgram &program,
                             const std::string &entry,
                             const NativeRegistry &registry,
                             const std::vector<Value> &args,
                             const RunConfig &config)
{
    vm::TraceSink sink(config.trace);
    sink.onStage("run", "entry=" + entry);

    bytecode::BytecodeVM machine(program.shared(), registry, config);
    auto result = machine.exec(entry, args);

    if (result)
        sink.onStage("halt", "steps=" + std::to_string(machine.instrCount()));
    else
        sink.onStage("trap",
                     std::string("kind=") +
                         std::string(support::errorKindName(result.error().kind)) +
                         " steps=" + std::to_string(machine.instrCount()));
    return result;
}

std::string disassemble(const CompiledProgram &program)
{
    return bytecode::disassemble(program.module());
}

} // namespace pgs
