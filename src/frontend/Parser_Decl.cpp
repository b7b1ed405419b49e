//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Decl.cpp
/// @brief Declaration parsing: modules, containers, impls, functions,
///        imports and type annotations.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace pgs::frontend
{

using support::ErrorKind;

support::Expected<Program> Parser::parseProgram()
{
    Program program;
    program.fileId = peek().loc.file_id;

    while (!check(TokenKind::Eof))
    {
        DeclPtr item = parseItem();
        if (!item)
            return *error_;
        program.items.push_back(std::move(item));
    }
    return program;
}

support::Expected<ExprPtr> Parser::parseStandaloneExpression()
{
    ExprPtr expr = parseExpression();
    if (!expr)
        return *error_;
    if (!check(TokenKind::Eof))
    {
        error(ErrorKind::UnexpectedToken, "expected end of input, found " + describe(peek()));
        return *error_;
    }
    return expr;
}

/// @brief Parse one item, dispatching on its leading keyword.
DeclPtr Parser::parseItem()
{
    switch (peek().kind)
    {
        case TokenKind::KwMod:
            return parseModuleDecl();
        case TokenKind::KwCont:
            return parseContainerDecl();
        case TokenKind::KwImpl:
            return parseImplDecl();
        case TokenKind::KwFn:
            return parseFunctionDecl();
        case TokenKind::KwImport:
            return parseImportDecl();
        case TokenKind::RBrace:
        case TokenKind::RParen:
            error(ErrorKind::UnbalancedDelimiter, "unmatched " + describe(peek()));
            return nullptr;
        default:
            error(ErrorKind::UnexpectedToken,
                  "expected 'mod', 'cont', 'impl', 'fn' or 'import', found " + describe(peek()));
            return nullptr;
    }
}

DeclPtr Parser::parseModuleDecl()
{
    Token kw = advance();
    Token name;
    if (!expect(TokenKind::Colon, "':' after 'mod'") ||
        !expect(TokenKind::Identifier, "module name", &name) ||
        !expect(TokenKind::LBrace, "'{'"))
        return nullptr;

    auto mod = std::make_unique<ModuleDecl>(kw.loc, name.text);
    if (!enterNesting())
        return nullptr;
    while (!check(TokenKind::RBrace))
    {
        if (check(TokenKind::Eof))
        {
            error(ErrorKind::UnbalancedDelimiter,
                  "expected '}' to close module '" + name.text + "', found end of input");
            return nullptr;
        }
        DeclPtr item = parseItem();
        if (!item)
            return nullptr;
        mod->items.push_back(std::move(item));
    }
    --nestDepth_;
    advance();
    return mod;
}

DeclPtr Parser::parseContainerDecl()
{
    Token kw = advance();
    Token name;
    if (!expect(TokenKind::Colon, "':' after 'cont'") ||
        !expect(TokenKind::Identifier, "container name", &name) ||
        !expect(TokenKind::LBrace, "'{'"))
        return nullptr;

    auto cont = std::make_unique<ContainerDecl>(kw.loc, name.text);
    while (!check(TokenKind::RBrace))
    {
        if (check(TokenKind::Eof))
        {
            error(ErrorKind::UnbalancedDelimiter,
                  "expected '}' to close container '" + name.text + "', found end of input");
            return nullptr;
        }
        Token field;
        if (!expect(TokenKind::Identifier, "field name", &field) ||
            !expect(TokenKind::Colon, "':' after field name"))
            return nullptr;
        TypePtr type = parseType();
        if (!type || !expect(TokenKind::Semicolon, "';' after field"))
            return nullptr;
        cont->fields.push_back(FieldDecl{field.loc, field.text, std::move(type)});
    }
    advance();
    return cont;
}

DeclPtr Parser::parseImplDecl()
{
    Token kw = advance();
    Token name;
    if (!expect(TokenKind::Colon, "':' after 'impl'") ||
        !expect(TokenKind::Identifier, "container name", &name) ||
        !expect(TokenKind::LBrace, "'{'"))
        return nullptr;

    auto impl = std::make_unique<ImplDecl>(kw.loc, name.text);
    while (!check(TokenKind::RBrace))
    {
        if (check(TokenKind::Eof))
        {
            error(ErrorKind::UnbalancedDelimiter,
                  "expected '}' to close impl '" + name.text + "', found end of input");
            return nullptr;
        }
        if (!check(TokenKind::KwFn))
        {
            error(ErrorKind::UnexpectedToken, "expected 'fn' inside impl, found " + describe(peek()));
            return nullptr;
        }
        auto fn = parseFunctionDecl();
        if (!fn)
            return nullptr;
        impl->methods.push_back(std::move(fn));
    }
    advance();
    return impl;
}

std::unique_ptr<FunctionDecl> Parser::parseFunctionDecl()
{
    Token kw = advance();
    Token name;
    if (!expect(TokenKind::Colon, "':' after 'fn'") ||
        !expect(TokenKind::Identifier, "function name", &name) ||
        !expect(TokenKind::LParen, "'('"))
        return nullptr;

    auto fn = std::make_unique<FunctionDecl>(kw.loc, name.text);
    if (!parseParameters(fn->params))
        return nullptr;

    if (match(TokenKind::Tilde))
    {
        fn->returnType = parseType();
        if (!fn->returnType)
            return nullptr;
    }

    // Prototype: no body, declared for a native binding.
    if (match(TokenKind::Semicolon))
        return fn;

    if (!check(TokenKind::LBrace))
    {
        error(ErrorKind::UnexpectedToken, "expected '{' or ';' after function signature, found " +
                                              describe(peek()));
        return nullptr;
    }
    fn->body = parseBlock();
    if (!fn->body)
        return nullptr;
    return fn;
}

bool Parser::parseParameters(std::vector<Param> &out)
{
    if (match(TokenKind::RParen))
        return true;

    do
    {
        Token name;
        if (!expect(TokenKind::Identifier, "parameter name", &name) ||
            !expect(TokenKind::Colon, "':' after parameter name"))
            return false;
        TypePtr type = parseType();
        if (!type)
            return false;
        out.push_back(Param{name.loc, name.text, std::move(type)});
    } while (match(TokenKind::Comma));

    return expect(TokenKind::RParen, "')' after parameters");
}

DeclPtr Parser::parseImportDecl()
{
    Token kw = advance();
    std::vector<std::string> path;
    Token seg;
    if (!expect(TokenKind::Identifier, "import path", &seg))
        return nullptr;
    path.push_back(seg.text);
    while (match(TokenKind::ColonColon))
    {
        if (!expect(TokenKind::Identifier, "path segment after '::'", &seg))
            return nullptr;
        path.push_back(seg.text);
    }

    std::string alias = path.back();
    bool explicitAlias = false;
    if (match(TokenKind::Equal))
    {
        Token aliasTok;
        if (!expect(TokenKind::Identifier, "alias name after '='", &aliasTok))
            return nullptr;
        alias = aliasTok.text;
        explicitAlias = true;
    }
    if (!expect(TokenKind::Semicolon, "';' after import"))
        return nullptr;

    auto imp = std::make_unique<ImportDecl>(kw.loc, std::move(alias), std::move(path));
    imp->explicitAlias = explicitAlias;
    return imp;
}

TypePtr Parser::parseType()
{
    Token seg;
    if (!expect(TokenKind::Identifier, "type name", &seg))
        return nullptr;
    SourceLoc loc = seg.loc;
    std::vector<std::string> path{seg.text};
    while (match(TokenKind::ColonColon))
    {
        if (!expect(TokenKind::Identifier, "type name after '::'", &seg))
            return nullptr;
        path.push_back(seg.text);
    }
    return std::make_unique<TypeNode>(loc, std::move(path));
}

} // namespace pgs::frontend
