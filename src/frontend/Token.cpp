//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Token kind spellings used by parser diagnostics ("expected ';', found
// 'identifier'").
//
//===----------------------------------------------------------------------===//

#include "frontend/Token.hpp"

namespace pgs::frontend
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "invalid token";
        case TokenKind::IntLiteral:
            return "integer literal";
        case TokenKind::FloatLiteral:
            return "float literal";
        case TokenKind::StringLiteral:
            return "string literal";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::KwBreak:
            return "'break'";
        case TokenKind::KwCont:
            return "'cont'";
        case TokenKind::KwContinue:
            return "'continue'";
        case TokenKind::KwElse:
            return "'else'";
        case TokenKind::KwFalse:
            return "'false'";
        case TokenKind::KwFn:
            return "'fn'";
        case TokenKind::KwFor:
            return "'for'";
        case TokenKind::KwIf:
            return "'if'";
        case TokenKind::KwImpl:
            return "'impl'";
        case TokenKind::KwImport:
            return "'import'";
        case TokenKind::KwIn:
            return "'in'";
        case TokenKind::KwLoop:
            return "'loop'";
        case TokenKind::KwMod:
            return "'mod'";
        case TokenKind::KwReturn:
            return "'return'";
        case TokenKind::KwTrue:
            return "'true'";
        case TokenKind::KwVar:
            return "'var'";
        case TokenKind::KwWhile:
            return "'while'";
        case TokenKind::Plus:
            return "'+'";
        case TokenKind::Minus:
            return "'-'";
        case TokenKind::Star:
            return "'*'";
        case TokenKind::Slash:
            return "'/'";
        case TokenKind::PlusEqual:
            return "'+='";
        case TokenKind::MinusEqual:
            return "'-='";
        case TokenKind::StarEqual:
            return "'*='";
        case TokenKind::SlashEqual:
            return "'/='";
        case TokenKind::EqualEqual:
            return "'=='";
        case TokenKind::BangEqual:
            return "'!='";
        case TokenKind::Less:
            return "'<'";
        case TokenKind::LessEqual:
            return "'<='";
        case TokenKind::Greater:
            return "'>'";
        case TokenKind::GreaterEqual:
            return "'>='";
        case TokenKind::Equal:
            return "'='";
        case TokenKind::ColonColon:
            return "'::'";
        case TokenKind::Colon:
            return "':'";
        case TokenKind::Tilde:
            return "'~'";
        case TokenKind::Bang:
            return "'!'";
        case TokenKind::LBrace:
            return "'{'";
        case TokenKind::RBrace:
            return "'}'";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::Semicolon:
            return "';'";
        case TokenKind::Dot:
            return "'.'";
    }
    return "unknown";
}

} // namespace pgs::frontend
