//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the error taxonomy helpers.  Every stage reports through the same
// Diagnostic record; the functions here translate the structured kind into
// the stage family and the stable spellings used by printDiag and tests.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

namespace pgs::support
{

Stage stageOf(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::UnterminatedString:
        case ErrorKind::MalformedNumber:
        case ErrorKind::IllegalCharacter:
        case ErrorKind::InvalidEscape:
        case ErrorKind::UnterminatedComment:
            return Stage::Lex;
        case ErrorKind::UnexpectedToken:
        case ErrorKind::UnbalancedDelimiter:
        case ErrorKind::MissingTerminator:
            return Stage::Parse;
        case ErrorKind::UnknownSymbol:
        case ErrorKind::DuplicateDefinition:
        case ErrorKind::ImportCycle:
        case ErrorKind::TypeMismatch:
            return Stage::Resolve;
        case ErrorKind::UnreachableCode:
        case ErrorKind::InvalidControlFlow:
        case ErrorKind::MissingReturn:
        case ErrorKind::LimitExceeded:
            return Stage::Compile;
        case ErrorKind::RuntimeTypeMismatch:
        case ErrorKind::DivisionByZero:
        case ErrorKind::StackOverflow:
        case ErrorKind::UndefinedField:
        case ErrorKind::NativeArityMismatch:
        case ErrorKind::UnknownFunction:
        case ErrorKind::Interrupted:
            return Stage::Runtime;
    }
    return Stage::Runtime;
}

std::string_view stageName(Stage stage)
{
    switch (stage)
    {
        case Stage::Lex:
            return "lex";
        case Stage::Parse:
            return "parse";
        case Stage::Resolve:
            return "resolve";
        case Stage::Compile:
            return "compile";
        case Stage::Runtime:
            return "runtime";
    }
    return "";
}

std::string_view errorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::UnterminatedString:
            return "UnterminatedString";
        case ErrorKind::MalformedNumber:
            return "MalformedNumber";
        case ErrorKind::IllegalCharacter:
            return "IllegalCharacter";
        case ErrorKind::InvalidEscape:
            return "InvalidEscape";
        case ErrorKind::UnterminatedComment:
            return "UnterminatedComment";
        case ErrorKind::UnexpectedToken:
            return "UnexpectedToken";
        case ErrorKind::UnbalancedDelimiter:
            return "UnbalancedDelimiter";
        case ErrorKind::MissingTerminator:
            return "MissingTerminator";
        case ErrorKind::UnknownSymbol:
            return "UnknownSymbol";
        case ErrorKind::DuplicateDefinition:
            return "DuplicateDefinition";
        case ErrorKind::ImportCycle:
            return "ImportCycle";
        case ErrorKind::TypeMismatch:
            return "TypeMismatch";
        case ErrorKind::UnreachableCode:
            return "UnreachableCode";
        case ErrorKind::InvalidControlFlow:
            return "InvalidControlFlow";
        case ErrorKind::MissingReturn:
            return "MissingReturn";
        case ErrorKind::LimitExceeded:
            return "LimitExceeded";
        case ErrorKind::RuntimeTypeMismatch:
            return "TypeMismatch";
        case ErrorKind::DivisionByZero:
            return "DivisionByZero";
        case ErrorKind::StackOverflow:
            return "StackOverflow";
        case ErrorKind::UndefinedField:
            return "UndefinedField";
        case ErrorKind::NativeArityMismatch:
            return "NativeArityMismatch";
        case ErrorKind::UnknownFunction:
            return "UnknownFunction";
        case ErrorKind::Interrupted:
            return "Interrupted";
    }
    return "";
}

} // namespace pgs::support
