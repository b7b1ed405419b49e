//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record reported by every pipeline stage
//          and the error taxonomy shared by lexer, parser, resolver,
//          compiler and VM.
// Key invariants: Each ErrorKind belongs to exactly one Stage.
// Ownership/Lifetime: Diagnostics are value types owned by whoever holds them.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <string>
#include <string_view>

namespace pgs::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Pipeline stage that produced a diagnostic.
enum class Stage
{
    Lex,
    Parse,
    Resolve,
    Compile,
    Runtime
};

/// @brief Structured error classification.
/// @details Grouped by stage; stageOf() recovers the owning stage.
enum class ErrorKind
{
    // Lexer
    UnterminatedString,
    MalformedNumber,
    IllegalCharacter,
    InvalidEscape,
    UnterminatedComment,

    // Parser
    UnexpectedToken,
    UnbalancedDelimiter,
    MissingTerminator,

    // Resolver
    UnknownSymbol,
    DuplicateDefinition,
    ImportCycle,
    TypeMismatch,

    // Compiler
    UnreachableCode,
    InvalidControlFlow,
    MissingReturn,
    LimitExceeded,

    // Virtual machine
    RuntimeTypeMismatch,
    DivisionByZero,
    StackOverflow,
    UndefinedField,
    NativeArityMismatch,
    UnknownFunction,
    Interrupted,
};

/// @brief Map an error kind to the stage that reports it.
Stage stageOf(ErrorKind kind);

/// @brief Lowercase stage name ("lex", "parse", ...).
std::string_view stageName(Stage stage);

/// @brief Stable name of an error kind (e.g. "UnknownSymbol").
std::string_view errorKindName(ErrorKind kind);

/// @brief Single diagnostic message with classification and location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    ErrorKind kind;      ///< Structured classification
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location

    /// @brief Stage owning @ref kind.
    Stage stage() const
    {
        return stageOf(kind);
    }
};

} // namespace pgs::support
