//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the lightweight source position POD shared by tokens,
//          AST nodes, diagnostics and the bytecode line table.
// Key invariants: file_id == 0 denotes an invalid location; line/column are
//                 1-based when valid.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace pgs::support
{

/// @brief Represents an absolute position within a script source.
/// @invariant file_id == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier chosen by the embedder; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number; 0 when unknown.
    uint32_t column = 0;

    /// @brief Byte offset of the first character from the start of the source.
    uint32_t offset = 0;

    /// @brief Check whether the location references a tracked source.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }

    /// @brief Render as "line:column" (or "?" when unknown).
    std::string str() const;
};

} // namespace pgs::support
