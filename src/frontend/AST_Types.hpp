//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Types.hpp
/// @brief Syntactic type annotations.
///
/// @details A type annotation is a possibly qualified name: `int`, `Vec`,
/// `geo::Vec`.  Whether the name denotes a primitive or a container is
/// decided by the resolver; see Types.hpp for the semantic descriptor.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Fwd.hpp"

#include <string>
#include <vector>

namespace pgs::frontend
{

/// @brief Type annotation written in source.
struct TypeNode
{
    /// @brief Location of the first segment.
    SourceLoc loc;

    /// @brief Path segments, at least one.
    std::vector<std::string> path;

    TypeNode(SourceLoc l, std::vector<std::string> p) : loc(l), path(std::move(p)) {}

    /// @brief Segments joined with "::".
    std::string spelling() const;
};

} // namespace pgs::frontend
