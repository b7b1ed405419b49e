//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Umbrella header for the AST node headers.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Decl.hpp"
#include "frontend/AST_Expr.hpp"
#include "frontend/AST_Fwd.hpp"
#include "frontend/AST_Stmt.hpp"
#include "frontend/AST_Types.hpp"

#include <string>
#include <vector>

namespace pgs::frontend
{

/// @brief Join path segments with "::".
std::string joinPath(const std::vector<std::string> &path);

} // namespace pgs::frontend
