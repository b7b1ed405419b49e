//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file StdLib.hpp
/// @brief The `std` native module.
///
/// | Function               | Effect                          |
/// |------------------------|---------------------------------|
/// | `print(string) ~ int`  | write the string                |
/// | `println(string) ~ int`| write the string and a newline  |
/// | `printi(int) ~ int`    | write the integer               |
/// | `printf(float) ~ int`  | write the float                 |
/// | `sqrt(float) ~ float`  | square root                     |
/// | `itos(int) ~ string`   | decimal spelling of the integer |
///
/// The printing functions return 0.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "pgs/NativeRegistry.hpp"
#include "support/diag_expected.hpp"

#include <ostream>

namespace pgs
{

/// @brief Register the `std` module, writing output to @p out.
/// @details @p out must outlive every run that uses @p registry.
support::Expected<void> registerStdLib(NativeRegistry &registry, std::ostream &out);

} // namespace pgs
