//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the small helpers attached to SourceLoc.  Locations are plain
// values copied into every token, node and diagnostic, so the helpers here
// stay allocation free except for the textual rendering used by messages.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace pgs::support
{

/// @brief Report whether the location refers to a tracked source.
///
/// @details The embedder assigns non-zero file identifiers when compiling;
///          synthesized nodes and runtime values created without a position
///          carry the zero id and are rendered without coordinates.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

std::string SourceLoc::str() const
{
    if (!hasLine())
        return "?";
    std::string out = std::to_string(line);
    if (hasColumn())
    {
        out += ':';
        out += std::to_string(column);
    }
    return out;
}

} // namespace pgs::support
