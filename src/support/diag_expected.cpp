//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers.  Each pipeline stage
// stops at its first error and hands back a single Diag, so these helpers are
// the one place where severity, stage and kind spellings are decided.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace pgs::support
{

/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @details A default-constructed `Expected` contains no diagnostic payload
///          and represents success.
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace
{
const char *severityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace

Diag makeError(ErrorKind kind, SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, kind, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a path is supplied and the location carries a line, the
///          message is prefixed with "<path>:<line>:<column>:" following the
///          common compiler diagnostic style.  Without a path the bare
///          "<line>:<column>:" prefix is kept so runtime traps still point at
///          the faulting source line.
void printDiag(const Diag &diag, std::ostream &os, std::string_view path)
{
    if (!path.empty())
        os << path << ':';
    if (diag.loc.hasLine())
        os << diag.loc.str() << ": ";
    else if (!path.empty())
        os << ' ';
    os << severityToString(diag.severity) << '[' << stageName(diag.stage()) << '/'
       << errorKindName(diag.kind) << "]: " << diag.message << '\n';
}

} // namespace pgs::support
