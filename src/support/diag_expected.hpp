//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides the Expected container every pipeline stage returns and
//          helpers to build and print diagnostics.
// Key invariants: An Expected holds exactly one of a value or a Diag.
// Ownership/Lifetime: Expected owns its payload by value.
// Links: support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace pgs::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with a diagnostic on error.
/// @tparam T Stored value type when the operation succeeds.
/// @note Mirrors a subset of std::expected; stages fail fast so a single
///       diagnostic is enough to describe a failure.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value() &
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const &
    {
        return *value_;
    }

    /// @brief Move the stored value out; requires hasValue().
    T &&value() &&
    {
        return std::move(*value_);
    }

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Expected specialization for void success type.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag);

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const;

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const;

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &;

  private:
    std::optional<Diag> error_;
};

/// @brief Create an error diagnostic of @p kind at @p loc.
Diag makeError(ErrorKind kind, SourceLoc loc, std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @details Output format is "path:line:col: error[stage/Kind]: message".
///          The path prefix is omitted when @p path is empty and the
///          coordinates are omitted when the location is unknown.
void printDiag(const Diag &diag, std::ostream &os, std::string_view path = {});

} // namespace pgs::support
