//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container.
// Key invariants: An Expected holds exactly one of a value or an error payload.
// Ownership/Lifetime: Expected owns its value or error by value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace arbiter::support
{
using Diag = Diagnostic;

/// @brief Tag type selecting the value constructor when T and E coincide.
struct SuccessTag
{
    explicit SuccessTag() = default;
};

/// @brief Inline tag instance used to disambiguate success payload construction.
inline constexpr SuccessTag kSuccess{};

/// @brief Expected-style container pairing a value with an error payload.
/// @tparam T Stored value type when the operation succeeds.
/// @tparam E Error payload; a Diagnostic unless the caller needs structure.
/// @note Mirrors a subset of std::expected until the standard type is
///       available on every toolchain we build with.
template <class T, class E = Diag> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Enabled only when the provided value does not decay to @c E to
    ///          avoid colliding with the error constructor below, nor to
    ///          Expected itself so copies use the implicit constructors.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Construct a successful result when @c T and @c E are the same type.
    Expected(SuccessTag, T value) : value_(std::move(value)) {}

    /// @brief Check whether a value is present.
    /// @return True when the Expected stores a value.
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
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the error describing the failure.
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<E> error_;
};

/// @brief Expected specialization for void success type.
template <class E> class Expected<void, E>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the error describing the failure.
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<E> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with a subject and message.
/// @param subject What the diagnostic is about; may be empty.
/// @param msg Human-readable diagnostic message.
/// @return Diagnostic marked as an error severity.
Diag makeError(std::string subject, std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
/// @note Follows DiagnosticEngine::printAll formatting for consistency.
void printDiag(const Diag &diag, std::ostream &os);
} // namespace arbiter::support
