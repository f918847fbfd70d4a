//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic helpers that accompany the Expected container.
// The utilities here provide consistent severity-to-string mapping and a single
// printer so every subsystem, from parameter factories to the CLI, reports
// errors in a uniform format.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies diagnostic construction and printing helpers.

#include "diag_expected.hpp"

namespace arbiter::support
{
namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
///
/// @details New severity enumerators should extend this switch to maintain
///          predictable wording across command-line tools.
///
/// @param severity Severity enumeration value to translate.
/// @return Null-terminated string naming the severity level.
const char *diagSeverityToString(Severity severity)
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
} // namespace detail

/// @brief Build an error diagnostic with the provided subject and message.
///
/// @param subject What triggered the diagnostic, or empty.
/// @param msg Human-readable description of the problem.
/// @return Diagnostic populated with error severity and provided context.
Diag makeError(std::string subject, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), std::move(subject)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a subject is present the message is prefixed with
///          "<subject>: " following the common compiler diagnostic style.  The
///          function always emits a trailing newline so multiple diagnostics
///          appear as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (!diag.subject.empty())
        os << diag.subject << ": ";
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace arbiter::support
