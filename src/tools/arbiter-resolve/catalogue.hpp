//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/arbiter-resolve/catalogue.hpp
// Purpose: Builtin command catalogue served by the arbiter-resolve tool.
// Key invariants: Command names are unique; every variant's action writes to
//                 the stream supplied at creation.
// Ownership/Lifetime: The output stream must outlive the catalogue and every
//                     call resolved against it.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "call/CommandCall.hpp"
#include "descriptor/ArgumentContext.hpp"
#include "descriptor/SignatureVariant.hpp"
#include "support/diag_expected.hpp"
#include "types/TypeHierarchy.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arbiter::tools::cli
{

/// @brief One named command and its overload set.
struct CommandEntry
{
    std::string name;
    std::string summary;
    std::vector<descriptor::SignatureVariantRef> variants;
};

/// @brief Demo commands together with the caller types they are declared against.
///
/// Caller types form this hierarchy under Any:
///   CommandSender
///     ConsoleCommandSender
///     UserCommandSender
///       MemberCommandSender
class Catalogue
{
  public:
    /// @brief Declare the caller hierarchy and build every command.
    static support::Expected<Catalogue> create(std::ostream &out);

    const types::TypeHierarchy &hierarchy() const
    {
        return hierarchy_;
    }

    const descriptor::ArgumentContextRef &context() const
    {
        return context_;
    }

    const std::vector<CommandEntry> &commands() const
    {
        return commands_;
    }

    /// @brief Command named @p name, or null.
    const CommandEntry *find(std::string_view name) const;

    /// @brief Caller for @p role ("console", "user" or "member").
    static std::optional<call::Caller> callerFor(std::string_view role);

  private:
    Catalogue() = default;

    types::TypeHierarchy hierarchy_;
    descriptor::ArgumentContextRef context_;
    std::vector<CommandEntry> commands_;
};

} // namespace arbiter::tools::cli
