//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: resolve/ResolvedCommandCall.hpp
// Purpose: Fully resolved, ready-to-invoke call.
// Key invariants: One argument Value per declared parameter of the variant;
//                 vararg parameters collapse into a single array Value.
// Ownership/Lifetime: Created once per successful resolution and never
//                     mutated; keeps its variant alive.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "call/CommandCall.hpp"
#include "descriptor/SignatureVariant.hpp"
#include "types/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace arbiter::resolve
{

/// @brief Output of a successful resolution.
struct ResolvedCommandCall
{
    std::string calleeName;                   ///< Name the call targeted
    call::Caller caller;                      ///< Who issued the call
    descriptor::SignatureVariantRef variant;  ///< Selected overload
    std::optional<call::Caller> receiver;     ///< Bound receiver, when the variant declares one
    std::vector<types::Value> arguments;      ///< Converted values, one per parameter
};

} // namespace arbiter::resolve
