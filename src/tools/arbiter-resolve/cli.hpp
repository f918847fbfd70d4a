//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the driver behind the `arbiter-resolve` CLI. The entry point is
// factored out of main so tests can run the tool with captured streams.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Reusable driver for the `arbiter-resolve` executable.

#pragma once

#include <iosfwd>

namespace arbiter::tools::cli
{

/// @brief Version banner printed by `--version`.
inline constexpr const char *kVersion = "0.1.0";

/// @brief Exit status for usage errors and resolution failures.
inline constexpr int kExitResolutionFailure = 1;

/// @brief Exit status when the selected command itself fails.
inline constexpr int kExitExecutionFailure = 2;

/// @brief Run the arbiter-resolve CLI with injectable streams.
/// @param argc Argument count supplied by the caller.
/// @param argv Argument vector: options, then the callee name and its arguments.
/// @param out Stream receiving command output and listings.
/// @param err Stream receiving usage text, diagnostics and trace records.
/// @return 0 on success, kExitResolutionFailure or kExitExecutionFailure otherwise.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace arbiter::tools::cli
