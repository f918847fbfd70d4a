//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the `arbiter-resolve` executable. The tool resolves one command
// call given on the command line against the builtin catalogue and runs it.
//
//===----------------------------------------------------------------------===//

#include "tools/arbiter-resolve/cli.hpp"

#include <iostream>

/// @brief Entry point for the `arbiter-resolve` binary.
int main(int argc, char **argv)
{
    return arbiter::tools::cli::runCLI(argc, argv, std::cout, std::cerr);
}
