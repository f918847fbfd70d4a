//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `arbiter-resolve` driver: option parsing, resolution against
// the builtin catalogue, and execution of the selected variant.
//
//===----------------------------------------------------------------------===//

#include "tools/arbiter-resolve/cli.hpp"

#include "exec/Invoker.hpp"
#include "resolve/CallResolver.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"
#include "tools/arbiter-resolve/catalogue.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace arbiter::tools::cli
{

namespace
{

void printUsage(std::ostream &os)
{
    os << "Usage: arbiter-resolve [options] <command> [args...]\n"
       << "  --as console|user|member       Caller identity (default: console)\n"
       << "  --trace[=summary|verbose]      Trace resolution to stderr\n"
       << "  --list                         List commands and their variants\n"
       << "  --version                      Show version information\n";
}

void printCatalogue(const Catalogue &catalogue, std::ostream &out)
{
    for (const auto &entry : catalogue.commands())
    {
        out << entry.name << " - " << entry.summary << '\n';
        for (const auto &variant : entry.variants)
            out << "  " << variant->toString() << '\n';
    }
}

} // namespace

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    std::string_view role = "console";
    std::optional<support::TraceConfig::Mode> traceMode;
    bool list = false;

    int i = 1;
    for (; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--version")
        {
            out << "arbiter-resolve " << kVersion << '\n';
            return 0;
        }
        if (arg == "--list")
        {
            list = true;
        }
        else if (arg == "--trace")
        {
            traceMode = support::TraceConfig::Summary;
        }
        else if (arg.rfind("--trace=", 0) == 0)
        {
            traceMode = support::parseTraceMode(arg.substr(8));
            if (!traceMode)
            {
                err << "arbiter-resolve: invalid trace mode '" << arg.substr(8) << "'\n";
                return kExitResolutionFailure;
            }
        }
        else if (arg == "--as")
        {
            if (i + 1 >= argc)
            {
                err << "arbiter-resolve: --as requires a value\n";
                printUsage(err);
                return kExitResolutionFailure;
            }
            role = argv[++i];
        }
        else if (arg == "--")
        {
            ++i;
            break;
        }
        else if (arg.rfind("--", 0) == 0)
        {
            err << "arbiter-resolve: unknown option '" << arg << "'\n";
            printUsage(err);
            return kExitResolutionFailure;
        }
        else
        {
            break;
        }
    }

    auto catalogue = Catalogue::create(out);
    if (!catalogue)
    {
        support::printDiag(catalogue.error(), err);
        return kExitResolutionFailure;
    }

    if (list)
    {
        printCatalogue(catalogue.value(), out);
        if (i >= argc)
            return 0;
    }

    if (i >= argc)
    {
        printUsage(err);
        return kExitResolutionFailure;
    }

    auto caller = Catalogue::callerFor(role);
    if (!caller)
    {
        err << "arbiter-resolve: unknown caller '" << role << "'\n";
        return kExitResolutionFailure;
    }

    call::UnresolvedCall request{*caller, argv[i], {}};
    for (int a = i + 1; a < argc; ++a)
        request.arguments.push_back(call::ValueArgument::fromToken(argv[a]));

    const CommandEntry *entry = catalogue.value().find(request.calleeName);
    if (!entry)
    {
        support::printDiag(support::makeError(request.calleeName, "unknown command"), err);
        return kExitResolutionFailure;
    }

    auto options = support::ResolverOptions::fromEnvironment();
    if (traceMode)
        options.trace.mode = *traceMode;
    options.trace.stream = &err;

    resolve::CallResolver resolver(catalogue.value().hierarchy(), options);
    auto resolved = resolver.resolve(request, entry->variants, catalogue.value().context());
    if (!resolved)
    {
        support::DiagnosticEngine diags;
        resolved.error().report(diags);
        diags.printAll(err);
        return kExitResolutionFailure;
    }

    auto done = exec::runToCompletion(resolved.value());
    if (!done)
    {
        support::printDiag(done.error(), err);
        return kExitExecutionFailure;
    }
    return 0;
}

} // namespace arbiter::tools::cli
