// File: tests/unit/test_options_trace.cpp
// Purpose: Cover resolver options, environment overrides, tracing and
//          diagnostic printing.
// Key invariants: Unrecognised environment values leave settings untouched;
//                 trace records are "[arbiter]" prefixed lines.
// Ownership/Lifetime: Tests restore every environment variable they set.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"
#include "support/trace.hpp"

#include <cstdlib>
#include <sstream>

using namespace arbiter::support;

namespace
{

/// Sets an environment variable for the lifetime of the guard.
class EnvGuard
{
  public:
    EnvGuard(const char *name, const char *value) : name_(name)
    {
        ::setenv(name_, value, 1);
    }

    ~EnvGuard()
    {
        ::unsetenv(name_);
    }

  private:
    const char *name_;
};

} // namespace

TEST(Options, ParseSwitch)
{
    EXPECT_EQ(parseSwitch("1"), true);
    EXPECT_EQ(parseSwitch("ON"), true);
    EXPECT_EQ(parseSwitch("true"), true);
    EXPECT_EQ(parseSwitch("0"), false);
    EXPECT_EQ(parseSwitch("Off"), false);
    EXPECT_FALSE(parseSwitch("perhaps").has_value());
    EXPECT_FALSE(parseSwitch("").has_value());
}

TEST(Options, ParseTraceMode)
{
    EXPECT_EQ(parseTraceMode("off"), TraceConfig::Off);
    EXPECT_EQ(parseTraceMode("1"), TraceConfig::Summary);
    EXPECT_EQ(parseTraceMode("summary"), TraceConfig::Summary);
    EXPECT_EQ(parseTraceMode("VERBOSE"), TraceConfig::Verbose);
    EXPECT_FALSE(parseTraceMode("loud").has_value());
}

TEST(Options, EnvironmentOverridesBase)
{
    ::unsetenv("ARBITER_TRACE");
    ::unsetenv("ARBITER_FOLD_RECEIVER");

    ResolverOptions base;
    base.trace.mode = TraceConfig::Summary;
    auto untouched = ResolverOptions::fromEnvironment(base);
    EXPECT_EQ(untouched.trace.mode, TraceConfig::Summary);
    EXPECT_FALSE(untouched.foldReceiverRejection);

    EnvGuard trace("ARBITER_TRACE", "verbose");
    EnvGuard fold("ARBITER_FOLD_RECEIVER", "on");
    auto overridden = ResolverOptions::fromEnvironment(base);
    EXPECT_EQ(overridden.trace.mode, TraceConfig::Verbose);
    EXPECT_TRUE(overridden.foldReceiverRejection);
}

TEST(Options, UnrecognisedEnvironmentValuesAreIgnored)
{
    EnvGuard trace("ARBITER_TRACE", "chatty");
    EnvGuard fold("ARBITER_FOLD_RECEIVER", "sometimes");

    ResolverOptions base;
    base.foldReceiverRejection = true;
    auto opts = ResolverOptions::fromEnvironment(base);
    EXPECT_EQ(opts.trace.mode, TraceConfig::Off);
    EXPECT_TRUE(opts.foldReceiverRejection);
}

TEST(Options, EnvironmentOverridesDefaults)
{
    ::unsetenv("ARBITER_FOLD_RECEIVER");
    {
        EnvGuard trace("ARBITER_TRACE", "summary");
        auto opts = ResolverOptions::fromEnvironment();
        EXPECT_EQ(opts.trace.mode, TraceConfig::Summary);
        EXPECT_FALSE(opts.foldReceiverRejection);
    }

    auto defaults = ResolverOptions::fromEnvironment();
    EXPECT_EQ(defaults.trace.mode, TraceConfig::Off);
    EXPECT_FALSE(defaults.foldReceiverRejection);
}

TEST(Trace, SinkHonoursMode)
{
    std::ostringstream os;
    TraceConfig cfg;
    cfg.stream = &os;

    TraceSink off(cfg);
    EXPECT_FALSE(off.wants(TraceConfig::Summary));
    off.emit(TraceConfig::Summary, "hidden");
    EXPECT_TRUE(os.str().empty());

    cfg.mode = TraceConfig::Summary;
    TraceSink summary(cfg);
    EXPECT_TRUE(summary.wants(TraceConfig::Summary));
    EXPECT_FALSE(summary.wants(TraceConfig::Verbose));
    summary.emit(TraceConfig::Summary, "shown");
    summary.emit(TraceConfig::Verbose, "detail");
    EXPECT_EQ(os.str(), "[arbiter] shown\n");
}

TEST(Diagnostics, PrintDiagFormatsSubjectAndSeverity)
{
    std::ostringstream os;
    printDiag(makeError("foo", "no matching variant"), os);
    printDiag(makeError("", "bare"), os);
    EXPECT_EQ(os.str(), "foo: error: no matching variant\nerror: bare\n");
}

TEST(Diagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine engine;
    engine.report(makeError("a", "first"));
    engine.report(Diagnostic{Severity::Warning, "careful", "b"});
    engine.report(Diagnostic{Severity::Note, "context", "b"});

    EXPECT_EQ(engine.errorCount(), 1u);
    EXPECT_EQ(engine.warningCount(), 1u);

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(), "a: error: first\nb: warning: careful\nb: note: context\n");
}
