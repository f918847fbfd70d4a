// File: src/support/trace.hpp
// Purpose: Declare tracing configuration and sink for resolution steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value and borrows its stream.
// Links: DESIGN.md
#pragma once

#include <ostream>
#include <string_view>

namespace arbiter::support
{

/// @brief Configuration for resolver tracing.
struct TraceConfig
{
    /// @brief Tracing modes, ordered by verbosity.
    enum Mode
    {
        Off,     ///< Tracing disabled
        Summary, ///< One line per resolution outcome
        Verbose  ///< Also trace every candidate and argument
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *stream = nullptr;

    /// @brief Check whether tracing is enabled.
    /// @return True if mode is not Off.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief True when records at @p level would be written.
    bool wants(TraceConfig::Mode level) const;

    /// @brief Write one "[arbiter] " prefixed line if @p level is enabled.
    void emit(TraceConfig::Mode level, std::string_view text) const;

  private:
    TraceConfig cfg; ///< Active configuration
};

} // namespace arbiter::support
