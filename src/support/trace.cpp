//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/trace.cpp
// Purpose: Implement deterministic tracing for call resolution.
// Key invariants: Each record produces exactly one flushed line and emission
//                 honours @ref TraceConfig::mode.
// Ownership/Lifetime: Trace sinks emit to externally owned streams; no
//                     resources are allocated beyond a trace session.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the resolver tracing facilities.
/// @details The resolver reports candidate scores and outcomes through a
///          TraceSink so the scoring loop never formats output itself when
///          tracing is disabled.

#include "support/trace.hpp"

#include <iostream>

namespace arbiter::support
{

/// @brief Determine whether tracing output should be emitted at all.
/// @return True when tracing is active, false when it is disabled.
bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

bool TraceSink::wants(TraceConfig::Mode level) const
{
    return cfg.enabled() && level != TraceConfig::Off && cfg.mode >= level;
}

/// @brief Emit a single trace record.
/// @details Records are prefixed with "[arbiter]" and flushed immediately so
///          trace lines interleave predictably with diagnostics printed to the
///          same stream.
void TraceSink::emit(TraceConfig::Mode level, std::string_view text) const
{
    if (!wants(level))
        return;
    std::ostream &os = cfg.stream ? *cfg.stream : std::cerr;
    os << "[arbiter] " << text << std::endl;
}

} // namespace arbiter::support
