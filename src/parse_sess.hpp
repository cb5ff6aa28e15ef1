/*
 * synext - Syntax extension expansion core
 *
 * parse_sess.hpp
 * - Per-session state shared by every expansion pass
 */
#pragma once

#include <set>
#include <memory>
#include "diagnostics/handler.hpp"
#include "diagnostics/registry.hpp"

/// Session state (created at session start, dropped at session end)
struct ParseSess
{
    Diagnostics::Handler    span_diagnostic;
    /// Error codes registered through `__register_diagnostic!`
    Diagnostics::ErrorRegistry  registered_diagnostics;
    /// Features used by expanded code (reported to feature gating)
    ::std::set<RcString>    used_features;

    ParseSess();
    ParseSess(::std::unique_ptr<Diagnostics::Emitter> emitter);
    ParseSess(const ParseSess&) = delete;
    ParseSess& operator=(const ParseSess&) = delete;
};
