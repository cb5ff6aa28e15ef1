/*
 * synext - Syntax extension expansion core
 *
 * parse_sess.cpp
 * - Per-session state
 */
#include "parse_sess.hpp"
#include <debug_inner.hpp>

namespace {
    void init_debug()
    {
        debug_init_phases("SYNEXT_DEBUG", {
            "Expand",
            });
    }
}

ParseSess::ParseSess()
{
    init_debug();
}
ParseSess::ParseSess(::std::unique_ptr<Diagnostics::Emitter> emitter):
    span_diagnostic( mv$(emitter) )
{
    init_debug();
}
