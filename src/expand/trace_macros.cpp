/*
 * synext - Syntax extension expansion core
 *
 * expand/trace_macros.cpp
 * - trace_macros! handler
 */
#include "builtins.hpp"
#include "ext_ctxt.hpp"
#include "mac_result.hpp"

class CTraceMacrosExpander:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        const Token* tok = nullptr;
        if( tt.is_token() )
            tok = &tt.tok();
        else if( tt.size() == 1 && tt[0].is_token() )
            tok = &tt[0].tok();

        if( tok && tok->type() == TOK_RWORD_TRUE ) {
            cx.set_trace_macros(true);
        }
        else if( tok && tok->type() == TOK_RWORD_FALSE ) {
            cx.set_trace_macros(false);
        }
        else {
            cx.span_err(sp, "trace_macros! accepts only `true` or `false`");
        }
        return DummyResult::any_valid(sp);
    }
};

void Expand_Register_TraceMacros(BuiltinRegistrar& r)
{
    r.add_legacy_bang<CTraceMacrosExpander>("trace_macros");
}
