/*
 * synext - Syntax extension expansion core
 *
 * expand/stringify.cpp
 * - stringify! macro
 */
#include "builtins.hpp"
#include "ext_ctxt.hpp"
#include "../parse/tokentree.hpp"

class CStringifyExpander:
    public ExpandProcMacro
{
    TokenTree expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        auto rv = tt.to_source();
        DEBUG("stringify - " << rv);
        return TokenTree(Token(TOK_STRING, mv$(rv), cx.with_def_site_ctxt(sp)));
    }
};

void Expand_Register_Stringify(BuiltinRegistrar& r)
{
    r.add_bang<CStringifyExpander>("stringify");
}
