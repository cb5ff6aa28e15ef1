/*
 * synext - Syntax extension expansion core
 *
 * expand/compile_error.cpp
 * - compile_error! handler
 */
#include "builtins.hpp"
#include "ext_ctxt.hpp"
#include "mac_result.hpp"

class CCompileErrorExpander:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        auto msg = get_single_str_from_tts(cx, sp, tt, "compile_error!");
        if( msg.is_some() )
        {
            cx.span_err(sp, msg.unwrap());
        }
        return DummyResult::any(sp);
    }
};

void Expand_Register_CompileError(BuiltinRegistrar& r)
{
    r.add_legacy_bang<CCompileErrorExpander>("compile_error");
}
