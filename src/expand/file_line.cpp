/*
 * synext - Syntax extension expansion core
 *
 * expand/file_line.cpp
 * - file! line! column! and module_path! macros
 */
#include "builtins.hpp"
#include "ext_ctxt.hpp"
#include "mac_result.hpp"

namespace {
    /// Position reported for a macro call (the outermost call site of the current expansion chain)
    const SpanInner_Source* get_top_source(const ExtCtxt& cx, const Span& sp, Span& top_span) {
        auto cause = cx.expansion_cause();
        top_span = cause.is_some() ? cause.unwrap() : sp;
        // Walk out of any macro-generated spans
        const Span* cur = &top_span;
        while( cur->get() )
        {
            if( const auto* src = cur->get_source() )
                return src;
            cur = &(*cur)->parent_span;
        }
        return nullptr;
    }
}

class CExpanderFile:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        check_zero_tts(cx, sp, tt, "file!");
        Span    top_span;
        const auto* src = get_top_source(cx, sp, top_span);
        ::std::string   name = src ? src->filename.c_str() : "<unknown>";
        return MacEager::new_expr( cx.expr_str(cx.with_def_site_ctxt(sp), mv$(name)) );
    }
};

class CExpanderLine:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        check_zero_tts(cx, sp, tt, "line!");
        Span    top_span;
        const auto* src = get_top_source(cx, sp, top_span);
        return MacEager::new_expr( cx.expr_u32(cx.with_def_site_ctxt(sp), src ? src->start_line : 0) );
    }
};

class CExpanderColumn:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        check_zero_tts(cx, sp, tt, "column!");
        Span    top_span;
        const auto* src = get_top_source(cx, sp, top_span);
        // Columns are reported 1-based
        return MacEager::new_expr( cx.expr_u32(cx.with_def_site_ctxt(sp), src ? src->start_ofs + 1 : 0) );
    }
};

class CExpanderModulePath:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        check_zero_tts(cx, sp, tt, "module_path!");
        ::std::string   path_str;
        for(const auto& comp : cx.current_expansion.module_path) {
            if( !path_str.empty() )
                path_str += "::";
            path_str += comp.name.c_str();
        }
        return MacEager::new_expr( cx.expr_str(cx.with_def_site_ctxt(sp), mv$(path_str)) );
    }
};

void Expand_Register_FileLine(BuiltinRegistrar& r)
{
    r.add_legacy_bang<CExpanderFile>("file");
    r.add_legacy_bang<CExpanderLine>("line");
    r.add_legacy_bang<CExpanderColumn>("column");
    r.add_legacy_bang<CExpanderModulePath>("module_path");
}
