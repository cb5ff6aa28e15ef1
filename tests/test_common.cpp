/*
 * synext - Syntax extension expansion core
 *
 * tests/test_common.cpp
 * - Shared fixtures for the unit tests
 */
#include "test_common.hpp"
#include <expand/builtins.hpp>

size_t CapturingEmitter::count(Diagnostics::Level level, const ::std::string& text) const
{
    size_t  rv = 0;
    for(const auto& d : diags)
        if( d.level == level && d.message.find(text) != ::std::string::npos )
            rv ++;
    return rv;
}
size_t CapturingEmitter::error_count() const
{
    size_t  rv = 0;
    for(const auto& d : diags)
        if( d.is_error() )
            rv ++;
    return rv;
}

// --------------------------------------------------------------------
// TestResolver
// --------------------------------------------------------------------
void TestResolver::register_builtin_macro(Ident name, ::std::shared_ptr<SyntaxExtension> ext)
{
    macros[name.name.c_str()] = mv$(ext);
}
ResolveResult TestResolver::resolve_macro_invocation(const Invocation& invoc, ExpnId eager_expansion_root, bool force)
{
    (void)eager_expansion_root;
    auto lookup = [&](const ::std::string& name)->::std::shared_ptr<SyntaxExtension> {
        auto it = indeterminate_passes.find(name);
        if( !force && it != indeterminate_passes.end() && it->second > 0 ) {
            it->second --;
            return nullptr;
        }
        auto m = macros.find(name);
        if( m == macros.end() )
            return nullptr;
        return m->second;
        };

    if( invoc.kind.is_DeriveGroup() )
    {
        const auto& paths = invoc.kind.as_DeriveGroup().paths;
        ::std::vector< ::std::shared_ptr<SyntaxExtension> > exts;
        for(const auto& p : paths)
        {
            resolve_log.push_back( ::std::make_pair(::std::string(p.last_name().c_str()), force) );
            auto e = lookup(p.last_name().c_str());
            if( !e )
                return ResolveResult::make_Indeterminate({});
            exts.push_back(e);
        }
        return ResolveResult::make_DeriveGroup(mv$(exts));
    }

    auto name = invoc.name();
    resolve_log.push_back( ::std::make_pair(name, force) );
    if( invoc.kind.is_Attr() )
    {
        // Helper attributes of the item's derives are inert
        for(const auto& p : invoc.kind.as_Attr().derives)
        {
            auto m = macros.find(p.last_name().c_str());
            if( m == macros.end() )
                continue ;
            for(const auto& h : m->second->helper_attrs)
            {
                if( h == name )
                    return ResolveResult::make_Single( ::std::make_shared<SyntaxExtension>(SyntaxExtension::non_macro_attr(false, AST::Edition::Rust2015)) );
            }
        }
    }
    auto e = lookup(name);
    if( !e )
        return ResolveResult::make_Indeterminate({});
    return ResolveResult::make_Single(mv$(e));
}
void TestResolver::visit_ast_fragment_with_placeholders(ExpnId expansion, const AST::AstFragment& fragment)
{
    (void)expansion;
    (void)fragment;
    fragments_visited ++;
}
ExpnId TestResolver::get_module_scope(AST::NodeId module_id)
{
    auto it = module_scopes.find(module_id);
    return it != module_scopes.end() ? it->second : ExpnId::root();
}
bool TestResolver::has_derives(ExpnId expn_id, SpecialDerives derives) const
{
    auto it = special_derives.find(expn_id);
    if( it == special_derives.end() )
        return false;
    return it->second.contains(derives);
}
void TestResolver::add_derives(ExpnId expn_id, SpecialDerives derives)
{
    special_derives[expn_id] |= derives;
}

// --------------------------------------------------------------------
// Callback extensions
// --------------------------------------------------------------------
namespace {
    class FcnBang: public ExpandProcMacro {
        BangFcn m_f;
    public:
        FcnBang(BangFcn f): m_f(mv$(f)) {}
        TokenTree expand(ExtCtxt& cx, const Span& sp, const TokenTree& input) override { return m_f(cx, sp, input); }
    };
    class FcnLegacyBang: public ExpandLegacyMacro {
        LegacyBangFcn m_f;
    public:
        FcnLegacyBang(LegacyBangFcn f): m_f(mv$(f)) {}
        ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& input) override { return m_f(cx, sp, input); }
    };
    class FcnAttr: public ExpandAttrProcMacro {
        AttrFcn m_f;
    public:
        FcnAttr(AttrFcn f): m_f(mv$(f)) {}
        TokenTree expand(ExtCtxt& cx, const Span& sp, const TokenTree& annotation, const TokenTree& annotated) override {
            return m_f(cx, sp, annotation, annotated);
        }
    };
    class FcnLegacyAttr: public ExpandDecorator {
        LegacyAttrFcn m_f;
    public:
        FcnLegacyAttr(LegacyAttrFcn f): m_f(mv$(f)) {}
        ::std::vector<AST::Annotatable> expand(ExtCtxt& cx, const Span& sp, const AST::Attribute& mi, AST::Annotatable item) override {
            return m_f(cx, sp, mi, mv$(item));
        }
    };
    class FcnDerive: public ExpandDeriveProcMacro {
        DeriveFcn m_f;
    public:
        FcnDerive(DeriveFcn f): m_f(mv$(f)) {}
        TokenTree expand(ExtCtxt& cx, const Span& sp, const TokenTree& item) override { return m_f(cx, sp, item); }
    };
    class FcnLegacyDerive: public ExpandLegacyDerive {
        LegacyDeriveFcn m_f;
    public:
        FcnLegacyDerive(LegacyDeriveFcn f): m_f(mv$(f)) {}
        ::std::vector<AST::Annotatable> expand(ExtCtxt& cx, const Span& sp, const AST::Path& path, const AST::Annotatable& item) override {
            return m_f(cx, sp, path, item);
        }
    };
}

SyntaxExtension make_bang(BangFcn f)
{
    return SyntaxExtension::default_(SyntaxExtensionKind::make_Bang(::std::unique_ptr<ExpandProcMacro>(new FcnBang(mv$(f)))), AST::Edition::Rust2015);
}
SyntaxExtension make_legacy_bang(LegacyBangFcn f)
{
    return SyntaxExtension::default_(SyntaxExtensionKind::make_LegacyBang(::std::unique_ptr<ExpandLegacyMacro>(new FcnLegacyBang(mv$(f)))), AST::Edition::Rust2015);
}
SyntaxExtension make_attr(AttrFcn f)
{
    return SyntaxExtension::default_(SyntaxExtensionKind::make_Attr(::std::unique_ptr<ExpandAttrProcMacro>(new FcnAttr(mv$(f)))), AST::Edition::Rust2015);
}
SyntaxExtension make_legacy_attr(LegacyAttrFcn f)
{
    return SyntaxExtension::default_(SyntaxExtensionKind::make_LegacyAttr(::std::unique_ptr<ExpandDecorator>(new FcnLegacyAttr(mv$(f)))), AST::Edition::Rust2015);
}
SyntaxExtension make_derive(DeriveFcn f, ::std::vector<RcString> helper_attrs)
{
    auto rv = SyntaxExtension::default_(SyntaxExtensionKind::make_Derive(::std::unique_ptr<ExpandDeriveProcMacro>(new FcnDerive(mv$(f)))), AST::Edition::Rust2015);
    rv.helper_attrs = mv$(helper_attrs);
    return rv;
}
SyntaxExtension make_legacy_derive(LegacyDeriveFcn f)
{
    return SyntaxExtension::default_(SyntaxExtensionKind::make_LegacyDerive(::std::unique_ptr<ExpandLegacyDerive>(new FcnLegacyDerive(mv$(f)))), AST::Edition::Rust2015);
}

// --------------------------------------------------------------------
// Source helpers
// --------------------------------------------------------------------
Span test_span(unsigned int line, unsigned int ofs)
{
    return Span(Span(), RcString::new_interned("test.rs"), line, ofs, line, ofs + 1);
}
TokenTree lex(const ::std::string& source)
{
    return Lex_TokenTree(source, RcString::new_interned("test.rs"));
}
AST::AstFragment parse_fragment(const ::std::string& source, AST::AstFragmentKind kind)
{
    auto tt = lex(source);
    TTStream    ts(Span(), tt);
    return Parse_AstFragment(ts, kind);
}
::std::vector<AST::Item> parse_items(const ::std::string& source)
{
    return parse_fragment(source, AST::AstFragmentKind::Items).unwrap_Items();
}
AST::ExprNodeP parse_expr(const ::std::string& source)
{
    return parse_fragment(source, AST::AstFragmentKind::Expr).unwrap_Expr();
}

// --------------------------------------------------------------------
// ExpandTest
// --------------------------------------------------------------------
ExpandTest::ExpandTest():
    emitter(new CapturingEmitter()),
    sess(::std::unique_ptr<Diagnostics::Emitter>(emitter)),
    resolver(),
    cx(sess, ExpansionConfig::default_(RcString::new_interned("test_crate")), resolver)
{
}
AST::AstFragment ExpandTest::expand(const ::std::string& source, AST::AstFragmentKind kind)
{
    return cx.monotonic_expander().fully_expand_fragment( parse_fragment(source, kind) );
}
::std::vector<AST::Item> ExpandTest::expand_items(const ::std::string& source)
{
    return expand(source, AST::AstFragmentKind::Items).unwrap_Items();
}
AST::ExprNodeP ExpandTest::expand_expr(const ::std::string& source)
{
    return expand(source, AST::AstFragmentKind::Expr).unwrap_Expr();
}
void ExpandTest::add_builtins()
{
    Expand_RegisterBuiltins(resolver, sess, cx.ecfg.edition);
}
