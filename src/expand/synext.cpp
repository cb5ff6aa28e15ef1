/*
 * synext - Syntax extension expansion core
 *
 * expand/synext.cpp
 * - Syntax extension descriptors
 */
#include <synext.hpp>
#include <parse_sess.hpp>
#include "mac_result.hpp"

const char* const ALLOW_INTERNAL_UNSTABLE_BACKCOMPAT = "allow_internal_unstable_backcompat_hack";

SyntaxExtension::SyntaxExtension(SyntaxExtensionKind kind, AST::Edition edition):
    kind( mv$(kind) ),
    allow_internal_unsafe(false),
    local_inner_macros(false),
    edition(edition),
    is_builtin(false),
    is_derive_copy(false)
{
}

MacroKind SyntaxExtension::macro_kind() const
{
    switch(kind.tag())
    {
    case SyntaxExtensionKind::TAGDEAD:
        break;
    case SyntaxExtensionKind::TAG_Bang:
    case SyntaxExtensionKind::TAG_LegacyBang:
        return MacroKind::Bang;
    case SyntaxExtensionKind::TAG_Attr:
    case SyntaxExtensionKind::TAG_LegacyAttr:
    case SyntaxExtensionKind::TAG_NonMacroAttr:
        return MacroKind::Attr;
    case SyntaxExtensionKind::TAG_Derive:
    case SyntaxExtensionKind::TAG_LegacyDerive:
        return MacroKind::Derive;
    }
    BUG(span, "Bad SyntaxExtensionKind tag");
}

SyntaxExtension SyntaxExtension::default_(SyntaxExtensionKind kind, AST::Edition edition)
{
    return SyntaxExtension(mv$(kind), edition);
}

SyntaxExtension SyntaxExtension::new_(
    ParseSess& sess,
    SyntaxExtensionKind kind,
    Span span,
    ::std::vector<RcString> helper_attrs,
    AST::Edition edition,
    const RcString& name,
    const AST::AttributeList& attrs
    )
{
    TRACE_FUNCTION_F(name);
    auto rv = SyntaxExtension::default_(mv$(kind), edition);
    rv.span = mv$(span);
    rv.helper_attrs = mv$(helper_attrs);

    if( const auto* a = attrs.get("allow_internal_unstable") )
    {
        auto list = a->meta_item_list();
        if( list.is_some() )
        {
            ::std::vector<RcString> features;
            for(const auto& it : list.unwrap())
            {
                if( it.is_word() ) {
                    features.push_back( it.name.as_trivial() );
                }
                else {
                    sess.span_diagnostic.span_err(it.span, "allow internal unstable expects feature names");
                }
            }
            rv.allow_internal_unstable = mv$(features);
        }
        else
        {
            sess.span_diagnostic.span_warn(a->span(),
                "allow_internal_unstable expects list of feature names. In the future this will become a hard error. "
                "Please use `allow_internal_unstable(foo, bar)` to only allow the `foo` and `bar` features"
                );
            rv.allow_internal_unstable = make_vec1( RcString::new_interned(ALLOW_INTERNAL_UNSTABLE_BACKCOMPAT) );
        }
    }

    if( const auto* a = attrs.get("macro_export") )
    {
        auto list = a->meta_item_list();
        if( list.is_some() )
            rv.local_inner_macros = AST::list_contains_name(list.unwrap(), "local_inner_macros");
    }
    rv.allow_internal_unsafe = attrs.has("allow_internal_unsafe");
    rv.stability = AST::find_stability(attrs);
    rv.deprecation = AST::find_deprecation(attrs);
    rv.is_builtin = attrs.has("rustc_builtin_macro");
    rv.is_derive_copy = rv.is_builtin && name == "Copy";
    DEBUG("is_builtin=" << rv.is_builtin << " local_inner_macros=" << rv.local_inner_macros);
    return rv;
}

namespace {
    class DummyBang:
        public ExpandLegacyMacro
    {
    public:
        ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& input) override;
    };
    class DummyDerive:
        public ExpandLegacyDerive
    {
    public:
        ::std::vector<AST::Annotatable> expand(ExtCtxt& , const Span& , const AST::Path& , const AST::Annotatable& ) override {
            return ::std::vector<AST::Annotatable>();
        }
    };
}
::std::unique_ptr<MacResult> DummyBang::expand(ExtCtxt& , const Span& sp, const TokenTree& )
{
    return DummyResult::any(sp);
}

SyntaxExtension SyntaxExtension::dummy_bang(AST::Edition edition)
{
    return SyntaxExtension::default_(SyntaxExtensionKind::make_LegacyBang(::std::unique_ptr<ExpandLegacyMacro>(new DummyBang())), edition);
}
SyntaxExtension SyntaxExtension::dummy_derive(AST::Edition edition)
{
    return SyntaxExtension::default_(SyntaxExtensionKind::make_LegacyDerive(::std::unique_ptr<ExpandLegacyDerive>(new DummyDerive())), edition);
}
SyntaxExtension SyntaxExtension::non_macro_attr(bool mark_used, AST::Edition edition)
{
    return SyntaxExtension::default_(SyntaxExtensionKind::make_NonMacroAttr({ mark_used }), edition);
}

ExpnData SyntaxExtension::expn_data(ExpnId parent, Span call_site, RcString descr) const
{
    return ExpnData {
        ExpnKind::make_macro(this->macro_kind(), mv$(descr)),
        parent,
        mv$(call_site),
        this->span,
        this->allow_internal_unstable,
        this->allow_internal_unsafe,
        this->local_inner_macros,
        this->edition
        };
}
