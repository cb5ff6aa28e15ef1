/*
 * synext - Syntax extension expansion core
 *
 * expand/derive.cpp
 * - Built-in marker derives (Clone, Copy, PartialEq, Eq)
 */
#include "builtins.hpp"
#include "ext_ctxt.hpp"

namespace {
    /// Which trait, and any special derive it records
    struct Deriver
    {
        ::std::vector<const char*>  trait_path;
        SpecialDerives  special;
    };

    const Deriver   g_derive_clone      { { "core", "clone", "Clone" }, SpecialDerives::NONE };
    const Deriver   g_derive_copy       { { "core", "marker", "Copy" }, SpecialDerives::NONE };
    const Deriver   g_derive_partialeq  { { "core", "cmp", "PartialEq" }, SpecialDerives::PARTIAL_EQ };
    const Deriver   g_derive_eq         { { "core", "cmp", "Eq" }, SpecialDerives::EQ };

    ::std::vector<AST::Annotatable> derive_impl(ExtCtxt& cx, const Span& sp, const Deriver& d, const AST::Annotatable& item)
    {
        // Non-ADT targets are rejected before any derive is resolved
        const auto* ip = item.opt_Item();
        ASSERT_BUG(sp, ip && (*ip)->is_adt(), "Builtin derive on a non-ADT");
        const auto& i = **ip;
        DEBUG("derive " << d.trait_path.back() << " for " << i.name);

        if( d.special.bits != SpecialDerives::NONE )
        {
            // Recorded against the `#[derive]` expansion that contains this one
            const auto& data = cx.current_expansion.id.expn_data();
            cx.resolver.add_derives(data.parent, d.special);
        }

        auto self_ty = cx.ty_ident(sp, Ident(i.name.name, sp));
        auto imp = cx.item_impl(sp, cx.path_global(sp, d.trait_path), mv$(self_ty), ::std::vector<AST::ImplItem>());
        ::std::vector<AST::Annotatable> rv;
        rv.push_back( AST::Annotatable::from_item(mv$(imp)) );
        return rv;
    }
}

class CDeriveMarker:
    public ExpandLegacyDerive
{
    const Deriver&  m_deriver;
public:
    CDeriveMarker(const Deriver& d):
        m_deriver(d)
    {}
    ::std::vector<AST::Annotatable> expand(ExtCtxt& cx, const Span& sp, const AST::Path& path, const AST::Annotatable& item) override
    {
        TRACE_FUNCTION_F(path);
        return derive_impl(cx, sp, m_deriver, item);
    }
};

void Expand_Register_Derives(BuiltinRegistrar& r)
{
    auto add = [&](const char* name, const Deriver& d) {
        r.add(name, SyntaxExtensionKind::make_LegacyDerive(::std::unique_ptr<ExpandLegacyDerive>(new CDeriveMarker(d))));
        };
    add("Clone", g_derive_clone);
    add("Copy", g_derive_copy);
    add("PartialEq", g_derive_partialeq);
    add("Eq", g_derive_eq);
}
