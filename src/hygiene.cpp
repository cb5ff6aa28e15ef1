/*
 * synext - Syntax extension expansion core
 *
 * hygiene.cpp
 * - Expansion identities and syntax context tables
 */
#include <hygiene.hpp>
#include <common.hpp>
#include <map>
#include <tuple>
#include <algorithm>

namespace {
    struct SyntaxContextData
    {
        ExpnId  outer_expn;
        Transparency    outer_transparency;
        SyntaxContext   parent;
        /// This context, but with all transparent and semi-transparent marks filtered away
        SyntaxContext   opaque;
        /// This context, but with all transparent marks filtered away
        SyntaxContext   opaque_and_semitransparent;
    };

    struct HygieneData
    {
        ::std::vector< ::std::unique_ptr<ExpnData> >  expn_data;
        ::std::vector<SyntaxContextData>    syntax_context_data;
        ::std::map< ::std::tuple<unsigned int, unsigned int, int>, unsigned int >    syntax_context_map;

        HygieneData()
        {
            expn_data.push_back( box$(ExpnData::default_(ExpnKind::make_root(), Span(), AST::Edition::Rust2015)) );
            syntax_context_data.push_back(SyntaxContextData {
                ExpnId::root(), Transparency::Opaque,
                SyntaxContext::root(), SyntaxContext::root(), SyntaxContext::root()
                });
        }

        const SyntaxContextData& ctxt(SyntaxContext c) const {
            ASSERT_BUG(Span(), c.as_u32() < syntax_context_data.size(), "Invalid syntax context " << c);
            return syntax_context_data[c.as_u32()];
        }

        /// Obtain (or create) the context for `parent` extended by one mark
        SyntaxContext lookup_or_insert(SyntaxContext parent, const ExpnId& expn_id, Transparency transparency,
            ::std::function<SyntaxContextData(SyntaxContext new_ctxt)> make
            )
        {
            auto key = ::std::make_tuple(parent.as_u32(), expn_id.as_u32(), static_cast<int>(transparency));
            auto it = syntax_context_map.find(key);
            if( it != syntax_context_map.end() )
                return SyntaxContext::from_u32(it->second);
            auto new_ctxt = SyntaxContext::from_u32( static_cast<unsigned int>(syntax_context_data.size()) );
            syntax_context_data.push_back( make(new_ctxt) );
            syntax_context_map.insert( ::std::make_pair(key, new_ctxt.as_u32()) );
            return new_ctxt;
        }

        SyntaxContext apply_mark_internal(SyntaxContext ctxt, const ExpnId& expn_id, Transparency transparency)
        {
            auto opaque = this->ctxt(ctxt).opaque;
            auto opaque_and_semitransparent = this->ctxt(ctxt).opaque_and_semitransparent;

            if( transparency >= Transparency::Opaque )
            {
                auto parent = opaque;
                opaque = lookup_or_insert(parent, expn_id, transparency, [&](SyntaxContext new_opaque) {
                    return SyntaxContextData { expn_id, transparency, parent, new_opaque, new_opaque };
                    });
            }
            if( transparency >= Transparency::SemiTransparent )
            {
                auto parent = opaque_and_semitransparent;
                opaque_and_semitransparent = lookup_or_insert(parent, expn_id, transparency, [&](SyntaxContext new_ctxt) {
                    return SyntaxContextData { expn_id, transparency, parent, opaque, new_ctxt };
                    });
            }

            return lookup_or_insert(ctxt, expn_id, transparency, [&](SyntaxContext ) {
                return SyntaxContextData { expn_id, transparency, ctxt, opaque, opaque_and_semitransparent };
                });
        }
    };

    HygieneData& hygiene_data()
    {
        static HygieneData  s_data;
        return s_data;
    }
}

const char* MacroKind_descr(MacroKind k)
{
    switch(k)
    {
    case MacroKind::Bang:   return "macro";
    case MacroKind::Attr:   return "attribute macro";
    case MacroKind::Derive: return "derive macro";
    }
    return "";
}
const char* MacroKind_descr_expected(MacroKind k)
{
    if( k == MacroKind::Attr )
        return "attribute";
    return MacroKind_descr(k);
}
::std::ostream& operator<<(::std::ostream& os, const MacroKind& x)
{
    switch(x)
    {
    case MacroKind::Bang:   os << "Bang";   break;
    case MacroKind::Attr:   os << "Attr";   break;
    case MacroKind::Derive: os << "Derive"; break;
    }
    return os;
}
::std::ostream& operator<<(::std::ostream& os, const Transparency& x)
{
    switch(x)
    {
    case Transparency::Transparent:     os << "Transparent";    break;
    case Transparency::SemiTransparent: os << "SemiTransparent";    break;
    case Transparency::Opaque:          os << "Opaque"; break;
    }
    return os;
}

// --------------------------------------------------------------------
// ExpnId / ExpnData
// --------------------------------------------------------------------
ExpnId ExpnId::fresh(rust::option<ExpnData> data)
{
    auto& hd = hygiene_data();
    ExpnId  rv( static_cast<unsigned int>(hd.expn_data.size()) );
    if( data.is_some() )
        hd.expn_data.push_back( box$(data.unwrap()) );
    else
        hd.expn_data.push_back( nullptr );
    DEBUG("fresh " << rv);
    return rv;
}
bool ExpnId::has_expn_data() const
{
    const auto& hd = hygiene_data();
    return m_idx < hd.expn_data.size() && hd.expn_data[m_idx];
}
const ExpnData& ExpnId::expn_data() const
{
    const auto& hd = hygiene_data();
    ASSERT_BUG(Span(), m_idx < hd.expn_data.size(), "Unknown expansion " << *this);
    ASSERT_BUG(Span(), hd.expn_data[m_idx], "No expansion data for " << *this);
    return *hd.expn_data[m_idx];
}
void ExpnId::set_expn_data(ExpnData data) const
{
    auto& hd = hygiene_data();
    ASSERT_BUG(Span(), m_idx < hd.expn_data.size(), "Unknown expansion " << *this);
    ASSERT_BUG(data.call_site, !hd.expn_data[m_idx], "Expansion data is reset for " << *this);
    hd.expn_data[m_idx] = box$(data);
}
ExpnId ExpnId::parent() const
{
    return expn_data().parent;
}
bool ExpnId::is_descendant_of(const ExpnId& ancestor) const
{
    ExpnId  cur = *this;
    while( cur != ancestor )
    {
        if( cur.is_root() )
            return false;
        cur = cur.expn_data().parent;
    }
    return true;
}

::std::string ExpnKind::descr() const
{
    switch(this->tag)
    {
    case Tag::Root:
        return "<root>";
    case Tag::Macro:
        switch(this->macro_kind)
        {
        case MacroKind::Bang:   return FMT(this->name << "!");
        case MacroKind::Attr:   return FMT("#[" << this->name << "]");
        case MacroKind::Derive: return FMT("#[derive(" << this->name << ")]");
        }
        break;
    }
    return "";
}

ExpnData ExpnData::default_(ExpnKind kind, Span call_site, AST::Edition edition)
{
    return ExpnData {
        mv$(kind),
        ExpnId::root(),
        mv$(call_site),
        Span(),
        rust::None< ::std::vector<RcString> >(),
        false,
        false,
        edition
        };
}
bool ExpnData::allows_unstable(const RcString& feature) const
{
    if( allow_internal_unstable.is_none() )
        return false;
    for(const auto& f : allow_internal_unstable.unwrap())
    {
        if( f == feature || f == "allow_internal_unstable_backcompat_hack" )
            return true;
    }
    return false;
}

// --------------------------------------------------------------------
// SyntaxContext
// --------------------------------------------------------------------
SyntaxContext SyntaxContext::apply_mark(const ExpnId& expn_id, Transparency transparency) const
{
    // Marking with the root expansion is a no-op
    if( expn_id.is_root() )
        return *this;
    auto& hd = hygiene_data();

    if( transparency == Transparency::Opaque )
        return hd.apply_mark_internal(*this, expn_id, transparency);

    auto call_site_ctxt = expn_id.expn_data().call_site.ctxt();
    if( transparency == Transparency::SemiTransparent )
        call_site_ctxt = call_site_ctxt.normalize_to_macros_2_0();
    else
        call_site_ctxt = call_site_ctxt.normalize_to_macro_rules();

    if( call_site_ctxt.is_root() )
        return hd.apply_mark_internal(*this, expn_id, transparency);

    // A transparent mark inside an opaque expansion: pretend the inner
    // definition was made at its invocation, so the outer one stays hygienic.
    for(const auto& m : this->marks())
        call_site_ctxt = hd.apply_mark_internal(call_site_ctxt, m.first, m.second);
    return hd.apply_mark_internal(call_site_ctxt, expn_id, transparency);
}
ExpnId SyntaxContext::remove_mark()
{
    auto rv = this->outer_expn();
    *this = this->parent();
    return rv;
}
::std::vector< ::std::pair<ExpnId, Transparency> > SyntaxContext::marks() const
{
    ::std::vector< ::std::pair<ExpnId, Transparency> >  rv;
    for(auto c = *this; !c.is_root(); c = c.parent())
    {
        rv.push_back( ::std::make_pair(c.outer_expn(), c.outer_transparency()) );
    }
    ::std::reverse(rv.begin(), rv.end());
    return rv;
}
ExpnId SyntaxContext::outer_expn() const
{
    return hygiene_data().ctxt(*this).outer_expn;
}
Transparency SyntaxContext::outer_transparency() const
{
    return hygiene_data().ctxt(*this).outer_transparency;
}
const ExpnData& SyntaxContext::outer_expn_data() const
{
    return this->outer_expn().expn_data();
}
SyntaxContext SyntaxContext::parent() const
{
    return hygiene_data().ctxt(*this).parent;
}
SyntaxContext SyntaxContext::normalize_to_macros_2_0() const
{
    return hygiene_data().ctxt(*this).opaque;
}
SyntaxContext SyntaxContext::normalize_to_macro_rules() const
{
    return hygiene_data().ctxt(*this).opaque_and_semitransparent;
}
