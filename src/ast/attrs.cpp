/*
 * synext - Syntax extension expansion core
 *
 * ast/attrs.cpp
 * - AST Attributes
 */
#include "attrs.hpp"
#include <parse/ttstream.hpp>
#include <parse/parseerror.hpp>
#include <parse/common.hpp>
#include <algorithm>

namespace AST {

namespace {
    ::std::vector<Attribute> clone_mivec(const ::std::vector<Attribute>& v) {
        ::std::vector<Attribute>    ri;
        ri.reserve(v.size());
        for(const auto& i : v)
            ri.push_back( i.clone() );
        return ri;
    }
}

AttributeList AttributeList::clone() const
{
    return AttributeList( clone_mivec(m_items) );
}

void AttributeList::push_back(Attribute i)
{
    m_items.push_back( ::std::move(i) );
}
const Attribute* AttributeList::get(const char *name) const
{
    for( auto& i : m_items ) {
        if(i.name() == name) {
            return &i;
        }
    }
    return 0;
}

::std::ostream& operator<<(::std::ostream& os, const AttributeList& x) {
    for(const auto& i : x.m_items) {
        os << i;
    }
    return os;
}
::std::ostream& operator<<(::std::ostream& os, const AttributeName& x) {
    for(size_t i = 0; i < x.elems.size(); i ++)
    {
        if(i != 0)
            os << "::";
        os << x.elems[i];
    }
    return os;
}

rust::option<::std::string> MetaItem::value_str() const
{
    if( !data.is_NameValue() || data.as_NameValue().value.type() != TOK_STRING )
        return rust::None<::std::string>();
    return rust::Some(data.as_NameValue().value.str());
}
::std::ostream& operator<<(::std::ostream& os, const MetaItem& x)
{
    TU_MATCH_HDRA( (x.data), {)
    TU_ARMA(Word, e) {
        os << x.name;
        }
    TU_ARMA(Literal, e) {
        os << e.to_str();
        }
    TU_ARMA(NameValue, e) {
        os << x.name << " = " << e.value.to_str();
        }
    TU_ARMA(List, e) {
        os << x.name << "(";
        for(size_t i = 0; i < e.size(); i ++)
        {
            if( i != 0 )
                os << ", ";
            os << e[i];
        }
        os << ")";
        }
    }
    return os;
}

Attribute Attribute::clone() const
{
    Attribute   rv( m_span, m_name, m_data.clone() );
    rv.m_is_used = m_is_used;
    rv.m_is_known = m_is_known;
    return rv;
}
void Attribute::fmt(std::ostream& os) const
{
    os << "#[" << m_name;
    if( !m_data.is_empty() )
    {
        if( m_data.size() > 0 && m_data[0].tok() == TOK_EQUAL )
            os << " ";
        os << m_data.to_source();
    }
    os << "]";
}

rust::option<::std::string> Attribute::value_str() const
{
    if( m_data.size() != 2 || m_data[0].tok() != TOK_EQUAL || m_data[1].tok() != TOK_STRING )
        return rust::None<::std::string>();
    return rust::Some(m_data[1].tok().str());
}
std::string Attribute::parse_paren_string() const
{
    TTStream    lex(this->m_span, this->data());
    lex.getTokenCheck(TOK_PAREN_OPEN);
    auto rv = lex.getTokenCheck(TOK_STRING).str();
    lex.getTokenCheck(TOK_PAREN_CLOSE);
    lex.getTokenCheck(TOK_EOF);
    return rv;
}
rust::option< ::std::vector<MetaItem> > Attribute::meta_item_list() const
{
    if( m_data.size() == 0 || m_data[0].tok() != TOK_PAREN_OPEN )
        return rust::None< ::std::vector<MetaItem> >();
    try
    {
        TTStream    lex(this->m_span, this->data());
        lex.getTokenCheck(TOK_PAREN_OPEN);
        auto rv = Parse_MetaItemList(lex, TOK_PAREN_CLOSE);
        lex.getTokenCheck(TOK_PAREN_CLOSE);
        lex.getTokenCheck(TOK_EOF);
        return rust::Some(mv$(rv));
    }
    catch(const ParseError::Base& e)
    {
        DEBUG("Malformed attribute " << *this << ": " << e.what());
        return rust::None< ::std::vector<MetaItem> >();
    }
}
void Attribute::parse_paren_ident_list(std::function<void(const Span& sp, RcString ident)> item_cb) const
{
    TTStream    lex(this->m_span, this->data());
    lex.getTokenCheck(TOK_PAREN_OPEN);
    while(lex.lookahead(0) != TOK_PAREN_CLOSE) {
        auto tok = lex.getTokenCheck(TOK_IDENT);
        item_cb(tok.span(), tok.ident());
        if(lex.lookahead(0) != TOK_COMMA)
            break;
        lex.getTokenCheck(TOK_COMMA);
    }
    lex.getTokenCheck(TOK_PAREN_CLOSE);
}

TokenTree Attribute::inner_tokens() const
{
    ::std::vector<TokenTree>    rv;
    if( m_data.size() == 0 )
        return TokenTree(mv$(rv));
    size_t  start = 1;
    size_t  end = m_data.size();
    switch( m_data[0].tok().type() )
    {
    case TOK_PAREN_OPEN:
    case TOK_SQUARE_OPEN:
    case TOK_BRACE_OPEN:
        end -= 1;
        break;
    default:
        break;
    }
    for(size_t i = start; i < end; i ++)
        rv.push_back( m_data[i].clone() );
    return TokenTree(mv$(rv));
}
TokenTree Attribute::to_tokens() const
{
    ::std::vector<TokenTree>    inner;
    inner.push_back( Token(TOK_SQUARE_OPEN, m_span) );
    for(size_t i = 0; i < m_name.elems.size(); i ++)
    {
        if( i != 0 )
            inner.push_back( Token(TOK_DOUBLE_COLON, m_span) );
        inner.push_back( Token::make_ident(m_name.elems[i], m_span) );
    }
    if( !m_data.is_empty() )
        inner.push_back( m_data.clone() );
    inner.push_back( Token(TOK_SQUARE_CLOSE, m_span) );

    ::std::vector<TokenTree>    rv;
    rv.push_back( Token(TOK_HASH, m_span) );
    rv.push_back( TokenTree(mv$(inner)) );
    return TokenTree(mv$(rv));
}

bool list_contains_name(const ::std::vector<MetaItem>& items, const char* name)
{
    for(const auto& i : items)
    {
        if( i.name == name )
            return true;
    }
    return false;
}

bool is_builtin_attr_name(const RcString& name)
{
    static const char* BUILTIN_ATTRS[] = {
        "allow", "allow_internal_unsafe", "allow_internal_unstable", "automatically_derived",
        "cfg", "cfg_attr", "cold",
        "deny", "deprecated", "derive", "doc",
        "export_name",
        "feature", "forbid",
        "inline",
        "link_name",
        "macro_export", "macro_use", "must_use",
        "no_mangle", "non_exhaustive",
        "path",
        "repr", "rustc_builtin_macro", "rustc_diagnostic_item",
        "stable", "structural_match",
        "test",
        "unstable",
        "warn",
        };
    for(const auto* n : BUILTIN_ATTRS)
    {
        if( name == n )
            return true;
    }
    return false;
}
bool is_builtin_attr(const Attribute& a)
{
    return a.name().is_trivial() && is_builtin_attr_name(a.name().as_trivial());
}

::std::ostream& operator<<(::std::ostream& os, const Stability& x)
{
    switch(x.level)
    {
    case Stability::Level::Stable:  os << "stable(feature = \"" << x.feature << "\", since = \"" << x.detail << "\")";   break;
    case Stability::Level::Unstable:os << "unstable(feature = \"" << x.feature << "\", issue = \"" << x.detail << "\")";  break;
    }
    return os;
}

rust::option<Stability> find_stability(const AttributeList& attrs)
{
    for(const auto& a : attrs.m_items)
    {
        Stability::Level    level;
        if( a.has_name("stable") )
            level = Stability::Level::Stable;
        else if( a.has_name("unstable") )
            level = Stability::Level::Unstable;
        else
            continue;
        auto items = a.meta_item_list();
        if( items.is_none() )
            continue;
        a.mark_used();

        Stability   rv { level, RcString(), RcString() };
        const char* detail_name = (level == Stability::Level::Stable ? "since" : "issue");
        for(const auto& mi : items.unwrap())
        {
            auto v = mi.value_str();
            if( v.is_none() )
                continue;
            if( mi.name == "feature" )
                rv.feature = RcString::new_interned(v.unwrap());
            else if( mi.name == detail_name )
                rv.detail = RcString::new_interned(v.unwrap());
        }
        return rust::Some(rv);
    }
    return rust::None<Stability>();
}
rust::option<Deprecation> find_deprecation(const AttributeList& attrs)
{
    for(const auto& a : attrs.m_items)
    {
        if( !a.has_name("deprecated") )
            continue;
        a.mark_used();
        Deprecation rv;
        auto note = a.value_str();
        auto items = a.meta_item_list();
        if( note.is_some() )
        {
            rv.note = rust::Some(RcString::new_interned(note.unwrap()));
        }
        else if( items.is_some() )
        {
            for(const auto& mi : items.unwrap())
            {
                auto v = mi.value_str();
                if( v.is_none() )
                    continue;
                if( mi.name == "since" )
                    rv.since = rust::Some(RcString::new_interned(v.unwrap()));
                else if( mi.name == "note" )
                    rv.note = rust::Some(RcString::new_interned(v.unwrap()));
            }
        }
        return rust::Some(mv$(rv));
    }
    return rust::None<Deprecation>();
}

}   // namespace AST
