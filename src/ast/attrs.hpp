/*
 * synext - Syntax extension expansion core
 *
 * ast/attrs.hpp
 * - AST Attributes (#[foo])
 */
#ifndef _AST_ATTRS_HPP_
#define _AST_ATTRS_HPP_

#include <tagged_union.hpp>
#include <rustic.hpp>
#include <functional>
#include "../parse/tokentree.hpp"

namespace AST {

class Attribute;
::std::ostream& operator<<(::std::ostream& os, const Attribute& x);

/// A list of attributes on an item (searchable by the attribute name)
class AttributeList
{
public:
    ::std::vector<Attribute> m_items;

    AttributeList() {}
    AttributeList(::std::vector<Attribute> items):
        m_items( mv$(items) )
    {
    }

    // Move present
    AttributeList(AttributeList&&) = default;
    AttributeList& operator=(AttributeList&&) = default;
    // No copy, explicit clone
    AttributeList(const AttributeList&) = delete;
    AttributeList& operator=(const AttributeList&) = delete;
    AttributeList clone() const;

    void push_back(Attribute i);
    bool empty() const { return m_items.empty(); }

    const Attribute* get(const char *name) const;
    Attribute* get(const char *name) {
        return const_cast<Attribute*>( const_cast<const AttributeList*>(this)->get(name));
    }
    bool has(const char *name) const {
        return get(name) != 0;
    }

    friend ::std::ostream& operator<<(::std::ostream& os, const AttributeList& x);
};

struct AttributeName
{
    ::std::vector<RcString>   elems;

    AttributeName() {}
    AttributeName(RcString n) { elems.push_back(mv$(n)); }
    AttributeName(::std::vector<RcString> e): elems(mv$(e)) {}

    bool is_trivial() const { return elems.size() == 1; }
    const RcString& as_trivial() const { return elems.at(0); }

    bool operator==(const char* s) const { return elems.size() == 1 && elems[0] == s; }
    bool operator==(const RcString& x) const { return elems.size() == 1 && elems[0] == x; }

    template<typename T>
    bool operator!=(const T& x) const { return !(*this == x); }

    friend std::ostream& operator<<(std::ostream& os, const AttributeName& x);
};

/// One entry of a parenthesised attribute list
///
/// `foo`, `foo = "lit"`, `foo(...)` or a bare literal
struct MetaItem
{
    Span    span;
    /// Empty for a bare literal
    AttributeName   name;
    TAGGED_UNION(Data, Word,
        (Word, struct {}),
        (Literal, Token),
        (NameValue, struct {
            Token   value;
            }),
        (List, ::std::vector<MetaItem>)
        ) data;

    bool is_word() const { return data.is_Word() && name.is_trivial(); }
    /// The string value of a `name = "str"` entry
    rust::option<::std::string> value_str() const;

    friend ::std::ostream& operator<<(::std::ostream& os, const MetaItem& x);
};

// An attribute has a name, and optional data:
// - nothing (`#[foo]`)
// - a delimited token tree (`#[foo(...)]`)
// - an associated literal (`#[foo = "bar"]`)
//
// The data is kept as tokens, and parsed on demand.
class Attribute
{
    Span    m_span;
    AttributeName   m_name;
    TokenTree   m_data;
    mutable bool    m_is_used;
    mutable bool    m_is_known;
public:
    Attribute(Span sp, AttributeName name, TokenTree data=TokenTree()):
        m_span(::std::move(sp)),
        m_name(::std::move(name)),
        m_data(::std::move(data)),
        m_is_used(false),
        m_is_known(false)
    {
    }

    Attribute(const Attribute& x) = delete;
    Attribute& operator=(const Attribute& ) = delete;
    Attribute(Attribute&& ) = default;
    Attribute& operator=(Attribute&& ) = default;
    Attribute clone() const;

    void fmt(std::ostream& os) const;
    /// Record that the attribute was consumed by something
    void mark_used() const { m_is_used = true; }
    bool is_used() const { return m_is_used; }
    /// Record that the attribute is inert (not a macro invocation)
    void mark_known() const { m_is_known = true; }
    bool is_known() const { return m_is_known; }

    const Span& span() const { return m_span; }
    const AttributeName& name() const { return m_name; }
    const TokenTree& data() const { return m_data; }

    bool has_name(const char* s) const { return m_name == s; }
    /// `#[foo]`
    bool is_word() const { return m_data.is_empty(); }

    /// Parses the data as a `= "string"` and returns the string (none if it isn't one)
    rust::option<::std::string> value_str() const;
    /// Parses the data as a `("string")` and returns the string
    std::string parse_paren_string() const;
    /// Parses the data as a parenthesised list of meta items (none if it isn't one, or is malformed)
    rust::option< ::std::vector<MetaItem> > meta_item_list() const;
    void parse_paren_ident_list(std::function<void(const Span& sp, RcString ident)> item_cb) const;

    /// The tokens inside the delimiters of `#[foo(...)]` (or after the `=`)
    TokenTree inner_tokens() const;
    /// The attribute as written (`#[foo(...)]`)
    TokenTree to_tokens() const;

    friend ::std::ostream& operator<<(::std::ostream& os, const Attribute& x) {
        x.fmt(os);
        return os;
    }
};

extern bool list_contains_name(const ::std::vector<MetaItem>& items, const char* name);

/// Attributes that are handled by the compiler itself (never resolved as macros)
extern bool is_builtin_attr_name(const RcString& name);
extern bool is_builtin_attr(const Attribute& a);

struct Stability
{
    enum class Level {
        Stable,
        Unstable,
    };
    Level   level;
    RcString    feature;
    /// `since` for stable, `issue` for unstable
    RcString    detail;

    friend ::std::ostream& operator<<(::std::ostream& os, const Stability& x);
};
struct Deprecation
{
    rust::option<RcString>  since;
    rust::option<RcString>  note;
};

extern rust::option<Stability> find_stability(const AttributeList& attrs);
extern rust::option<Deprecation> find_deprecation(const AttributeList& attrs);

}   // namespace AST

#endif
