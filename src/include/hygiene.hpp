/*
 * synext - Syntax extension expansion core
 *
 * include/hygiene.hpp
 * - Expansion identities, expansion provenance, and syntax contexts
 *
 * Every macro expansion gets an `ExpnId`, with an `ExpnData` describing where
 * it was invoked from and what was invoked. A `SyntaxContext` is the chain of
 * (expansion, transparency) marks applied to a span, interned so that equal
 * chains share an index.
 */
#pragma once

#include <span.hpp>
#include <rustic.hpp>
#include <ast/edition.hpp>
#include <vector>

/// The three invocation categories of a macro
enum class MacroKind
{
    Bang,   // `foo!()`
    Attr,   // `#[foo]`
    Derive, // `#[derive(Foo)]`
};
extern const char* MacroKind_descr(MacroKind k);
extern const char* MacroKind_descr_expected(MacroKind k);
extern ::std::ostream& operator<<(::std::ostream& os, const MacroKind& x);

/// How identifiers carrying a mark resolve
enum class Transparency
{
    /// Identifiers resolve at the call site (as if written inline)
    Transparent,
    /// Local variables are hygienic, items are not (`macro_rules!` behaviour)
    SemiTransparent,
    /// Identifiers resolve only at the definition site
    Opaque,
};
extern ::std::ostream& operator<<(::std::ostream& os, const Transparency& x);

struct ExpnData;

class ExpnId
{
    unsigned int    m_idx;

    explicit ExpnId(unsigned int idx): m_idx(idx) {}
public:
    ExpnId(): m_idx(0) {}

    static ExpnId root() { return ExpnId(0); }
    /// Allocate a new expansion, optionally with its data already known
    static ExpnId fresh(rust::option<ExpnData> data);
    static ExpnId from_u32(unsigned int idx) { return ExpnId(idx); }

    unsigned int as_u32() const { return m_idx; }
    bool is_root() const { return m_idx == 0; }

    /// Obtain the expansion data (bug if it has not been set)
    const ExpnData& expn_data() const;
    bool has_expn_data() const;
    /// Set the expansion data (bug if already set)
    void set_expn_data(ExpnData data) const;
    /// `true` if `ancestor` is this expansion or one of its parents
    bool is_descendant_of(const ExpnId& ancestor) const;
    ExpnId parent() const;

    bool operator==(const ExpnId& x) const { return m_idx == x.m_idx; }
    bool operator!=(const ExpnId& x) const { return m_idx != x.m_idx; }
    bool operator<(const ExpnId& x) const { return m_idx < x.m_idx; }

    friend ::std::ostream& operator<<(::std::ostream& os, const ExpnId& x) {
        return os << "expn" << x.m_idx;
    }
};

struct ExpnKind
{
    enum class Tag {
        Root,
        Macro,
    };
    Tag tag;
    MacroKind   macro_kind;
    RcString    name;

    static ExpnKind make_root() {
        return ExpnKind { Tag::Root, MacroKind::Bang, RcString() };
    }
    static ExpnKind make_macro(MacroKind kind, RcString name) {
        return ExpnKind { Tag::Macro, kind, ::std::move(name) };
    }

    bool is_root() const { return tag == Tag::Root; }
    /// User-facing description (`foo!`, `#[foo]`, `#[derive(Foo)]`)
    ::std::string descr() const;
};

/// Provenance record attached to every span produced by one expansion
struct ExpnData
{
    ExpnKind    kind;
    /// Expansion containing the invocation
    ExpnId  parent;
    /// Span of the invocation
    Span    call_site;
    /// Span of the macro definition (if known)
    Span    def_site;
    /// Features usable by the expanded code even when not enabled by the user
    rust::option< ::std::vector<RcString> > allow_internal_unstable;
    bool    allow_internal_unsafe;
    bool    local_inner_macros;
    AST::Edition    edition;

    static ExpnData default_(ExpnKind kind, Span call_site, AST::Edition edition);

    bool is_root() const { return kind.is_root(); }
    bool allows_unstable(const RcString& feature) const;
};

class SyntaxContext
{
    unsigned int    m_idx;

    explicit SyntaxContext(unsigned int idx): m_idx(idx) {}
public:
    SyntaxContext(): m_idx(0) {}

    static SyntaxContext root() { return SyntaxContext(0); }
    static SyntaxContext from_u32(unsigned int idx) { return SyntaxContext(idx); }
    unsigned int as_u32() const { return m_idx; }
    bool is_root() const { return m_idx == 0; }

    /// Extend this context with a mark (see `Transparency` for how the result resolves)
    SyntaxContext apply_mark(const ExpnId& expn_id, Transparency transparency) const;
    /// Drop the outermost mark, returning it
    ExpnId remove_mark();

    /// The chain of marks applied to this context, innermost first
    ::std::vector< ::std::pair<ExpnId, Transparency> > marks() const;

    ExpnId outer_expn() const;
    Transparency outer_transparency() const;
    const ExpnData& outer_expn_data() const;
    SyntaxContext parent() const;

    /// Context with only opaque marks kept (macros 2.0 name resolution)
    SyntaxContext normalize_to_macros_2_0() const;
    /// Context with opaque and semi-transparent marks kept (`macro_rules!` name resolution)
    SyntaxContext normalize_to_macro_rules() const;

    bool operator==(const SyntaxContext& x) const { return m_idx == x.m_idx; }
    bool operator!=(const SyntaxContext& x) const { return m_idx != x.m_idx; }
    bool operator<(const SyntaxContext& x) const { return m_idx < x.m_idx; }

    friend ::std::ostream& operator<<(::std::ostream& os, const SyntaxContext& x) {
        return os << "#" << x.m_idx;
    }
};
