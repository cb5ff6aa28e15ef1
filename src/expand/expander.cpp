/*
 * synext - Syntax extension expansion core
 *
 * expand/expander.cpp
 * - Fixed-point macro expansion of an AST fragment
 */
#include "expander.hpp"
#include "mac_result.hpp"
#include <ast/mut_visit.hpp>
#include <ast/expr.hpp>
#include <parse/common.hpp>
#include <parse/ttstream.hpp>
#include <parse/lex.hpp>
#include <parse/parseerror.hpp>
#include <pop_on_drop.hpp>
#include <debug_inner.hpp>
#include <algorithm>
#include <functional>

// --------------------------------------------------------------------
// Invocation
// --------------------------------------------------------------------
const Span& Invocation::span() const
{
    TU_MATCH_HDRA( (this->kind), {)
    TU_ARMA(Bang, e)    return e.mac.span();
    TU_ARMA(Attr, e)    return e.attr.span();
    TU_ARMA(DeriveGroup, e) return e.span;
    }
    BUG(Span(), "Bad InvocationKind tag");
}
MacroKind Invocation::macro_kind() const
{
    TU_MATCH_HDRA( (this->kind), {)
    TU_ARMA(Bang, e) { (void)e; return MacroKind::Bang; }
    TU_ARMA(Attr, e) { (void)e; return MacroKind::Attr; }
    TU_ARMA(DeriveGroup, e) { (void)e; return MacroKind::Derive; }
    }
    BUG(Span(), "Bad InvocationKind tag");
}
::std::string Invocation::name() const
{
    TU_MATCH_HDRA( (this->kind), {)
    TU_ARMA(Bang, e)    return FMT(e.mac.path());
    TU_ARMA(Attr, e)    return FMT(e.attr.name());
    TU_ARMA(DeriveGroup, e) {
        (void)e;
        return "derive";
        }
    }
    BUG(Span(), "Bad InvocationKind tag");
}
::std::ostream& operator<<(::std::ostream& os, const Invocation& x)
{
    os << x.expansion_data.id << " " << x.fragment_kind << " ";
    TU_MATCH_HDRA( (x.kind), {)
    TU_ARMA(Bang, e)    os << e.mac;
    TU_ARMA(Attr, e)    os << e.attr;
    TU_ARMA(DeriveGroup, e) {
        os << "#[derive(";
        for(const auto& p : e.paths)
            os << p << ",";
        os << ")]";
        }
    }
    return os;
}

Resolver::~Resolver()
{
}

TokenTree Expand_AnnotatableToTokens(const AST::Annotatable& item)
{
    return Lex_TokenTree(FMT(item), "<annotated item>", item.span());
}

namespace {
    /// Enters an expansion frame (restored on scope exit)
    class ExpansionFrame
    {
        ExtCtxt&    m_cx;
        ExpansionData   m_saved;
    public:
        ExpansionFrame(ExtCtxt& cx, ExpansionData data):
            m_cx(cx),
            m_saved( mv$(cx.current_expansion) )
        {
            m_cx.current_expansion = mv$(data);
        }
        ExpansionFrame(const ExpansionFrame&) = delete;
        ~ExpansionFrame()
        {
            m_cx.current_expansion = mv$(m_saved);
        }
    };

    AST::Path path_from_attr(const AST::Attribute& a)
    {
        ::std::vector<Ident>    segs;
        for(const auto& n : a.name().elems)
            segs.push_back( Ident(n, a.span()) );
        return AST::Path(a.span(), false, mv$(segs));
    }

    /// Trait paths listed by a `#[derive(...)]`, malformed entries are reported only if `cx` is set
    ::std::vector<AST::Path> derive_paths(const AST::Attribute& a, ExtCtxt* cx)
    {
        ::std::vector<AST::Path>    rv;
        auto list = a.meta_item_list();
        if( list.is_none() ) {
            if( cx )
                cx->span_err(a.span(), "malformed `derive` attribute input");
            return rv;
        }
        for(const auto& mi : list.unwrap())
        {
            if( !mi.data.is_Word() || mi.name.elems.empty() ) {
                if( cx )
                    cx->span_err(mi.span, "expected path to a trait, found literal");
                continue ;
            }
            ::std::vector<Ident>    segs;
            for(const auto& n : mi.name.elems)
                segs.push_back( Ident(n, mi.span) );
            rv.push_back( AST::Path(mi.span, false, mv$(segs)) );
        }
        return rv;
    }

    /// Index of the attribute that makes this item an invocation
    ///
    /// Attribute macros run before derives, so the first unknown attribute wins over any `#[derive]`.
    rust::option<size_t> find_attr_invoc(const AST::AttributeList& attrs)
    {
        rust::option<size_t>    first_derive;
        for(size_t i = 0; i < attrs.m_items.size(); i ++)
        {
            const auto& a = attrs.m_items[i];
            if( a.has_name("derive") ) {
                if( first_derive.is_none() )
                    first_derive = rust::Some(i);
                continue ;
            }
            if( !a.is_known() && !AST::is_builtin_attr(a) )
                return i;
        }
        return first_derive;
    }

    /// Replaces macro call sites with placeholders, recording an invocation for each
    class InvocationCollector:
        public AST::MutVisitor
    {
        ExtCtxt&    m_cx;
        const ExpansionData&    m_parent;
        bool    m_monotonic;
        ::std::vector<Ident>    m_module_path;
    public:
        ::std::vector<Invocation>   invocations;

        InvocationCollector(ExtCtxt& cx, const ExpansionData& parent, bool monotonic):
            m_cx(cx),
            m_parent(parent),
            m_monotonic(monotonic),
            m_module_path(parent.module_path)
        {}

        void visit_items(::std::vector<AST::Item>& items) override
        {
            for(auto& i : items)
                visit_item(i);
        }
        void visit_item(AST::Item& i) override
        {
            assign_id(i.id);
            if( i.data.is_MacroInv() && i.data.as_MacroInv().is_placeholder() )
                return ;

            auto sp = i.span;
            if( collect_attr(i.attrs, AST::AstFragmentKind::Items, [&](){ return AST::Annotatable::from_item(mv$(i)); }, [&](ExpnId id){
                    i = AST::Item::new_macro(sp, AST::AttributeList(), AST::MacroInvocation::new_placeholder(sp, id));
                    }) )
            {
                return ;
            }

            if( i.data.is_MacroInv() )
            {
                auto id = collect_bang(AST::AstFragmentKind::Items, mv$(i.data.as_MacroInv()), AST::MacStmtStyle::Semicolon);
                i = AST::Item::new_macro(sp, AST::AttributeList(), AST::MacroInvocation::new_placeholder(sp, id));
                return ;
            }

            if( i.data.is_Mod() )
            {
                auto _ = push_and_pop_at_end(m_module_path, i.name);
                AST::MutVisitor::visit_item(i);
            }
            else
            {
                AST::MutVisitor::visit_item(i);
            }
        }

        void visit_impl_items(::std::vector<AST::ImplItem>& items) override {
            for(auto& i : items)
                visit_assoc(i, AST::AstFragmentKind::ImplItems);
        }
        void visit_trait_items(::std::vector<AST::TraitItem>& items) override {
            for(auto& i : items)
                visit_assoc(i, AST::AstFragmentKind::TraitItems);
        }
        void visit_foreign_items(::std::vector<AST::ForeignItem>& items) override {
            for(auto& i : items)
                visit_assoc(i, AST::AstFragmentKind::ForeignItems);
        }

        void visit_stmt(AST::Stmt& s) override
        {
            assign_id(s.id);
            if( s.data.is_Macro() )
            {
                auto& e = s.data.as_Macro();
                if( e.inv.is_placeholder() )
                    return ;
                auto sp = s.span;
                auto style = e.style;
                auto id = collect_bang(AST::AstFragmentKind::Stmts, mv$(e.inv), style);
                s.data = AST::Stmt::Data::make_Macro({ AST::MacroInvocation::new_placeholder(sp, id), style });
                return ;
            }
            // Items (and so attribute macros on them) are handled by `visit_item`
            AST::MutVisitor::visit_stmt(s);
        }

        void visit_expr(AST::ExprNodeP& e) override
        {
            if( auto* n = dynamic_cast<AST::ExprNode_Macro*>(e.get()) )
            {
                if( n->m_inv.is_placeholder() )
                    return ;
                auto sp = e->span();
                auto id = collect_bang(AST::AstFragmentKind::Expr, mv$(n->m_inv), AST::MacStmtStyle::Semicolon);
                e = AST::ExprNodeP(new AST::ExprNode_Macro( AST::MacroInvocation::new_placeholder(sp, id) ));
                e->set_span(sp);
                return ;
            }
            AST::MutVisitor::visit_expr(e);
        }
        void visit_pat(AST::Pattern& p) override
        {
            if( p.data().is_Macro() )
            {
                auto& mac = *p.data().as_Macro();
                if( mac.is_placeholder() )
                    return ;
                auto sp = p.span();
                auto id = collect_bang(AST::AstFragmentKind::Pat, mv$(mac), AST::MacStmtStyle::Semicolon);
                p = AST::Pattern(sp, AST::Pattern::Data::make_Macro( box$(AST::MacroInvocation::new_placeholder(sp, id)) ));
                return ;
            }
            AST::MutVisitor::visit_pat(p);
        }
        void visit_ty(TypeRef& t) override
        {
            if( t.m_data.is_Macro() )
            {
                auto& mac = t.m_data.as_Macro();
                if( mac.is_placeholder() )
                    return ;
                auto sp = t.span();
                auto id = collect_bang(AST::AstFragmentKind::Ty, mv$(mac), AST::MacStmtStyle::Semicolon);
                t = TypeRef(sp, TypeRef::Data::make_Macro( AST::MacroInvocation::new_placeholder(sp, id) ));
                return ;
            }
            AST::MutVisitor::visit_ty(t);
        }

    private:
        void assign_id(AST::NodeId& id)
        {
            if( m_monotonic && id == AST::DUMMY_NODE_ID )
                id = m_cx.resolver.next_node_id();
        }

        ExpnId collect(AST::AstFragmentKind kind, InvocationKind ik)
        {
            ExpansionData   data;
            data.id = ExpnId::fresh(rust::None<ExpnData>());
            data.depth = m_parent.depth + 1;
            data.module_path = m_module_path;
            data.directory = m_parent.directory;
            auto rv = data.id;
            invocations.push_back( Invocation(mv$(ik), kind, m_parent.id, mv$(data)) );
            DEBUG("Collected " << invocations.back());
            return rv;
        }
        ExpnId collect_bang(AST::AstFragmentKind kind, AST::MacroInvocation mac, AST::MacStmtStyle style)
        {
            return collect(kind, InvocationKind::make_Bang({ mv$(mac), style }));
        }

        /// Check for an attribute invocation on an item, replacing the item with a placeholder if found
        bool collect_attr(AST::AttributeList& attrs, AST::AstFragmentKind kind,
            ::std::function<AST::Annotatable()> take_item,
            ::std::function<void(ExpnId)> set_placeholder
            )
        {
            auto pos = find_attr_invoc(attrs);
            if( pos.is_none() )
                return false;
            auto idx = pos.unwrap();

            if( attrs.m_items[idx].has_name("derive") )
            {
                // Take every `#[derive]` on the item, in order
                Span    derive_span = attrs.m_items[idx].span();
                ::std::vector<AST::Path>    paths;
                for(auto it = attrs.m_items.begin(); it != attrs.m_items.end(); )
                {
                    if( !it->has_name("derive") ) {
                        ++ it;
                        continue ;
                    }
                    for(auto& p : derive_paths(*it, &m_cx))
                        paths.push_back( mv$(p) );
                    it = attrs.m_items.erase(it);
                }
                if( paths.empty() )
                {
                    // `#[derive()]`, nothing to do
                    return false;
                }
                auto id = collect(kind, InvocationKind::make_DeriveGroup({ mv$(derive_span), mv$(paths), take_item() }));
                set_placeholder(id);
                return true;
            }
            else
            {
                // Derives stay on the item, and are expanded once the attribute macro has run
                ::std::vector<AST::Path>    derives;
                for(const auto& a : attrs.m_items)
                {
                    if( a.has_name("derive") )
                        for(auto& p : derive_paths(a, nullptr))
                            derives.push_back( mv$(p) );
                }
                auto attr = mv$(attrs.m_items[idx]);
                attrs.m_items.erase(attrs.m_items.begin() + idx);
                auto id = collect(kind, InvocationKind::make_Attr({ mv$(attr), idx, mv$(derives), take_item() }));
                set_placeholder(id);
                return true;
            }
        }

        template<typename T>
        void visit_assoc(T& i, AST::AstFragmentKind kind)
        {
            assign_id(i.id);
            if( i.data.is_Macro() && i.data.as_Macro().is_placeholder() )
                return ;

            auto sp = i.span;
            auto make_placeholder = [&](ExpnId id) {
                i = T(AST::AssocItem(sp, AST::AttributeList(), false, Ident(""),
                    AST::AssocItem::Data::make_Macro( AST::MacroInvocation::new_placeholder(sp, id) )));
                };
            if( collect_attr(i.attrs, kind, [&](){ return AST::Annotatable(box$(i)); }, make_placeholder) )
                return ;

            if( i.data.is_Macro() )
            {
                auto id = collect_bang(kind, mv$(i.data.as_Macro()), AST::MacStmtStyle::Semicolon);
                make_placeholder(id);
                return ;
            }
            AST::MutVisitor::visit_assoc_item(i);
        }
    };

    /// Splices expanded fragments in place of their placeholders
    class PlaceholderExpander:
        public AST::MutVisitor
    {
        ::std::map<ExpnId, AST::AstFragment>&   m_expanded;
    public:
        PlaceholderExpander(::std::map<ExpnId, AST::AstFragment>& expanded):
            m_expanded(expanded)
        {}

        AST::AstFragment take(const Span& sp, const ExpnId& id)
        {
            auto it = m_expanded.find(id);
            ASSERT_BUG(sp, it != m_expanded.end(), "No expansion for placeholder " << id);
            auto rv = mv$(it->second);
            m_expanded.erase(it);
            return rv;
        }

        void visit_items(::std::vector<AST::Item>& items) override
        {
            ::std::vector<AST::Item>    out;
            out.reserve(items.size());
            for(auto& i : items)
            {
                if( i.data.is_MacroInv() && i.data.as_MacroInv().is_placeholder() )
                {
                    auto new_items = take(i.span, i.data.as_MacroInv().placeholder_id()).unwrap_Items();
                    visit_items(new_items);
                    for(auto& ni : new_items)
                        out.push_back( mv$(ni) );
                }
                else
                {
                    visit_item(i);
                    out.push_back( mv$(i) );
                }
            }
            items = mv$(out);
        }
        void visit_impl_items(::std::vector<AST::ImplItem>& items) override {
            splice_assoc(items, [](AST::AstFragment f){ return f.unwrap_ImplItems(); });
        }
        void visit_trait_items(::std::vector<AST::TraitItem>& items) override {
            splice_assoc(items, [](AST::AstFragment f){ return f.unwrap_TraitItems(); });
        }
        void visit_foreign_items(::std::vector<AST::ForeignItem>& items) override {
            splice_assoc(items, [](AST::AstFragment f){ return f.unwrap_ForeignItems(); });
        }

        void visit_stmts(::std::vector<AST::Stmt>& stmts) override
        {
            ::std::vector<AST::Stmt>    out;
            out.reserve(stmts.size());
            for(auto& s : stmts)
            {
                if( s.data.is_Macro() && s.data.as_Macro().inv.is_placeholder() )
                {
                    auto new_stmts = take(s.span, s.data.as_Macro().inv.placeholder_id()).unwrap_Stmts();
                    visit_stmts(new_stmts);
                    for(auto& ns : new_stmts)
                        out.push_back( mv$(ns) );
                }
                else if( s.data.is_Item() && s.data.as_Item()->data.is_MacroInv() && s.data.as_Item()->data.as_MacroInv().is_placeholder() )
                {
                    const auto& ph = *s.data.as_Item();
                    auto new_items = take(ph.span, ph.data.as_MacroInv().placeholder_id()).unwrap_Items();
                    visit_items(new_items);
                    for(auto& ni : new_items)
                    {
                        auto sp = ni.span;
                        out.push_back( AST::Stmt::new_item(mv$(sp), mv$(ni)) );
                    }
                }
                else
                {
                    visit_stmt(s);
                    out.push_back( mv$(s) );
                }
            }
            stmts = mv$(out);
        }

        void visit_expr(AST::ExprNodeP& e) override
        {
            if( auto* n = dynamic_cast<AST::ExprNode_Macro*>(e.get()) )
            {
                if( n->m_inv.is_placeholder() )
                {
                    auto sp = e->span();
                    e = take(sp, n->m_inv.placeholder_id()).unwrap_Expr();
                    visit_expr(e);
                    return ;
                }
            }
            AST::MutVisitor::visit_expr(e);
        }
        void visit_pat(AST::Pattern& p) override
        {
            if( p.data().is_Macro() && p.data().as_Macro()->is_placeholder() )
            {
                auto sp = p.span();
                p = take(sp, p.data().as_Macro()->placeholder_id()).unwrap_Pat();
                visit_pat(p);
                return ;
            }
            AST::MutVisitor::visit_pat(p);
        }
        void visit_ty(TypeRef& t) override
        {
            if( t.m_data.is_Macro() && t.m_data.as_Macro().is_placeholder() )
            {
                auto sp = t.span();
                t = take(sp, t.m_data.as_Macro().placeholder_id()).unwrap_Ty();
                visit_ty(t);
                return ;
            }
            AST::MutVisitor::visit_ty(t);
        }

    private:
        template<typename T, typename F>
        void splice_assoc(::std::vector<T>& items, F unwrap)
        {
            ::std::vector<T>    out;
            out.reserve(items.size());
            for(auto& i : items)
            {
                if( i.data.is_Macro() && i.data.as_Macro().is_placeholder() )
                {
                    auto new_items = unwrap( take(i.span, i.data.as_Macro().placeholder_id()) );
                    for(auto& ni : new_items)
                    {
                        // Recurse through the virtual list visitor (handles nested placeholders)
                        ::std::vector<T>    one;
                        one.push_back( mv$(ni) );
                        this->visit_list(one);
                        for(auto& x : one)
                            out.push_back( mv$(x) );
                    }
                }
                else
                {
                    visit_assoc_item(i);
                    out.push_back( mv$(i) );
                }
            }
            items = mv$(out);
        }
        void visit_list(::std::vector<AST::ImplItem>& v) { visit_impl_items(v); }
        void visit_list(::std::vector<AST::TraitItem>& v) { visit_trait_items(v); }
        void visit_list(::std::vector<AST::ForeignItem>& v) { visit_foreign_items(v); }
    };
}

// --------------------------------------------------------------------
// MacroExpander
// --------------------------------------------------------------------
struct MacroExpander::Collected
{
    AST::AstFragment    fragment;
    ::std::vector<Invocation>   invocations;
};

MacroExpander::Collected MacroExpander::collect_invocations(AST::AstFragment fragment, const ExpansionData& parent_data)
{
    InvocationCollector c { m_cx, parent_data, m_monotonic };
    c.visit_fragment(fragment);
    m_cx.resolver.visit_ast_fragment_with_placeholders(parent_data.id, fragment);
    return Collected { mv$(fragment), mv$(c.invocations) };
}

AST::AstFragment MacroExpander::fully_expand_fragment(AST::AstFragment input)
{
    DebugTimedPhase _phase("Expand");
    TRACE_FUNCTION_F(input.kind() << (m_monotonic ? " monotonic" : " eager"));

    // Eager expansion keeps the enclosing depth so nested calls stay under the recursion limit
    const auto root_data = m_cx.current_expansion;
    ExpansionFrame  root_frame(m_cx, root_data);

    auto collected = collect_invocations(mv$(input), root_data);
    auto fragment_with_placeholders = mv$(collected.fragment);
    ::std::vector<Invocation>   undetermined = mv$(collected.invocations);

    ::std::map<ExpnId, AST::AstFragment>    expanded_fragments;
    bool force = false;
    while( !undetermined.empty() )
    {
        DEBUG("Pass: " << undetermined.size() << " invocations, force=" << force);
        bool progress = false;
        auto current = mv$(undetermined);
        undetermined.clear();
        for(auto& invoc : current)
        {
            auto res = m_cx.resolver.resolve_macro_invocation(invoc, root_data.id, force);
            if( res.is_Indeterminate() )
            {
                if( !force ) {
                    undetermined.push_back( mv$(invoc) );
                    continue ;
                }
                // A forced resolution that still can't decide
                m_cx.span_err(invoc.span(), FMT("cannot determine resolution for the " << MacroKind_descr(invoc.macro_kind()) << " `" << invoc.name() << "`"));
                invoc.expansion_data.id.set_expn_data(ExpnData::default_(
                    ExpnKind::make_macro(invoc.macro_kind(), RcString(invoc.name())), invoc.span(), m_cx.ecfg.edition
                    ));
                expanded_fragments.insert( ::std::make_pair(invoc.expansion_data.id, DummyResult::make_fragment(invoc.span(), invoc.fragment_kind)) );
                progress = true;
                continue ;
            }
            progress = true;

            auto expn_id = invoc.expansion_data.id;
            auto expansion_data = invoc.expansion_data;

            AST::AstFragment    expanded;
            {
                ExpansionFrame  frame(m_cx, expansion_data);
                if( res.is_DeriveGroup() )
                    expanded = expand_derives(mv$(invoc), res.as_DeriveGroup());
                else
                    expanded = expand_invoc(mv$(invoc), res.as_Single());
            }

            // Anything in the output gets expanded as a child of this expansion (on the next pass)
            auto c = collect_invocations(mv$(expanded), expansion_data);
            for(auto& i : c.invocations)
                undetermined.push_back( mv$(i) );
            expanded_fragments.insert( ::std::make_pair(expn_id, mv$(c.fragment)) );
        }

        // Only force resolution once a pass has stopped making progress
        force = !progress;
    }

    PlaceholderExpander pe { expanded_fragments };
    pe.visit_fragment(fragment_with_placeholders);
    ASSERT_BUG(Span(), expanded_fragments.empty(), "Expanded fragments left unused");
    return fragment_with_placeholders;
}

AST::AstFragment MacroExpander::parse_ast_fragment(const TokenTree& toks, AST::AstFragmentKind kind, const AST::Path& path, const Span& sp)
{
    TTStream    lex(sp, toks);
    try
    {
        return Parse_AstFragment(lex, kind);
    }
    catch(const ParseError::Base& e)
    {
        auto db = m_cx.struct_span_err(e.span(), e.what());
        db.span_note(sp, FMT("while parsing the output of `" << path << "!` as " << AST::AstFragmentKind_name(kind)));
        db.emit();
        return DummyResult::make_fragment(sp, kind);
    }
}

AST::AstFragment MacroExpander::kind_mismatch(Invocation& invoc, const SyntaxExtension& ext)
{
    const auto& sp = invoc.span();
    m_cx.span_err(sp, FMT("expected " << MacroKind_descr_expected(invoc.macro_kind())
        << ", found " << MacroKind_descr(ext.macro_kind()) << " `" << invoc.name() << "`"));
    TU_MATCH_HDRA( (invoc.kind), {)
    TU_ARMA(Bang, e) {
        (void)e;
        return DummyResult::make_fragment(sp, invoc.fragment_kind);
        }
    TU_ARMA(Attr, e) {
        // Drop the attribute, keep the item
        return AST::expect_from_annotatables(sp, invoc.fragment_kind, make_vec1(mv$(e.item)));
        }
    TU_ARMA(DeriveGroup, e) {
        return AST::expect_from_annotatables(sp, invoc.fragment_kind, make_vec1(mv$(e.item)));
        }
    }
    BUG(sp, "Bad InvocationKind tag");
}

AST::AstFragment MacroExpander::expand_invoc(Invocation invoc, const ::std::shared_ptr<SyntaxExtension>& ext_ptr)
{
    ASSERT_BUG(invoc.span(), ext_ptr, "Resolver returned a null extension");
    const auto& ext = *ext_ptr;
    const auto kind = invoc.fragment_kind;
    const Span  sp = invoc.span();
    TRACE_FUNCTION_F(invoc);

    invoc.expansion_data.id.set_expn_data( ext.expn_data(invoc.parent, sp, RcString(invoc.name())) );

    if( invoc.expansion_data.depth > m_cx.ecfg.recursion_limit )
    {
        auto db = m_cx.struct_span_fatal(sp, FMT("recursion limit reached while expanding `" << invoc.expansion_data.id.expn_data().kind.descr() << "`"));
        db.help(FMT("consider adding a `#![recursion_limit=\"" << m_cx.ecfg.recursion_limit * 2 << "\"]` attribute to your crate"));
        db.emit();
        throw CompileError::Fatal("recursion limit reached");
    }

    if( ext.macro_kind() != invoc.macro_kind() )
        return kind_mismatch(invoc, ext);

    TU_MATCH_HDRA( (invoc.kind), {)
    TU_ARMA(Bang, e) {
        const auto& path = e.mac.path();
        if( m_cx.trace_macros() ) {
            m_cx.expansions[sp.source_callsite()].push_back( FMT("expanding `" << path << "! { " << e.mac.input_tt().to_source() << " }`") );
        }

        AST::AstFragment    rv;
        TU_MATCH_HDRA( (ext.kind), {)
        TU_ARMA(Bang, expander) {
            auto out = expander->expand(m_cx, sp, e.mac.input_tt());
            rv = parse_ast_fragment(out, kind, path, sp);
            }
        TU_ARMA(LegacyBang, expander) {
            auto res = MacResult_make( expander->expand(m_cx, sp, e.mac.input_tt()), kind );
            if( res.is_none() ) {
                m_cx.span_err(sp, FMT("non-" << AST::AstFragmentKind_name(kind) << " macro in " << AST::AstFragmentKind_name(kind) << " position: " << path));
                rv = DummyResult::make_fragment(sp, kind);
            }
            else {
                rv = mv$(res.unwrap());
            }
            }
        TU_ARMA(Attr, expander)         { (void)expander; BUG(sp, "Attribute macro reached bang expansion"); }
        TU_ARMA(LegacyAttr, expander)   { (void)expander; BUG(sp, "Attribute macro reached bang expansion"); }
        TU_ARMA(NonMacroAttr, ee)       { (void)ee; BUG(sp, "Attribute macro reached bang expansion"); }
        TU_ARMA(Derive, expander)       { (void)expander; BUG(sp, "Derive macro reached bang expansion"); }
        TU_ARMA(LegacyDerive, expander) { (void)expander; BUG(sp, "Derive macro reached bang expansion"); }
        }

        // `foo!(...);` keeps its semicolon on the last statement
        if( kind == AST::AstFragmentKind::Stmts && e.style == AST::MacStmtStyle::Semicolon )
        {
            auto& stmts = rv.as_Stmts();
            if( !stmts.empty() && stmts.back().data.is_Expr() )
            {
                auto& last = stmts.back();
                last.data = AST::Stmt::Data::make_Semi({ last.data.unwrap_Expr() });
            }
        }
        if( m_cx.trace_macros() ) {
            m_cx.expansions[sp.source_callsite()].push_back( FMT("to `" << rv << "`") );
        }
        return rv;
        }
    TU_ARMA(Attr, e) {
        TU_MATCH_HDRA( (ext.kind), {)
        TU_ARMA(Attr, expander) {
            auto item_tokens = Expand_AnnotatableToTokens(e.item);
            auto out = expander->expand(m_cx, sp, e.attr.inner_tokens(), item_tokens);
            return parse_ast_fragment(out, kind, path_from_attr(e.attr), sp);
            }
        TU_ARMA(LegacyAttr, expander) {
            auto items = expander->expand(m_cx, sp, e.attr, mv$(e.item));
            return AST::expect_from_annotatables(sp, kind, mv$(items));
            }
        TU_ARMA(NonMacroAttr, ee) {
            e.attr.mark_known();
            if( ee.mark_used )
                e.attr.mark_used();
            auto& attrs = e.item.attrs().m_items;
            auto pos = ::std::min(e.attr_pos, attrs.size());
            attrs.insert(attrs.begin() + pos, mv$(e.attr));
            return AST::expect_from_annotatables(sp, kind, make_vec1(mv$(e.item)));
            }
        TU_ARMA(Bang, expander)         { (void)expander; BUG(sp, "Bang macro reached attribute expansion"); }
        TU_ARMA(LegacyBang, expander)   { (void)expander; BUG(sp, "Bang macro reached attribute expansion"); }
        TU_ARMA(Derive, expander)       { (void)expander; BUG(sp, "Derive macro reached attribute expansion"); }
        TU_ARMA(LegacyDerive, expander) { (void)expander; BUG(sp, "Derive macro reached attribute expansion"); }
        }
        }
    TU_ARMA(DeriveGroup, e) {
        (void)e;
        BUG(sp, "Derive group resolved to a single extension");
        }
    }
    BUG(sp, "Bad InvocationKind tag");
}

AST::AstFragment MacroExpander::expand_derives(Invocation invoc, const ::std::vector< ::std::shared_ptr<SyntaxExtension> >& exts)
{
    const auto kind = invoc.fragment_kind;
    const Span  sp = invoc.span();
    TRACE_FUNCTION_F(invoc);
    auto& e = invoc.kind.as_DeriveGroup();
    const auto group_id = invoc.expansion_data.id;

    auto data = ExpnData::default_(ExpnKind::make_macro(MacroKind::Attr, "derive"), sp, m_cx.ecfg.edition);
    data.parent = invoc.parent;
    group_id.set_expn_data(mv$(data));

    if( invoc.expansion_data.depth > m_cx.ecfg.recursion_limit )
    {
        m_cx.span_fatal(sp, FMT("recursion limit reached while expanding `#[derive]`"));
    }

    if( !e.item.derive_allowed() )
    {
        m_cx.span_err(sp, "`derive` may only be applied to structs, enums and unions");
        return AST::expect_from_annotatables(sp, kind, make_vec1(mv$(e.item)));
    }
    ASSERT_BUG(sp, exts.size() == e.paths.size(), "Derive group resolved to " << exts.size() << " extensions for " << e.paths.size() << " paths");

    // Helper attributes are inert from now on
    for(const auto& ext : exts)
    {
        for(const auto& h : ext->helper_attrs)
            for(const auto& a : e.item.attrs().m_items)
                if( a.name() == h )
                    a.mark_known();
    }

    ::std::vector<AST::Annotatable> derived;
    for(size_t i = 0; i < exts.size(); i ++)
    {
        const auto& ext = *exts[i];
        const auto& path = e.paths[i];
        DEBUG("#[derive(" << path << ")]");
        if( ext.macro_kind() != MacroKind::Derive ) {
            m_cx.span_err(path.span(), FMT("expected derive macro, found " << MacroKind_descr(ext.macro_kind()) << " `" << path << "`"));
            continue ;
        }

        ExpansionData   derive_data = invoc.expansion_data;
        derive_data.id = ExpnId::fresh( ext.expn_data(group_id, path.span(), path.last_name()) );
        ExpansionFrame  frame(m_cx, mv$(derive_data));

        TU_MATCH_HDRA( (ext.kind), {)
        TU_ARMA(Derive, expander) {
            auto out = expander->expand(m_cx, path.span(), Expand_AnnotatableToTokens(e.item));
            auto items = parse_ast_fragment(out, AST::AstFragmentKind::Items, path, path.span()).unwrap_Items();
            for(auto& it : items)
                derived.push_back( AST::Annotatable::from_item(mv$(it)) );
            }
        TU_ARMA(LegacyDerive, expander) {
            auto items = expander->expand(m_cx, path.span(), path, e.item);
            for(auto& it : items)
                derived.push_back( mv$(it) );
            }
        TU_ARMA(Bang, expander)         { (void)expander; BUG(sp, "Bang macro reached derive expansion"); }
        TU_ARMA(LegacyBang, expander)   { (void)expander; BUG(sp, "Bang macro reached derive expansion"); }
        TU_ARMA(Attr, expander)         { (void)expander; BUG(sp, "Attribute macro reached derive expansion"); }
        TU_ARMA(LegacyAttr, expander)   { (void)expander; BUG(sp, "Attribute macro reached derive expansion"); }
        TU_ARMA(NonMacroAttr, ee)       { (void)ee; BUG(sp, "Attribute macro reached derive expansion"); }
        }

        if( ext.is_derive_copy )
            m_cx.resolver.add_derives(group_id, SpecialDerives::COPY);
    }

    ::std::vector<AST::Annotatable> out;
    out.push_back( mv$(e.item) );
    for(auto& d : derived)
        out.push_back( mv$(d) );
    return AST::expect_from_annotatables(sp, kind, mv$(out));
}
