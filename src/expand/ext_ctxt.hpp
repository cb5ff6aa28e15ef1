/*
 * synext - Syntax extension expansion core
 *
 * expand/ext_ctxt.hpp
 * - Context handed to syntax extensions
 *
 * One `ExtCtxt` exists per expansion pass. It carries the session, the
 * resolver, the configuration, and the current expansion frame (which the
 * expander swaps in around each macro call).
 */
#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <memory>
#include <parse_sess.hpp>
#include <ast/fragment.hpp>
#include "invocation.hpp"
#include "resolver.hpp"

class TokenStream;
class MacroExpander;

struct ExpansionConfig
{
    RcString    crate_name;
    AST::Edition    edition;
    /// Maximum nesting of expansions
    unsigned int    recursion_limit;
    /// `trace_macros!` state
    bool    trace_mac;
    /// Enabled language features
    ::std::set<RcString>   features;

    static ExpansionConfig default_(RcString crate_name);

    bool is_feature_enabled(const char* name) const;
};

class ExtCtxt
{
public:
    ParseSess&  parse_sess;
    ExpansionConfig ecfg;
    /// Directory of the crate root
    ::std::string   root_path;
    Resolver&   resolver;
    ExpansionData   current_expansion;
    /// `trace_macros!` notes, keyed by the outermost call site
    ::std::map<Span, ::std::vector< ::std::string> >   expansions;

    ExtCtxt(ParseSess& parse_sess, ExpansionConfig ecfg, Resolver& resolver);
    ExtCtxt(const ExtCtxt&) = delete;
    ExtCtxt& operator=(const ExtCtxt&) = delete;

    /// Expander that nests within the current expansion (for eager expansion)
    MacroExpander expander();
    /// Expander for a whole crate (or other top-level fragment)
    MacroExpander monotonic_expander();

    /// Parser over the given tokens
    ::std::unique_ptr<TokenStream> new_parser_from_tts(const TokenTree& tts) const;

    /// Invocation span of the current expansion
    Span call_site() const;
    /// Give a span the def-site (opaque) hygiene of the current expansion
    Span with_def_site_ctxt(const Span& sp) const;
    /// Give a span the call-site (transparent) hygiene of the current expansion
    Span with_call_site_ctxt(const Span& sp) const;
    /// Give a span `macro_rules!` (semi-transparent) hygiene
    Span with_legacy_ctxt(const Span& sp) const;

    /// Call site of the outermost macro in the current chain (stopping at `include!`)
    rust::option<Span> expansion_cause() const;

    Diagnostics::DiagnosticBuilder struct_span_warn(Span sp, ::std::string msg);
    Diagnostics::DiagnosticBuilder struct_span_err(Span sp, ::std::string msg);
    Diagnostics::DiagnosticBuilder struct_span_fatal(Span sp, ::std::string msg);

    void span_warn(Span sp, ::std::string msg);
    void span_err(Span sp, ::std::string msg);
    void span_err_with_code(Span sp, ::std::string msg, ::std::string code);
    /// Report and unwind (throws `CompileError::Fatal`)
    void span_fatal(Span sp, ::std::string msg);
    void span_bug(Span sp, ::std::string msg);
    void bug(::std::string msg);
    void span_unimpl(Span sp, ::std::string msg);

    void trace_macros_diag();
    bool trace_macros() const { return ecfg.trace_mac; }
    void set_trace_macros(bool x) { ecfg.trace_mac = x; }

    Ident ident_of(const char* s, Span sp) const;
    /// `$crate::a::b` with a def-site span
    AST::Path std_path(const ::std::vector<const char*>& components) const;
    /// `::a::b`
    AST::Path path_global(Span sp, const ::std::vector<const char*>& components) const;

    /// Resolve a path relative to the file containing `sp`'s call site
    ::std::string resolve_path(const ::std::string& path, const Span& sp);

    void check_unused_macros();
    /// Start expanding from the scope of a module (e.g. for a crate-level pass)
    void set_module_scope(AST::NodeId module_id);

    // --- AST construction ---
    AST::ExprNodeP expr_tuple(Span sp, ::std::vector<AST::ExprNodeP> exprs) const;
    AST::ExprNodeP expr_str(Span sp, ::std::string s) const;
    AST::ExprNodeP expr_usize(Span sp, uint64_t v) const;
    AST::ExprNodeP expr_u32(Span sp, uint32_t v) const;
    AST::ExprNodeP expr_bool(Span sp, bool v) const;
    /// Array literal `[a, b, c]`
    AST::ExprNodeP expr_vec(Span sp, ::std::vector<AST::ExprNodeP> exprs) const;
    TypeRef ty_ident(Span sp, Ident name) const;
    TypeRef ty_rptr(Span sp, TypeRef inner, RcString lifetime, bool is_mut) const;
    TypeRef ty_tup(Span sp, ::std::vector<TypeRef> tys) const;
    TypeRef ty_array(Span sp, TypeRef inner, AST::ExprNodeP size) const;
    AST::Item item_static(Span sp, Ident name, TypeRef ty, AST::StaticClass cls, AST::ExprNodeP value) const;
    AST::Item item_impl(Span sp, AST::Path trait_path, TypeRef self_ty, ::std::vector<AST::ImplItem> items) const;
    AST::Stmt stmt_expr(AST::ExprNodeP e) const;
};

/// Result of `expr_to_spanned_string`
TAGGED_UNION(ExprStringResult, Ok,
    (Ok, struct {
        ::std::string   value;
        Span    span;
        }),
    // The error to report (null if the expression was already an error)
    (Err, ::std::unique_ptr<Diagnostics::DiagnosticBuilder>)
    );

/// Eagerly expand an expression and extract a string literal from it
extern ExprStringResult expr_to_spanned_string(ExtCtxt& cx, AST::ExprNodeP expr, const char* err_msg);
/// As `expr_to_spanned_string`, but emits the error
extern rust::option< ::std::string> expr_to_string(ExtCtxt& cx, AST::ExprNodeP expr, const char* err_msg);

/// Error if any arguments were passed
extern void check_zero_tts(ExtCtxt& cx, const Span& sp, const TokenTree& tts, const char* name);
/// A single string literal argument (with an optional trailing comma)
extern rust::option< ::std::string> get_single_str_from_tts(ExtCtxt& cx, const Span& sp, const TokenTree& tts, const char* name);
/// Comma-separated expressions (each eagerly expanded)
extern rust::option< ::std::vector<AST::ExprNodeP> > get_exprs_from_tts(ExtCtxt& cx, const Span& sp, const TokenTree& tts);

