/*
 * synext - Syntax extension expansion core
 *
 * include/span.hpp
 * - Spans (with hygiene context) and internal error handling
 *
 * User-facing diagnostics go through `Diagnostics::Handler`, the macros here
 * are for internal invariant violations only.
 */
#pragma once

#include <rc_string.hpp>
#include <functional>
#include <memory>

class SyntaxContext;
class ExpnId;
enum class Transparency;

struct SpanInner;
struct SpanInner_Source;

struct Span
{
private:
    SpanInner*  m_ptr;
    unsigned int    m_ctxt; // Index into the hygiene tables (0 = root)
public:
    Span()
        : m_ptr(nullptr)
        , m_ctxt(0)
    {}
    Span(Span parent, RcString filename, unsigned int start_line, unsigned int start_ofs,  unsigned int end_line, unsigned int end_ofs);
    Span(Span parent, RcString source_crate, RcString macro_name);
    ~Span();

    Span(const Span& x);
    Span(Span&& x):
        m_ptr(x.m_ptr),
        m_ctxt(x.m_ctxt)
    {
        x.m_ptr = nullptr;
        x.m_ctxt = 0;
    }

    Span& operator=(const Span& x)
    {
        if( &x != this ) {
            this->~Span();
            new (this) Span(x);
        }
        return *this;
    }
    Span& operator=(Span&& x)
    {
        if( &x != this ) {
            this->~Span();
            new (this) Span(std::move(x));
        }
        return *this;
    }

    operator bool() const { return m_ptr != nullptr; }
    bool is_dummy() const { return m_ptr == nullptr; }
    bool operator==(const Span& x) const { return m_ptr == x.m_ptr && m_ctxt == x.m_ctxt; }
    bool operator!=(const Span& x) const { return !(*this == x); }
    /// Location-only comparison (ignores hygiene)
    bool same_location(const Span& x) const;

    Ordering ord(const Span& x) const;
    bool operator<(const Span& x) const { return ord(x) == OrdLess; }

    const SpanInner* get() const { return m_ptr; }
    const SpanInner* operator->() const { return m_ptr; }

    /// Returns the backing source span (if this span has one)
    const SpanInner_Source* get_source() const;
    /// Walks the parent chain to the outermost span, returning it if it is backed by a real file
    const SpanInner_Source* get_top_file_span() const;

    // --- Hygiene ---
    SyntaxContext ctxt() const;
    Span with_ctxt(const SyntaxContext& ctxt) const;
    /// Replace the context with `root` marked by `expn_id` at the given transparency
    Span with_ctxt_from_mark(const ExpnId& expn_id, Transparency transparency) const;
    Span with_def_site_ctxt(const ExpnId& expn_id) const;
    Span with_call_site_ctxt(const ExpnId& expn_id) const;
    Span with_mixed_site_ctxt(const ExpnId& expn_id) const;
    /// Walk up the expansion call sites until a span from outside any expansion is found
    Span source_callsite() const;
    /// A span covering `this` through to the end of `end` (same file only)
    Span to(const Span& end) const;

    void bug(::std::function<void(::std::ostream&)> msg) const;
    void todo(::std::function<void(::std::ostream&)> msg) const;

    friend ::std::ostream& operator<<(::std::ostream& os, const Span& sp);
private:
    void print_span_message(::std::function<void(::std::ostream&)> tag, ::std::function<void(::std::ostream&)> msg) const;
};
struct SpanInner
{
    friend struct Span;
protected:
    size_t  reference_count;
public:
    Span    parent_span;

    virtual ~SpanInner() = 0;
    virtual void fmt(::std::ostream& os) const = 0;
    virtual RcString crate_name() const = 0;
};
struct SpanInner_Source:
    public SpanInner
{
    friend struct Span;
public:
    RcString    filename;

    unsigned int start_line;
    unsigned int start_ofs;
    unsigned int end_line;
    unsigned int end_ofs;

    ~SpanInner_Source() override;
    void fmt(::std::ostream& os) const override;
    RcString crate_name() const override { return RcString(); }

    /// Synthetic sources (e.g. `<stringify>`) have no backing file
    bool is_real_file() const {
        return filename != "" && filename.c_str()[0] != '<';
    }

private:
    static SpanInner* alloc(Span parent, RcString filename, unsigned int start_line, unsigned int start_ofs,  unsigned int end_line, unsigned int end_ofs) {
        auto* rv = new SpanInner_Source();
        rv->reference_count = 1;
        rv->parent_span = parent;
        rv->filename = ::std::move(filename);
        rv->start_line = start_line;
        rv->start_ofs = start_ofs;
        rv->end_line = end_line;
        rv->end_ofs = end_ofs;
        return rv;
    }
};
/// Span for tokens produced by a macro with no source of their own
struct SpanInner_Macro:
    public SpanInner
{
    friend struct Span;
    RcString    crate;
    RcString    macro;

    ~SpanInner_Macro() override;
    void fmt(::std::ostream& os) const override;
    RcString crate_name() const override { return crate; }

private:
    static SpanInner* alloc(Span parent, RcString crate, RcString macro);
};

template<typename T>
struct Spanned
{
    Span    sp;
    T   ent;
};
template<typename T>
Spanned<T> make_spanned(Span sp, T val) {
    return Spanned<T> { ::std::move(sp), ::std::move(val) };
}

#define BUG(span, msg)  do { ::Span(span).bug([&](::std::ostream& os) { os << __FILE__ << ":" << __LINE__ << ": " << msg; }); throw ::CompileError::BugCheck("Bug fell through"); } while(0)
#define TODO(span, msg)  do { const char* __TODO_func = __func__; ::Span(span).todo([&](::std::ostream& os) { os << __FILE__ << ":" << __LINE__ << ": " << __TODO_func << " - " << msg; }); throw ::CompileError::Todo("Todo fell through"); } while(0)

#define ASSERT_BUG(span, cnd, msg)  do { if( !(cnd) ) { ::Span(span).bug([&](::std::ostream& os) { os << "ASSERT FAIL: " << __FILE__ << ":" << __LINE__ << ":" #cnd << ": " << msg; }); throw ::CompileError::BugCheck("Bug fell through"); } } while(0)
