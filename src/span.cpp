/*
 * synext - Syntax extension expansion core
 *
 * span.cpp
 * - Spans and internal error handling
 */
#include <functional>
#include <iostream>
#include <span.hpp>
#include <hygiene.hpp>
#include <common.hpp>
#include <cstdint>

Span::Span(Span parent, RcString filename, unsigned int start_line, unsigned int start_ofs,  unsigned int end_line, unsigned int end_ofs):
    m_ptr(SpanInner_Source::alloc( parent, ::std::move(filename), start_line, start_ofs, end_line, end_ofs )),
    m_ctxt(0)
{}
Span::Span(Span parent, RcString source_crate, RcString macro_name):
    m_ptr(SpanInner_Macro::alloc(parent, source_crate, macro_name)),
    m_ctxt(0)
{
}
Span::Span(const Span& x):
    m_ptr(x.m_ptr),
    m_ctxt(x.m_ctxt)
{
    if( m_ptr ) {
        m_ptr->reference_count += 1;
    }
}
Span::~Span()
{
    if(m_ptr)
    {
        m_ptr->reference_count --;
        if( m_ptr->reference_count == 0 )
        {
            delete m_ptr;
        }
        m_ptr = nullptr;
    }
}

bool Span::same_location(const Span& x) const
{
    if( m_ptr == x.m_ptr )
        return true;
    const auto* a = this->get_source();
    const auto* b = x.get_source();
    if( !a || !b )
        return false;
    return a->filename == b->filename
        && a->start_line == b->start_line && a->start_ofs == b->start_ofs
        && a->end_line == b->end_line && a->end_ofs == b->end_ofs;
}
Ordering Span::ord(const Span& x) const
{
    if( m_ptr != x.m_ptr )
    {
        ORD( m_ptr != nullptr, x.m_ptr != nullptr );
        const auto* a = this->get_source();
        const auto* b = x.get_source();
        ORD( a != nullptr, b != nullptr );
        if( a )
        {
            ORD( a->filename, b->filename );
            ORD( a->start_line, b->start_line );
            ORD( a->start_ofs, b->start_ofs );
            ORD( a->end_line, b->end_line );
            ORD( a->end_ofs, b->end_ofs );
        }
        else
        {
            ORD( FMT(*this), FMT(x) );
            ORD( reinterpret_cast<uintptr_t>(m_ptr), reinterpret_cast<uintptr_t>(x.m_ptr) );
        }
    }
    return ::ord(m_ctxt, x.m_ctxt);
}

const SpanInner_Source* Span::get_source() const
{
    return dynamic_cast<const SpanInner_Source*>(m_ptr);
}
const SpanInner_Source* Span::get_top_file_span() const
{
    const Span* top_span = this;
    while(top_span->get() && (*top_span)->parent_span)
    {
        top_span = &(*top_span)->parent_span;
    }
    const auto* ts = top_span->get_source();
    if( ts && ts->is_real_file() )
        return ts;
    return nullptr;
}

SyntaxContext Span::ctxt() const
{
    return SyntaxContext::from_u32(m_ctxt);
}
Span Span::with_ctxt(const SyntaxContext& ctxt) const
{
    Span    rv = *this;
    rv.m_ctxt = ctxt.as_u32();
    return rv;
}
Span Span::with_ctxt_from_mark(const ExpnId& expn_id, Transparency transparency) const
{
    return this->with_ctxt( SyntaxContext::root().apply_mark(expn_id, transparency) );
}
Span Span::with_def_site_ctxt(const ExpnId& expn_id) const
{
    return this->with_ctxt_from_mark(expn_id, Transparency::Opaque);
}
Span Span::with_call_site_ctxt(const ExpnId& expn_id) const
{
    return this->with_ctxt_from_mark(expn_id, Transparency::Transparent);
}
Span Span::with_mixed_site_ctxt(const ExpnId& expn_id) const
{
    return this->with_ctxt_from_mark(expn_id, Transparency::SemiTransparent);
}
Span Span::source_callsite() const
{
    const auto& expn_data = this->ctxt().outer_expn_data();
    if( !expn_data.is_root() )
        return expn_data.call_site.source_callsite();
    return *this;
}
Span Span::to(const Span& end) const
{
    const auto* a = this->get_source();
    const auto* b = end.get_source();
    if( !a || !b || a->filename != b->filename )
        return *this;
    Span    rv( (*this)->parent_span, a->filename, a->start_line, a->start_ofs, b->end_line, b->end_ofs );
    rv.m_ctxt = m_ctxt;
    return rv;
}

void Span::print_span_message(::std::function<void(::std::ostream&)> tag, ::std::function<void(::std::ostream&)> msg) const
{
    const Span& sp = *this;
    auto& sink = ::std::cerr;
    sink << sp << " ";
    tag(sink);
    sink << ":";
    msg(sink);
    sink << ::std::endl;

    if( sp.get() )
    {
        for(auto parent = sp->parent_span; parent; parent = parent->parent_span)
        {
            sink << parent << ": note: From here" << ::std::endl;
        }
    }

    sink << ::std::flush;
}
void Span::bug(::std::function<void(::std::ostream&)> msg) const
{
    print_span_message([](::std::ostream& os){os << "BUG";}, msg);
    throw CompileError::BugCheck(FMT(FMT_CB(os, msg(os))));
}
void Span::todo(::std::function<void(::std::ostream&)> msg) const
{
    print_span_message([](::std::ostream& os){os << "TODO";}, msg);
    throw CompileError::Todo(FMT(FMT_CB(os, msg(os))));
}

SpanInner::~SpanInner()
{
}

SpanInner_Source::~SpanInner_Source()
{
}
void SpanInner_Source::fmt(::std::ostream& os) const
{
    os << this->filename;
    if( this->start_line != this->end_line ) {
        os << ":" << this->start_line << "-" << this->end_line;
    }
    else if( this->start_ofs != this->end_ofs ) {
        os << ":" << this->start_line << ":" << this->start_ofs << "-" << this->end_ofs;
    }
    else {
        os << ":" << this->start_line << ":" << this->start_ofs;
    }
}

SpanInner_Macro::~SpanInner_Macro()
{
}
void SpanInner_Macro::fmt(::std::ostream& os) const
{
    os << "MACRO<::\"" << this->crate << "\"::" << this->macro << ">";
}
/*static*/ SpanInner* SpanInner_Macro::alloc(Span parent, RcString crate, RcString macro)
{
    auto rv = new SpanInner_Macro;
    rv->reference_count = 1;
    rv->parent_span = std::move(parent);
    rv->crate = std::move(crate);
    rv->macro = std::move(macro);
    return rv;
}

::std::ostream& operator<<(::std::ostream& os, const Span& sp)
{
    if( sp.m_ptr ) {
        sp.m_ptr->fmt(os);
    }
    else {
        os << "<null>";
    }
    return os;
}
