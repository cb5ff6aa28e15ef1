/*
 * synext - Syntax extension expansion core
 *
 * diagnostics/handler.cpp
 * - User-facing diagnostic sink
 */
#include "handler.hpp"
#include <common.hpp>
#include <iostream>

namespace Diagnostics {

const char* Level_name(Level l)
{
    switch(l)
    {
    case Level::Bug:    return "error: internal compiler error";
    case Level::Fatal:  return "error";
    case Level::Error:  return "error";
    case Level::Warning:return "warning";
    case Level::Note:   return "note";
    case Level::Help:   return "help";
    }
    return "";
}
::std::ostream& operator<<(::std::ostream& os, const Level& x)
{
    return os << Level_name(x);
}

::std::ostream& operator<<(::std::ostream& os, const Diagnostic& x)
{
    os << x.span << " " << x.level;
    if( x.code != "" )
        os << "[" << x.code << "]";
    os << ": " << x.message;
    return os;
}

Emitter::~Emitter()
{
}
void StderrEmitter::emit(const Diagnostic& d)
{
    auto& sink = ::std::cerr;
    sink << d << ::std::endl;
    if( d.span.get() )
    {
        for(auto parent = d.span->parent_span; parent; parent = parent->parent_span)
        {
            sink << parent << ": note: From here" << ::std::endl;
        }
    }
    for(const auto& c : d.children)
    {
        if( c.span )
            sink << c.span << " ";
        else
            sink << "  = ";
        sink << c.level << ": " << c.message << ::std::endl;
    }
    sink << ::std::flush;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
    if( !m_done )
        emit();
}
void DiagnosticBuilder::emit()
{
    if( m_done )
        return ;
    m_done = true;
    m_handler->emit_diagnostic(m_diag);
}

Handler::Handler():
    Handler(::std::unique_ptr<Emitter>(new StderrEmitter()))
{
}
Handler::Handler(::std::unique_ptr<Emitter> emitter):
    m_emitter(mv$(emitter)),
    m_err_count(0),
    m_warn_count(0)
{
}

void Handler::emit_diagnostic(const Diagnostic& d)
{
    DEBUG(d);
    if( d.is_error() )
        m_err_count += 1;
    else if( d.level == Level::Warning )
        m_warn_count += 1;
    if( m_emitter )
        m_emitter->emit(d);
}

DiagnosticBuilder Handler::struct_span_warn(Span sp, ::std::string msg)
{
    return DiagnosticBuilder(*this, Diagnostic(Level::Warning, mv$(sp), mv$(msg)));
}
DiagnosticBuilder Handler::struct_span_err(Span sp, ::std::string msg)
{
    return DiagnosticBuilder(*this, Diagnostic(Level::Error, mv$(sp), mv$(msg)));
}
DiagnosticBuilder Handler::struct_span_err_with_code(Span sp, ::std::string msg, ::std::string code)
{
    auto rv = struct_span_err(mv$(sp), mv$(msg));
    rv.code(mv$(code));
    return rv;
}
DiagnosticBuilder Handler::struct_span_fatal(Span sp, ::std::string msg)
{
    return DiagnosticBuilder(*this, Diagnostic(Level::Fatal, mv$(sp), mv$(msg)));
}
DiagnosticBuilder Handler::struct_span_note(Span sp, ::std::string msg)
{
    return DiagnosticBuilder(*this, Diagnostic(Level::Note, mv$(sp), mv$(msg)));
}

void Handler::span_warn(Span sp, ::std::string msg)
{
    emit_diagnostic(Diagnostic(Level::Warning, mv$(sp), mv$(msg)));
}
void Handler::span_err(Span sp, ::std::string msg)
{
    emit_diagnostic(Diagnostic(Level::Error, mv$(sp), mv$(msg)));
}
void Handler::span_err_with_code(Span sp, ::std::string msg, ::std::string code)
{
    Diagnostic  d(Level::Error, mv$(sp), mv$(msg));
    d.code = mv$(code);
    emit_diagnostic(d);
}
void Handler::span_note(Span sp, ::std::string msg)
{
    emit_diagnostic(Diagnostic(Level::Note, mv$(sp), mv$(msg)));
}
void Handler::note(::std::string msg)
{
    emit_diagnostic(Diagnostic(Level::Note, Span(), mv$(msg)));
}

void Handler::span_fatal(Span sp, ::std::string msg)
{
    emit_diagnostic(Diagnostic(Level::Fatal, mv$(sp), msg));
    throw CompileError::Fatal(mv$(msg));
}
void Handler::span_bug(Span sp, ::std::string msg)
{
    emit_diagnostic(Diagnostic(Level::Bug, mv$(sp), msg));
    throw CompileError::BugCheck(mv$(msg));
}
void Handler::bug(::std::string msg)
{
    span_bug(Span(), mv$(msg));
}
void Handler::span_unimpl(Span sp, ::std::string msg)
{
    msg = "unimplemented " + msg;
    emit_diagnostic(Diagnostic(Level::Bug, mv$(sp), msg));
    throw CompileError::Todo(mv$(msg));
}

void Handler::abort_if_errors() const
{
    if( m_err_count > 0 )
    {
        if( m_err_count == 1 )
            throw CompileError::Fatal("aborting due to previous error");
        throw CompileError::Fatal(FMT("aborting due to " << m_err_count << " previous errors"));
    }
}

}   // namespace Diagnostics
