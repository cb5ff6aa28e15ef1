/*
 * synext - Syntax extension expansion core
 *
 * diagnostics/handler.hpp
 * - User-facing diagnostic sink
 *
 * Every diagnostic goes through `Handler::emit_diagnostic`, which keeps the
 * error count and forwards to the active emitter.
 */
#pragma once

#include <string>
#include <vector>
#include <memory>
#include "../common.hpp"
#include <span.hpp>

namespace Diagnostics {

enum class Level
{
    Bug,
    Fatal,
    Error,
    Warning,
    Note,
    Help,
};
extern const char* Level_name(Level l);
extern ::std::ostream& operator<<(::std::ostream& os, const Level& x);

struct SubDiagnostic
{
    Level   level;
    Span    span;   // Dummy for an unspanned note
    ::std::string   message;
};

struct Diagnostic
{
    Level   level;
    /// Stable error code (e.g. `E0001`), empty if none
    ::std::string   code;
    Span    span;
    ::std::string   message;
    ::std::vector<SubDiagnostic>    children;

    Diagnostic(Level level, Span sp, ::std::string message):
        level(level),
        span(mv$(sp)),
        message(mv$(message))
    {}

    bool is_error() const {
        return level == Level::Bug || level == Level::Fatal || level == Level::Error;
    }

    friend ::std::ostream& operator<<(::std::ostream& os, const Diagnostic& x);
};

/// Output side of the handler
class Emitter
{
public:
    virtual ~Emitter();
    virtual void emit(const Diagnostic& d) = 0;
};
/// Prints `<span> error: message` lines to stderr
class StderrEmitter:
    public Emitter
{
public:
    void emit(const Diagnostic& d) override;
};

class Handler;

/// A diagnostic under construction, emitted on `emit()` (or on destruction)
class DiagnosticBuilder
{
    Handler*    m_handler;
    Diagnostic  m_diag;
    bool    m_done;
public:
    DiagnosticBuilder(Handler& handler, Diagnostic diag):
        m_handler(&handler),
        m_diag(mv$(diag)),
        m_done(false)
    {}
    DiagnosticBuilder(DiagnosticBuilder&& x):
        m_handler(x.m_handler),
        m_diag(mv$(x.m_diag)),
        m_done(x.m_done)
    {
        x.m_done = true;
    }
    DiagnosticBuilder(const DiagnosticBuilder&) = delete;
    DiagnosticBuilder& operator=(const DiagnosticBuilder&) = delete;
    DiagnosticBuilder& operator=(DiagnosticBuilder&&) = delete;
    ~DiagnosticBuilder();

    DiagnosticBuilder& code(::std::string code) { m_diag.code = mv$(code); return *this; }
    DiagnosticBuilder& span_note(Span sp, ::std::string msg) {
        m_diag.children.push_back(SubDiagnostic { Level::Note, mv$(sp), mv$(msg) });
        return *this;
    }
    DiagnosticBuilder& note(::std::string msg) { return span_note(Span(), mv$(msg)); }
    DiagnosticBuilder& help(::std::string msg) {
        m_diag.children.push_back(SubDiagnostic { Level::Help, Span(), mv$(msg) });
        return *this;
    }

    const Diagnostic& diag() const { return m_diag; }

    void emit();
    /// Drop the diagnostic without emitting it
    void cancel() { m_done = true; }
    bool is_cancelled() const { return m_done; }
};

class Handler
{
    ::std::unique_ptr<Emitter>  m_emitter;
    unsigned int    m_err_count;
    unsigned int    m_warn_count;
public:
    Handler();
    Handler(::std::unique_ptr<Emitter> emitter);

    void set_emitter(::std::unique_ptr<Emitter> emitter) { m_emitter = mv$(emitter); }

    /// The single emission point (counts errors, then forwards to the emitter)
    void emit_diagnostic(const Diagnostic& d);

    DiagnosticBuilder struct_span_warn(Span sp, ::std::string msg);
    DiagnosticBuilder struct_span_err(Span sp, ::std::string msg);
    DiagnosticBuilder struct_span_err_with_code(Span sp, ::std::string msg, ::std::string code);
    DiagnosticBuilder struct_span_fatal(Span sp, ::std::string msg);
    DiagnosticBuilder struct_span_note(Span sp, ::std::string msg);

    void span_warn(Span sp, ::std::string msg);
    void span_err(Span sp, ::std::string msg);
    void span_err_with_code(Span sp, ::std::string msg, ::std::string code);
    void span_note(Span sp, ::std::string msg);
    void note(::std::string msg);

    /// Emit a fatal error and unwind (throws `CompileError::Fatal`)
    void span_fatal(Span sp, ::std::string msg);
    /// Internal error (throws `CompileError::BugCheck`)
    void span_bug(Span sp, ::std::string msg);
    void bug(::std::string msg);
    /// Unimplemented functionality (throws `CompileError::Todo`)
    void span_unimpl(Span sp, ::std::string msg);

    unsigned int err_count() const { return m_err_count; }
    unsigned int warn_count() const { return m_warn_count; }
    bool has_errors() const { return m_err_count > 0; }
    /// Throws `CompileError::Fatal` if any error has been emitted
    void abort_if_errors() const;
};

}   // namespace Diagnostics
