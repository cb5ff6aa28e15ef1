/*
 * synext - Syntax extension expansion core
 *
 * parse/token.hpp
 * - Lexical tokens
 */
#pragma once

#include <rc_string.hpp>
#include <tagged_union.hpp>
#include <span.hpp>
#include <cstdint>
#include "../coretypes.hpp"

enum eTokenType
{
    TOK_NULL,
    TOK_EOF,

    TOK_IDENT,
    TOK_LIFETIME,
    TOK_INTEGER,
    TOK_CHAR,
    TOK_STRING,

    TOK_HASH,
    TOK_EXCLAM,
    TOK_DOLLAR,
    TOK_UNDERSCORE,
    TOK_AT,
    TOK_QMARK,

    TOK_PAREN_OPEN, TOK_PAREN_CLOSE,
    TOK_BRACE_OPEN, TOK_BRACE_CLOSE,
    TOK_SQUARE_OPEN, TOK_SQUARE_CLOSE,

    TOK_COMMA,
    TOK_SEMICOLON,
    TOK_COLON,
    TOK_DOUBLE_COLON,
    TOK_DOT,
    TOK_DOUBLE_DOT,
    TOK_EQUAL,
    TOK_DOUBLE_EQUAL,
    TOK_EXCLAM_EQUAL,
    TOK_LT, TOK_GT,
    TOK_LTE, TOK_GTE,
    TOK_RARROW,
    TOK_FATARROW,
    TOK_PLUS, TOK_DASH, TOK_STAR, TOK_SLASH, TOK_PERCENT,
    TOK_AMP, TOK_DOUBLE_AMP,
    TOK_PIPE, TOK_DOUBLE_PIPE,
    TOK_CARET,
    TOK_TILDE,

    TOK_RWORD_TRUE,
    TOK_RWORD_FALSE,
    TOK_RWORD_PUB,
    TOK_RWORD_STRUCT,
    TOK_RWORD_ENUM,
    TOK_RWORD_IMPL,
    TOK_RWORD_TRAIT,
    TOK_RWORD_FOR,
    TOK_RWORD_STATIC,
    TOK_RWORD_CONST,
    TOK_RWORD_MUT,
    TOK_RWORD_TYPE,
    TOK_RWORD_LET,
    TOK_RWORD_CRATE,
    TOK_RWORD_SELF,
    TOK_RWORD_SUPER,
    TOK_RWORD_FN,
    TOK_RWORD_MOD,
    TOK_RWORD_USE,
    TOK_RWORD_EXTERN,
};

class Token
{
    TAGGED_UNION(Data, None,
    (None, struct {}),
    (String, ::std::string),
    (Ident, RcString),
    (Integer, struct {
        enum eCoreType  m_datatype;
        uint64_t    m_intval;
        })
    );

    enum eTokenType m_type;
    Data    m_data;
    Span    m_span;
public:
    Token();
    Token& operator=(Token&& t)
    {
        m_type = t.m_type;  t.m_type = TOK_NULL;
        m_data = ::std::move(t.m_data);
        m_span = ::std::move(t.m_span);
        return *this;
    }
    Token(Token&& t):
        m_type(t.m_type),
        m_data( ::std::move(t.m_data) ),
        m_span( ::std::move(t.m_span) )
    {
        t.m_type = TOK_NULL;
    }
    Token(const Token& t);
    Token& operator=(const Token& t)
    {
        if( &t != this )
            *this = Token(t);
        return *this;
    }

    Token(enum eTokenType type, Span sp=Span());
    Token(enum eTokenType type, ::std::string str, Span sp=Span());
    Token(uint64_t val, enum eCoreType datatype, Span sp=Span());
    static Token make_ident(RcString name, Span sp=Span());
    static Token make_char(uint32_t codepoint, Span sp=Span());

    enum eTokenType type() const { return m_type; }
    const ::std::string& str() const { return m_data.as_String(); }
    const RcString& ident() const { return m_data.as_Ident(); }
    enum eCoreType  datatype() const { return m_data.as_Integer().m_datatype; }
    uint64_t intval() const { return m_data.as_Integer().m_intval; }

    bool operator==(const Token& r) const;
    bool operator!=(const Token& r) const { return !(*this == r); }
    bool operator==(enum eTokenType type) const { return m_type == type; }
    bool operator!=(enum eTokenType type) const { return m_type != type; }

    /// Source text for this token
    ::std::string to_str() const;

    void set_span(Span sp) { m_span = ::std::move(sp); }
    const Span& span() const { return m_span; }

    static const char* typestr(enum eTokenType type);
    /// Keyword token for an identifier string (TOK_IDENT if not a keyword)
    static eTokenType keyword_from_str(const ::std::string& s);
};
extern ::std::ostream&  operator<<(::std::ostream& os, const Token& tok);
