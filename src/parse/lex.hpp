/*
 * synext - Syntax extension expansion core
 *
 * parse/lex.hpp
 * - Lexer header
 */
#ifndef LEX_HPP_INCLUDED
#define LEX_HPP_INCLUDED

#include <string>
#include "tokenstream.hpp"

class TokenTree;

struct Codepoint {
    uint32_t    v;
    Codepoint(): v(0) { }
    Codepoint(uint32_t v): v(v) { }
    bool isspace() const;
    bool isdigit() const;
    bool isxdigit() const;
    bool operator==(char x) { return v == static_cast<uint32_t>(x); }
    bool operator!=(char x) { return v != static_cast<uint32_t>(x); }
    bool operator==(Codepoint x) { return v == x.v; }
    bool operator!=(Codepoint x) { return v != x.v; }
};
extern ::std::string& operator+=(::std::string& s, const Codepoint& cp);

/// Lexer over an in-memory source string
///
/// Lines are 1-based, columns 0-based.
class Lexer:
    public TokenStream
{
    RcString    m_path;
    Span    m_parent;
    ::std::string   m_src;
    size_t  m_pos;
    ::std::vector<size_t>   m_line_starts;

    size_t  m_tok_start;
public:
    Lexer(::std::string source, RcString filename, Span parent=Span());

protected:
    Span outerSpan() const override { return m_parent; }
    Token realGetToken() override;

private:
    Token getTokenInt();

    signed int getSymbol();
    Token getTokenInt_RawString();
    Token getTokenInt_Identifier(Codepoint ch);
    Token getTokenInt_Number(Codepoint ch);
    uint32_t parseEscape(char enclosing);
    void skipBlockComment();

    /// Span from the start of the current token to the current position
    Span cur_span() const;
    void get_linecol(size_t pos, unsigned int& line, unsigned int& col) const;

    bool at_eof() const { return m_pos > m_src.size(); }
    void ungetc();
    Codepoint getc();
    Codepoint getc_cp();
};

/// Lex source text into an undelimited token tree
extern TokenTree Lex_TokenTree(::std::string source, RcString filename, Span parent=Span());

#endif // LEX_HPP_INCLUDED
