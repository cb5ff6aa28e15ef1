/*
 * synext - Syntax extension expansion core
 *
 * parse/lex.cpp
 * - Lexer (converts source text to a token stream)
 */
#include "lex.hpp"
#include "tokentree.hpp"
#include "parseerror.hpp"
#include "common.hpp"
#include <common.hpp>
#include <algorithm>

#define LINECOMMENT -1
#define BLOCKCOMMENT -2
#define SINGLEQUOTE -3
#define DOUBLEQUOTE -4

#define TOKENT(str, sym)    {sizeof(str)-1, str, sym}
static const struct {
    unsigned char len;
    const char* chars;
    signed int type;
} TOKENMAP[] = {
  TOKENT("!" , TOK_EXCLAM),
  TOKENT("!=", TOK_EXCLAM_EQUAL),
  TOKENT("\"", DOUBLEQUOTE),
  TOKENT("#",  TOK_HASH),
  TOKENT("$",  TOK_DOLLAR),
  TOKENT("%" , TOK_PERCENT),
  TOKENT("&" , TOK_AMP),
  TOKENT("&&", TOK_DOUBLE_AMP),
  TOKENT("'" , SINGLEQUOTE),
  TOKENT("(" , TOK_PAREN_OPEN),
  TOKENT(")" , TOK_PAREN_CLOSE),
  TOKENT("*" , TOK_STAR),
  TOKENT("+" , TOK_PLUS),
  TOKENT("," , TOK_COMMA),
  TOKENT("-" , TOK_DASH),
  TOKENT("->", TOK_RARROW),
  TOKENT(".",  TOK_DOT),
  TOKENT("..", TOK_DOUBLE_DOT),
  TOKENT("/" , TOK_SLASH),
  TOKENT("/*", BLOCKCOMMENT),
  TOKENT("//", LINECOMMENT),
  TOKENT(":",  TOK_COLON),
  TOKENT("::", TOK_DOUBLE_COLON),
  TOKENT(";",  TOK_SEMICOLON),
  TOKENT("<",  TOK_LT),
  TOKENT("<=", TOK_LTE),
  TOKENT("=" , TOK_EQUAL),
  TOKENT("==", TOK_DOUBLE_EQUAL),
  TOKENT("=>", TOK_FATARROW),
  TOKENT(">",  TOK_GT),
  TOKENT(">=", TOK_GTE),
  TOKENT("?",  TOK_QMARK),
  TOKENT("@",  TOK_AT),
  TOKENT("[",  TOK_SQUARE_OPEN),
  TOKENT("]",  TOK_SQUARE_CLOSE),
  TOKENT("^",  TOK_CARET),
  TOKENT("{",  TOK_BRACE_OPEN),
  TOKENT("|",  TOK_PIPE),
  TOKENT("||", TOK_DOUBLE_PIPE),
  TOKENT("}",  TOK_BRACE_CLOSE),
  TOKENT("~",  TOK_TILDE),
};

namespace {
    bool issym(Codepoint ch)
    {
        if( ch.v == 0 )
            return false;
        if( ch.v < 128 && ::std::isalnum(static_cast<int>(ch.v)) )
            return true;
        if( ch == '_' )
            return true;
        if( ch.v >= 128 )
            return true;
        return false;
    }
}

bool Codepoint::isspace() const {
    return v == ' ' || v == '\t' || v == '\n' || v == '\r' || v == '\x0b' || v == '\x0c';
}
bool Codepoint::isdigit() const {
    return '0' <= v && v <= '9';
}
bool Codepoint::isxdigit() const {
    return isdigit() || ('a' <= v && v <= 'f') || ('A' <= v && v <= 'F');
}
::std::string& operator+=(::std::string& s, const Codepoint& cp)
{
    // UTF-8 encode
    if( cp.v < 0x80 ) {
        s += static_cast<char>(cp.v);
    }
    else if( cp.v < 0x800 ) {
        s += static_cast<char>(0xC0 | (cp.v >> 6));
        s += static_cast<char>(0x80 | (cp.v & 0x3F));
    }
    else if( cp.v < 0x10000 ) {
        s += static_cast<char>(0xE0 | (cp.v >> 12));
        s += static_cast<char>(0x80 | ((cp.v >> 6) & 0x3F));
        s += static_cast<char>(0x80 | (cp.v & 0x3F));
    }
    else {
        s += static_cast<char>(0xF0 | (cp.v >> 18));
        s += static_cast<char>(0x80 | ((cp.v >> 12) & 0x3F));
        s += static_cast<char>(0x80 | ((cp.v >> 6) & 0x3F));
        s += static_cast<char>(0x80 | (cp.v & 0x3F));
    }
    return s;
}

Lexer::Lexer(::std::string source, RcString filename, Span parent):
    m_path( mv$(filename) ),
    m_parent( mv$(parent) ),
    m_src( mv$(source) ),
    m_pos(0),
    m_tok_start(0)
{
    m_line_starts.push_back(0);
    for(size_t i = 0; i < m_src.size(); i ++)
    {
        if( m_src[i] == '\n' )
            m_line_starts.push_back(i+1);
    }
}

void Lexer::get_linecol(size_t pos, unsigned int& line, unsigned int& col) const
{
    pos = ::std::min(pos, m_src.size());
    auto it = ::std::upper_bound(m_line_starts.begin(), m_line_starts.end(), pos);
    assert(it != m_line_starts.begin());
    --it;
    line = static_cast<unsigned int>(it - m_line_starts.begin()) + 1;
    col = static_cast<unsigned int>(pos - *it);
}
Span Lexer::cur_span() const
{
    unsigned int sl, sc, el, ec;
    get_linecol(m_tok_start, sl, sc);
    get_linecol(m_pos, el, ec);
    return Span(m_parent, m_path, sl, sc, el, ec);
}

Codepoint Lexer::getc()
{
    if( m_pos >= m_src.size() ) {
        m_pos ++;
        return Codepoint(0);
    }
    return Codepoint(static_cast<unsigned char>(m_src[m_pos++]));
}
void Lexer::ungetc()
{
    assert(m_pos > 0);
    m_pos --;
}
Codepoint Lexer::getc_cp()
{
    auto ch = this->getc();
    if( ch.v < 0x80 )
        return ch;
    // Multi-byte UTF-8 sequence
    unsigned int extra;
    uint32_t    v;
    if( (ch.v & 0xE0) == 0xC0 ) {
        extra = 1;  v = ch.v & 0x1F;
    }
    else if( (ch.v & 0xF0) == 0xE0 ) {
        extra = 2;  v = ch.v & 0x0F;
    }
    else if( (ch.v & 0xF8) == 0xF0 ) {
        extra = 3;  v = ch.v & 0x07;
    }
    else {
        throw ParseError::BadChar(cur_span(), ch.v);
    }
    for(unsigned int i = 0; i < extra; i ++)
    {
        auto c = this->getc();
        if( (c.v & 0xC0) != 0x80 )
            throw ParseError::BadChar(cur_span(), c.v);
        v = (v << 6) | (c.v & 0x3F);
    }
    return Codepoint(v);
}

signed int Lexer::getSymbol()
{
    // Longest matching entry
    signed int  best = 0;
    unsigned int    best_len = 0;
    for(const auto& ent : TOKENMAP)
    {
        if( ent.len > best_len && m_src.compare(m_pos, ent.len, ent.chars) == 0 )
        {
            best = ent.type;
            best_len = ent.len;
        }
    }
    m_pos += best_len;
    return best;
}

Token Lexer::realGetToken()
{
    for(;;)
    {
        auto ch = this->getc();
        if( ch.isspace() )
            continue;
        this->ungetc();
        if( at_eof() || m_pos == m_src.size() ) {
            m_tok_start = m_src.size();
            return Token(TOK_EOF, cur_span());
        }

        m_tok_start = m_pos;
        auto sym = this->getSymbol();
        if( sym == LINECOMMENT ) {
            while( !at_eof() && (ch = this->getc()) != '\n' )
                ;
            continue;
        }
        if( sym == BLOCKCOMMENT ) {
            this->skipBlockComment();
            continue;
        }
        m_pos = m_tok_start;
        return this->getTokenInt();
    }
}

void Lexer::skipBlockComment()
{
    unsigned int    depth = 1;
    while( depth > 0 )
    {
        auto ch = this->getc();
        if( at_eof() )
            throw ParseError::Generic(cur_span(), "unterminated block comment");
        if( ch == '*' ) {
            if( this->getc() == '/' )
                depth --;
            else
                this->ungetc();
        }
        else if( ch == '/' ) {
            if( this->getc() == '*' )
                depth ++;
            else
                this->ungetc();
        }
    }
}

Token Lexer::getTokenInt()
{
    const signed int sym = this->getSymbol();
    if( sym > 0 )
    {
        return Token(static_cast<eTokenType>(sym), cur_span());
    }
    else if( sym == 0 )
    {
        auto ch = this->getc_cp();
        if( ch.isdigit() )
        {
            return this->getTokenInt_Number(ch);
        }
        else if( ch == 'r' && (m_src.compare(m_pos, 1, "\"") == 0 || m_src.compare(m_pos, 2, "#\"") == 0 || m_src.compare(m_pos, 2, "##") == 0) )
        {
            return this->getTokenInt_RawString();
        }
        else if( issym(ch) )
        {
            return this->getTokenInt_Identifier(ch);
        }
        else
        {
            throw ParseError::BadChar(cur_span(), ch.v);
        }
    }
    else
    {
        switch(sym)
        {
        case SINGLEQUOTE: {
            auto firstchar = this->getc_cp();
            if( at_eof() )
                throw ParseError::Generic(cur_span(), "unterminated character literal");
            if( firstchar == '\\' ) {
                // Character constant with an escape code
                uint32_t val = this->parseEscape('\'');
                if( this->getc() != '\'' )
                    throw ParseError::Generic(cur_span(), "character literal may only contain one codepoint");
                return Token::make_char(val, cur_span());
            }
            auto ch = this->getc();
            if( ch == '\'' ) {
                return Token::make_char(firstchar.v, cur_span());
            }
            else if( issym(firstchar) ) {
                // Lifetime name
                ::std::string   str;
                str += firstchar;
                while( issym(ch) )
                {
                    str += ch;
                    ch = this->getc();
                }
                this->ungetc();
                return Token(TOK_LIFETIME, mv$(str), cur_span());
            }
            else {
                throw ParseError::Generic(cur_span(), "character literal may only contain one codepoint");
            }
            }
        case DOUBLEQUOTE: {
            ::std::string str;
            for(;;)
            {
                auto ch = this->getc();
                if( at_eof() )
                    throw ParseError::Generic(cur_span(), "unterminated double quote string");
                if( ch == '"' )
                    break;
                if( ch == '\\' ) {
                    auto v = this->parseEscape('"');
                    if( v != ~0u )
                        str += Codepoint(v);
                }
                else {
                    str.push_back(static_cast<char>(ch.v));
                }
            }
            return Token(TOK_STRING, mv$(str), cur_span());
            }
        default:
            BUG(cur_span(), "Unhandled symbol class " << sym);
        }
    }
}

Token Lexer::getTokenInt_Number(Codepoint ch)
{
    enum eCoreType  num_type = CORETYPE_ANY;
    unsigned int    base = 10;
    uint64_t    val = 0;
    if( ch == '0' ) {
        ch = this->getc();
        if( ch == 'x' ) {
            base = 16;
            ch = this->getc();
        }
        else if( ch == 'o' ) {
            base = 8;
            ch = this->getc();
        }
        else if( ch == 'b' ) {
            base = 2;
            ch = this->getc();
        }
    }
    for(;; ch = this->getc())
    {
        if( ch == '_' )
            continue;
        unsigned int    digit;
        if( ch.isdigit() )
            digit = ch.v - '0';
        else if( base == 16 && 'a' <= ch.v && ch.v <= 'f' )
            digit = ch.v - 'a' + 10;
        else if( base == 16 && 'A' <= ch.v && ch.v <= 'F' )
            digit = ch.v - 'A' + 10;
        else
            break;
        if( digit >= base )
            throw ParseError::Generic(cur_span(), FMT("invalid digit for a base " << base << " literal"));
        val = val * base + digit;
    }

    if( issym(ch) )
    {
        ::std::string   suffix;
        while( issym(ch) )
        {
            suffix += ch;
            ch = this->getc();
        }
        this->ungetc();

        num_type = coretype_fromstring(suffix.c_str());
        if( num_type == CORETYPE_INVAL || num_type == CORETYPE_BOOL || num_type == CORETYPE_CHAR || num_type == CORETYPE_STR )
            throw ParseError::Generic(cur_span(), FMT("invalid suffix `" << suffix << "` for integer literal"));
    }
    else
    {
        this->ungetc();
    }
    return Token(val, num_type, cur_span());
}

Token Lexer::getTokenInt_RawString()
{
    // Leading `r` has been consumed
    unsigned int hashes = 0;
    auto ch = this->getc();
    while(ch == '#')
    {
        hashes ++;
        ch = this->getc();
    }
    if( ch != '"' )
        throw ParseError::Generic(cur_span(), "expected `\"` in raw string literal");

    ::std::string   val;
    for(;;)
    {
        ch = this->getc();
        if( at_eof() )
            throw ParseError::Generic(cur_span(), "unterminated raw string");
        if( ch == '"' )
        {
            unsigned int    n = 0;
            while( n < hashes && m_src.compare(m_pos, 1, "#") == 0 ) {
                m_pos ++;
                n ++;
            }
            if( n == hashes )
                break;
            val += '"';
            val.append(n, '#');
        }
        else
        {
            val.push_back(static_cast<char>(ch.v));
        }
    }
    return Token(TOK_STRING, mv$(val), cur_span());
}

Token Lexer::getTokenInt_Identifier(Codepoint leader)
{
    ::std::string   str;
    auto ch = leader;
    while( issym(ch) )
    {
        str += ch;
        ch = this->getc_cp();
    }
    this->ungetc();

    if( str == "_" )
        return Token(TOK_UNDERSCORE, cur_span());
    auto kw = Token::keyword_from_str(str);
    if( kw != TOK_IDENT )
        return Token(kw, cur_span());
    return Token::make_ident(RcString::new_interned(str), cur_span());
}

uint32_t Lexer::parseEscape(char enclosing)
{
    auto ch = this->getc();
    switch(ch.v)
    {
    case 'x': {
        uint32_t    val = 0;
        for(int i = 0; i < 2; i ++)
        {
            ch = this->getc();
            if( !ch.isxdigit() )
                throw ParseError::Generic(cur_span(), "invalid character in numeric character escape");
            val = val * 16 + (ch.isdigit() ? ch.v - '0' : (ch.v | 0x20) - 'a' + 10);
        }
        if( val > 0x7F )
            throw ParseError::Generic(cur_span(), "out of range hex escape");
        return val; }
    case 'u': {
        // Unicode (up to six hex digits)
        uint32_t    val = 0;
        if( this->getc() != '{' )
            throw ParseError::Generic(cur_span(), "incorrect unicode escape sequence");
        unsigned int    n = 0;
        while( (ch = this->getc()).isxdigit() || ch == '_' )
        {
            if( ch == '_' )
                continue;
            val = val * 16 + (ch.isdigit() ? ch.v - '0' : (ch.v | 0x20) - 'a' + 10);
            n ++;
        }
        if( ch != '}' || n == 0 || n > 6 )
            throw ParseError::Generic(cur_span(), "invalid unicode character escape");
        return val; }
    case '0':
        return '\0';
    case '\\':
        return '\\';
    case '\'':
        return '\'';
    case '"':
        return '"';
    case 'r':
        return '\r';
    case 'n':
        return '\n';
    case 't':
        return '\t';
    case '\n':
        // Line continuation (only valid in strings)
        if( enclosing != '"' )
            throw ParseError::Generic(cur_span(), "unknown character escape");
        while( (ch = this->getc()).isspace() )
            ;
        this->ungetc();
        return ~0u;
    default:
        throw ParseError::Generic(cur_span(), FMT("unknown character escape: `" << static_cast<char>(ch.v) << "`"));
    }
}

TokenTree Lex_TokenTree(::std::string source, RcString filename, Span parent)
{
    Lexer   lex( mv$(source), mv$(filename), mv$(parent) );
    return Parse_TokenStream(lex);
}
