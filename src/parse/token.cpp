/*
 * synext - Syntax extension expansion core
 *
 * parse/token.cpp
 * - Lexical tokens
 */
#include "token.hpp"
#include <common.hpp>
#include <cstring>

Token::Token():
    m_type(TOK_NULL),
    m_data( Data::make_None({}) )
{
}
Token::Token(enum eTokenType type, Span sp):
    m_type(type),
    m_data( Data::make_None({}) ),
    m_span( mv$(sp) )
{
}
Token::Token(enum eTokenType type, ::std::string str, Span sp):
    m_type(type),
    m_data( Data::make_String(mv$(str)) ),
    m_span( mv$(sp) )
{
}
Token::Token(uint64_t val, enum eCoreType datatype, Span sp):
    m_type(TOK_INTEGER),
    m_data( Data::make_Integer({datatype, val}) ),
    m_span( mv$(sp) )
{
}
Token Token::make_ident(RcString name, Span sp)
{
    Token   rv(TOK_IDENT, mv$(sp));
    rv.m_data = Data::make_Ident(mv$(name));
    return rv;
}
Token Token::make_char(uint32_t codepoint, Span sp)
{
    Token   rv(codepoint, CORETYPE_CHAR, mv$(sp));
    rv.m_type = TOK_CHAR;
    return rv;
}
Token::Token(const Token& t):
    m_type(t.m_type),
    m_data( Data::make_None({}) ),
    m_span( t.m_span )
{
    assert( t.m_data.tag() != Data::TAGDEAD );
    TU_MATCH_HDRA( (t.m_data), {)
    TU_ARMA(None, e) {
        }
    TU_ARMA(String, e) {
        m_data = Data::make_String(e);
        }
    TU_ARMA(Ident, e) {
        m_data = Data::make_Ident(e);
        }
    TU_ARMA(Integer, e) {
        m_data = Data::make_Integer(e);
        }
    }
}

bool Token::operator==(const Token& r) const
{
    if(type() != r.type())
        return false;
    TU_MATCH_HDRA( (m_data), {)
    TU_ARMA(None, e) {
        return true;
        }
    TU_ARMA(String, e) {
        return e == r.m_data.as_String();
        }
    TU_ARMA(Ident, e) {
        return e == r.m_data.as_Ident();
        }
    TU_ARMA(Integer, e) {
        const auto& re = r.m_data.as_Integer();
        return e.m_datatype == re.m_datatype && e.m_intval == re.m_intval;
        }
    }
    return false;
}

namespace {
    void escape_char(::std::ostream& os, uint32_t c, char quote)
    {
        switch(c)
        {
        case '\n':  os << "\\n";    break;
        case '\r':  os << "\\r";    break;
        case '\t':  os << "\\t";    break;
        case '\\':  os << "\\\\";   break;
        case '\0':  os << "\\0";    break;
        default:
            if( c == static_cast<uint32_t>(quote) )
                os << "\\" << quote;
            else if( c < 0x20 || c == 0x7F )
                os << "\\u{" << ::std::hex << c << ::std::dec << "}";
            else if( c < 0x80 )
                os << static_cast<char>(c);
            else
                os << "\\u{" << ::std::hex << c << ::std::dec << "}";
            break;
        }
    }
}

::std::string Token::to_str() const
{
    switch(m_type)
    {
    case TOK_NULL:  return "/*null*/";
    case TOK_EOF:   return "/*eof*/";

    case TOK_IDENT:     return m_data.as_Ident().c_str();
    case TOK_LIFETIME:  return FMT("'" << m_data.as_String());
    case TOK_INTEGER:
        return FMT(m_data.as_Integer().m_intval << coretype_name(m_data.as_Integer().m_datatype));
    case TOK_CHAR:
        return FMT("'" << FMT_CB(os, escape_char(os, static_cast<uint32_t>(m_data.as_Integer().m_intval), '\'')) << "'");
    case TOK_STRING:
        return FMT("\"" << FMT_CB(os,
            for(unsigned char c : m_data.as_String())
                escape_char(os, c, '"');
            ) << "\"");

    case TOK_HASH:  return "#";
    case TOK_EXCLAM:    return "!";
    case TOK_DOLLAR:    return "$";
    case TOK_UNDERSCORE:return "_";
    case TOK_AT:    return "@";
    case TOK_QMARK: return "?";

    case TOK_PAREN_OPEN:    return "(";
    case TOK_PAREN_CLOSE:   return ")";
    case TOK_BRACE_OPEN:    return "{";
    case TOK_BRACE_CLOSE:   return "}";
    case TOK_SQUARE_OPEN:   return "[";
    case TOK_SQUARE_CLOSE:  return "]";

    case TOK_COMMA:     return ",";
    case TOK_SEMICOLON: return ";";
    case TOK_COLON:     return ":";
    case TOK_DOUBLE_COLON:  return "::";
    case TOK_DOT:   return ".";
    case TOK_DOUBLE_DOT:    return "..";
    case TOK_EQUAL: return "=";
    case TOK_DOUBLE_EQUAL:  return "==";
    case TOK_EXCLAM_EQUAL:  return "!=";
    case TOK_LT:    return "<";
    case TOK_GT:    return ">";
    case TOK_LTE:   return "<=";
    case TOK_GTE:   return ">=";
    case TOK_RARROW:    return "->";
    case TOK_FATARROW:  return "=>";
    case TOK_PLUS:  return "+";
    case TOK_DASH:  return "-";
    case TOK_STAR:  return "*";
    case TOK_SLASH: return "/";
    case TOK_PERCENT:   return "%";
    case TOK_AMP:   return "&";
    case TOK_DOUBLE_AMP:    return "&&";
    case TOK_PIPE:  return "|";
    case TOK_DOUBLE_PIPE:   return "||";
    case TOK_CARET: return "^";
    case TOK_TILDE: return "~";

    case TOK_RWORD_TRUE:    return "true";
    case TOK_RWORD_FALSE:   return "false";
    case TOK_RWORD_PUB:     return "pub";
    case TOK_RWORD_STRUCT:  return "struct";
    case TOK_RWORD_ENUM:    return "enum";
    case TOK_RWORD_IMPL:    return "impl";
    case TOK_RWORD_TRAIT:   return "trait";
    case TOK_RWORD_FOR:     return "for";
    case TOK_RWORD_STATIC:  return "static";
    case TOK_RWORD_CONST:   return "const";
    case TOK_RWORD_MUT:     return "mut";
    case TOK_RWORD_TYPE:    return "type";
    case TOK_RWORD_LET:     return "let";
    case TOK_RWORD_CRATE:   return "crate";
    case TOK_RWORD_SELF:    return "self";
    case TOK_RWORD_SUPER:   return "super";
    case TOK_RWORD_FN:      return "fn";
    case TOK_RWORD_MOD:     return "mod";
    case TOK_RWORD_USE:     return "use";
    case TOK_RWORD_EXTERN:  return "extern";
    }
    return "/*?*/";
}

const char* Token::typestr(enum eTokenType type)
{
    switch(type)
    {
    case TOK_NULL:  return "TOK_NULL";
    case TOK_EOF:   return "TOK_EOF";
    case TOK_IDENT: return "TOK_IDENT";
    case TOK_LIFETIME:  return "TOK_LIFETIME";
    case TOK_INTEGER:   return "TOK_INTEGER";
    case TOK_CHAR:  return "TOK_CHAR";
    case TOK_STRING:    return "TOK_STRING";
    default:
        // Punctuation and keywords are described by their text
        return nullptr;
    }
}

eTokenType Token::keyword_from_str(const ::std::string& s)
{
    static const struct { const char* name; eTokenType ty; } KEYWORDS[] = {
        { "true",   TOK_RWORD_TRUE },
        { "false",  TOK_RWORD_FALSE },
        { "pub",    TOK_RWORD_PUB },
        { "struct", TOK_RWORD_STRUCT },
        { "enum",   TOK_RWORD_ENUM },
        { "impl",   TOK_RWORD_IMPL },
        { "trait",  TOK_RWORD_TRAIT },
        { "for",    TOK_RWORD_FOR },
        { "static", TOK_RWORD_STATIC },
        { "const",  TOK_RWORD_CONST },
        { "mut",    TOK_RWORD_MUT },
        { "type",   TOK_RWORD_TYPE },
        { "let",    TOK_RWORD_LET },
        { "crate",  TOK_RWORD_CRATE },
        { "self",   TOK_RWORD_SELF },
        { "super",  TOK_RWORD_SUPER },
        { "fn",     TOK_RWORD_FN },
        { "mod",    TOK_RWORD_MOD },
        { "use",    TOK_RWORD_USE },
        { "extern", TOK_RWORD_EXTERN },
        };
    for(const auto& kw : KEYWORDS)
    {
        if( s == kw.name )
            return kw.ty;
    }
    return TOK_IDENT;
}

::std::ostream&  operator<<(::std::ostream& os, const Token& tok)
{
    switch(tok.type())
    {
    case TOK_NULL:
    case TOK_EOF:
        os << Token::typestr(tok.type());
        break;
    default:
        os << "`" << tok.to_str() << "`";
        break;
    }
    return os;
}
