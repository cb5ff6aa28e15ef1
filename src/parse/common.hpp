/*
 * synext - Syntax extension expansion core
 *
 * parse/common.hpp
 * - Common definitions used by the parser
 *
 * The parser covers the subset of the language that macro inputs and outputs
 * are built from (literals, simple paths, tuples, arrays, borrows, ADT
 * definitions, statics, impl/trait/mod/extern blocks and macro calls).
 */
#ifndef PARSE_COMMON_HPP_INCLUDED
#define PARSE_COMMON_HPP_INCLUDED
#include <iostream>
#include "../ast/ast.hpp"
#include "../ast/fragment.hpp"
#include "tokenstream.hpp"
#include "parseerror.hpp"

#define GET_TOK(tok, lex) ((tok = lex.getToken()).type())
#define PUTBACK(tok, lex) lex.putback( ::std::move(tok) )
#define LOOK_AHEAD(lex) (lex.lookahead(0))
#define GET_CHECK_TOK(tok, lex, exp) do {\
    if((tok = lex.getToken()).type() != exp) { \
        DEBUG("GET_CHECK_TOK " << __FILE__ << ":" << __LINE__); \
        throw ParseError::Unexpected(lex, tok, Token(exp));\
    }\
} while(0)
#define CHECK_TOK(tok, exp) do {\
    if(tok.type() != exp) { \
        DEBUG("CHECK_TOK " << __FILE__ << ":" << __LINE__); \
        throw ParseError::Unexpected(lex, tok, Token(exp));\
    } \
} while(0)

// --- root.cpp
/// Parse a single token tree (a token, or a delimited group)
extern TokenTree Parse_TT(TokenStream& lex, bool unwrapped);
/// Parse token trees until EOF, returning them as an undelimited group
extern TokenTree Parse_TokenStream(TokenStream& lex);
extern AST::MetaItem Parse_MetaItem(TokenStream& lex);
/// Comma separated meta items, up to (but not including) `close`
extern ::std::vector<AST::MetaItem> Parse_MetaItemList(TokenStream& lex, eTokenType close);
/// `#[name ...]`
extern AST::Attribute Parse_Attribute(TokenStream& lex);
extern AST::AttributeList Parse_ItemAttrs(TokenStream& lex);
extern AST::Item Parse_Item(TokenStream& lex);
/// Parse an item whose outer attributes have already been read
extern AST::Item Parse_Item(TokenStream& lex, AST::AttributeList attrs);
extern AST::ImplItem Parse_ImplItem(TokenStream& lex);
extern AST::TraitItem Parse_TraitItem(TokenStream& lex);
extern AST::ForeignItem Parse_ForeignItem(TokenStream& lex);
/// Parse the entire stream as a fragment of the given kind
extern AST::AstFragment Parse_AstFragment(TokenStream& lex, AST::AstFragmentKind kind);

// --- paths.cpp
extern AST::Path Parse_Path(TokenStream& lex);
/// Parse the delimited input of a macro invocation (after the `!`)
extern AST::MacroInvocation Parse_MacroInvocation(Span start, AST::Path path, TokenStream& lex);
extern bool Parse_IsPathStart(eTokenType tok_type);

// --- types.cpp
extern TypeRef Parse_Type(TokenStream& lex);

// --- pattern.cpp
extern AST::Pattern Parse_Pattern(TokenStream& lex);

// --- expr.cpp
extern AST::ExprNodeP Parse_Expr(TokenStream& lex);
/// Parse a literal token into an expression node
extern AST::ExprNodeP Parse_ExprLiteral(Token tok);
extern bool Parse_IsTokValue(eTokenType tok_type);
/// A statement (`None` at the end of the input)
extern rust::option<AST::Stmt> Parse_Stmt(TokenStream& lex);

#endif // PARSE_COMMON_HPP_INCLUDED
