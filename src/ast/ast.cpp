/*
 * synext - Syntax extension expansion core
 *
 * ast/ast.cpp
 * - Item, statement and macro invocation helpers
 */
#include "ast.hpp"
#include <parse/token.hpp>

namespace AST {

namespace {
    void print_attrs(::std::ostream& os, const AttributeList& attrs)
    {
        for(const auto& a : attrs.m_items)
            os << a << "\n";
    }
    void print_fields(::std::ostream& os, StructKind kind, const ::std::vector<StructField>& fields)
    {
        switch(kind)
        {
        case StructKind::Unit:
            break;
        case StructKind::Tuple:
            os << "(";
            for(const auto& f : fields)
            {
                os << f.attrs;
                if( f.is_pub )
                    os << "pub ";
                os << f.ty << ", ";
            }
            os << ")";
            break;
        case StructKind::Named:
            os << " {\n";
            for(const auto& f : fields)
            {
                print_attrs(os, f.attrs);
                if( f.is_pub )
                    os << "pub ";
                os << f.name << ": " << f.ty << ",\n";
            }
            os << "}";
            break;
        }
    }
    ::std::vector<StructField> clone_fields(const ::std::vector<StructField>& fields)
    {
        ::std::vector<StructField>  rv;
        rv.reserve(fields.size());
        for(const auto& f : fields)
            rv.push_back( f.clone() );
        return rv;
    }
    template<typename T>
    ::std::vector<T> clone_list(const ::std::vector<T>& items)
    {
        ::std::vector<T>    rv;
        rv.reserve(items.size());
        for(const auto& i : items)
            rv.push_back( i.clone() );
        return rv;
    }
    void print_macro_item(::std::ostream& os, const MacroInvocation& inv)
    {
        os << inv;
        if( inv.delim() != MacDelimiter::Brace )
            os << ";";
    }
}

// --- MacroInvocation ---
MacroInvocation MacroInvocation::clone() const
{
    MacroInvocation rv(m_span, m_macro_path, m_input.clone(), m_delim);
    rv.m_placeholder_id = m_placeholder_id;
    return rv;
}
TokenTree MacroInvocation::to_tokens() const
{
    ASSERT_BUG(m_span, !is_placeholder(), "to_tokens on macro placeholder " << m_placeholder_id);
    ::std::vector<TokenTree>    toks;
    const auto& path_sp = m_macro_path.span() ? m_macro_path.span() : m_span;
    if( m_macro_path.is_global() )
        toks.push_back( Token(TOK_DOUBLE_COLON, path_sp) );
    bool first = true;
    for(const auto& seg : m_macro_path.segments())
    {
        if( !first )
            toks.push_back( Token(TOK_DOUBLE_COLON, path_sp) );
        first = false;
        if( seg.is_dollar_crate() ) {
            toks.push_back( Token(TOK_DOLLAR, seg.span) );
            toks.push_back( Token(TOK_RWORD_CRATE, seg.span) );
        }
        else {
            toks.push_back( Token::make_ident(seg.name, seg.span) );
        }
    }
    toks.push_back( Token(TOK_EXCLAM, m_span) );

    eTokenType  open = TOK_PAREN_OPEN, close = TOK_PAREN_CLOSE;
    switch(m_delim)
    {
    case MacDelimiter::Parenthesis: break;
    case MacDelimiter::Bracket: open = TOK_SQUARE_OPEN; close = TOK_SQUARE_CLOSE; break;
    case MacDelimiter::Brace:   open = TOK_BRACE_OPEN;  close = TOK_BRACE_CLOSE;  break;
    }
    ::std::vector<TokenTree>    group;
    group.push_back( Token(open, m_span) );
    if( m_input.is_token() )
    {
        group.push_back( m_input.clone() );
    }
    else
    {
        for(const auto& tt : m_input.subtrees())
            group.push_back( tt.clone() );
    }
    group.push_back( Token(close, m_span) );
    toks.push_back( TokenTree(mv$(group)) );
    return TokenTree(mv$(toks));
}
::std::ostream& operator<<(::std::ostream& os, const MacroInvocation& x)
{
    if( x.is_placeholder() )
        return os << "/* placeholder " << x.m_placeholder_id << " */";
    os << x.m_macro_path << "!";
    switch(x.m_delim)
    {
    case MacDelimiter::Parenthesis: os << "(" << x.m_input.to_source() << ")";  break;
    case MacDelimiter::Bracket:     os << "[" << x.m_input.to_source() << "]";  break;
    case MacDelimiter::Brace:       os << "{ " << x.m_input.to_source() << " }";  break;
    }
    return os;
}

// --- Fields / variants ---
StructField StructField::clone() const
{
    return StructField { attrs.clone(), is_pub, name, ty.clone() };
}
EnumVariant EnumVariant::clone() const
{
    return EnumVariant { attrs.clone(), name, kind, clone_fields(fields) };
}

// --- Associated items ---
AssocItem AssocItem::clone_inner() const
{
    Data    new_data;
    TU_MATCH_HDRA( (data), {)
    TU_ARMA(None, e) {
        }
    TU_ARMA(Const, e) {
        new_data = Data::make_Const({ e.type.clone(), e.value ? e.value->clone() : ExprNodeP() });
        }
    TU_ARMA(Static, e) {
        new_data = Data::make_Static({ e.is_mut, e.type.clone() });
        }
    TU_ARMA(Type, e) {
        new_data = Data::make_Type({ e.type ? box$(e.type->clone()) : ::std::unique_ptr<TypeRef>() });
        }
    TU_ARMA(Macro, e) {
        new_data = Data::make_Macro( e.clone() );
        }
    }
    AssocItem   rv(span, attrs.clone(), is_pub, name, mv$(new_data));
    rv.id = id;
    return rv;
}
void AssocItem::print(::std::ostream& os) const
{
    print_attrs(os, attrs);
    if( is_pub )
        os << "pub ";
    TU_MATCH_HDRA( (data), {)
    TU_ARMA(None, e) {
        }
    TU_ARMA(Const, e) {
        os << "const " << name << ": " << e.type;
        if( e.value )
            os << " = " << *e.value;
        os << ";";
        }
    TU_ARMA(Static, e) {
        os << "static ";
        if( e.is_mut )
            os << "mut ";
        os << name << ": " << e.type << ";";
        }
    TU_ARMA(Type, e) {
        os << "type " << name;
        if( e.type )
            os << " = " << *e.type;
        os << ";";
        }
    TU_ARMA(Macro, e) {
        print_macro_item(os, e);
        }
    }
}
::std::ostream& operator<<(::std::ostream& os, const AssocItem& x)
{
    x.print(os);
    return os;
}

// --- Items ---
Item Item::clone() const
{
    Data    new_data;
    TU_MATCH_HDRA( (data), {)
    TU_ARMA(None, e) {
        }
    TU_ARMA(MacroInv, e) {
        new_data = Data::make_MacroInv( e.clone() );
        }
    TU_ARMA(Struct, e) {
        new_data = Data::make_Struct({ e.kind, clone_fields(e.fields) });
        }
    TU_ARMA(Enum, e) {
        new_data = Data::make_Enum({ clone_list(e.variants) });
        }
    TU_ARMA(Union, e) {
        new_data = Data::make_Union({ clone_fields(e.fields) });
        }
    TU_ARMA(Static, e) {
        new_data = Data::make_Static({ e.cls, e.type.clone(), e.value ? e.value->clone() : ExprNodeP() });
        }
    TU_ARMA(Impl, e) {
        new_data = Data::make_Impl({ e.trait_path, e.self_ty.clone(), clone_list(e.items) });
        }
    TU_ARMA(Trait, e) {
        new_data = Data::make_Trait({ clone_list(e.items) });
        }
    TU_ARMA(Mod, e) {
        new_data = Data::make_Mod({ clone_list(e.items) });
        }
    TU_ARMA(ForeignMod, e) {
        new_data = Data::make_ForeignMod({ clone_list(e.items) });
        }
    }
    Item    rv(span, attrs.clone(), is_pub, name, mv$(new_data));
    rv.id = id;
    return rv;
}
const char* Item::tag_descr() const
{
    switch(data.tag())
    {
    case Data::TAGDEAD:     break;
    case Data::TAG_None:    return "nothing";
    case Data::TAG_MacroInv:return "macro invocation";
    case Data::TAG_Struct:  return "struct";
    case Data::TAG_Enum:    return "enum";
    case Data::TAG_Union:   return "union";
    case Data::TAG_Static:  return data.as_Static().cls == StaticClass::Const ? "constant" : "static";
    case Data::TAG_Impl:    return "impl";
    case Data::TAG_Trait:   return "trait";
    case Data::TAG_Mod:     return "module";
    case Data::TAG_ForeignMod:  return "foreign module";
    }
    BUG(span, "Bad item tag");
}
::std::ostream& operator<<(::std::ostream& os, const Item& x)
{
    print_attrs(os, x.attrs);
    if( x.is_pub )
        os << "pub ";
    TU_MATCH_HDRA( (x.data), {)
    TU_ARMA(None, e) {
        }
    TU_ARMA(MacroInv, e) {
        print_macro_item(os, e);
        }
    TU_ARMA(Struct, e) {
        os << "struct " << x.name;
        print_fields(os, e.kind, e.fields);
        if( e.kind != StructKind::Named )
            os << ";";
        }
    TU_ARMA(Enum, e) {
        os << "enum " << x.name << " {\n";
        for(const auto& v : e.variants)
        {
            print_attrs(os, v.attrs);
            os << v.name;
            print_fields(os, v.kind, v.fields);
            os << ",\n";
        }
        os << "}";
        }
    TU_ARMA(Union, e) {
        os << "union " << x.name;
        print_fields(os, StructKind::Named, e.fields);
        }
    TU_ARMA(Static, e) {
        switch(e.cls)
        {
        case StaticClass::Const:    os << "const ";  break;
        case StaticClass::Static:   os << "static ";  break;
        case StaticClass::MutStatic:os << "static mut ";  break;
        }
        os << x.name << ": " << e.type;
        if( e.value )
            os << " = " << *e.value;
        os << ";";
        }
    TU_ARMA(Impl, e) {
        os << "impl ";
        if( e.trait_path.is_some() )
            os << e.trait_path.unwrap() << " for ";
        os << e.self_ty << " {\n";
        for(const auto& i : e.items)
            os << i << "\n";
        os << "}";
        }
    TU_ARMA(Trait, e) {
        os << "trait " << x.name << " {\n";
        for(const auto& i : e.items)
            os << i << "\n";
        os << "}";
        }
    TU_ARMA(Mod, e) {
        os << "mod " << x.name << " {\n";
        for(const auto& i : e.items)
            os << i << "\n";
        os << "}";
        }
    TU_ARMA(ForeignMod, e) {
        os << "extern {\n";
        for(const auto& i : e.items)
            os << i << "\n";
        os << "}";
        }
    }
    return os;
}

// --- Statements ---
Stmt Stmt::clone() const
{
    Data    new_data;
    TU_MATCH_HDRA( (data), {)
    TU_ARMA(Empty, e) {
        }
    TU_ARMA(Expr, e) {
        new_data = Data::make_Expr( e->clone() );
        }
    TU_ARMA(Semi, e) {
        new_data = Data::make_Semi({ e.expr->clone() });
        }
    TU_ARMA(Item, e) {
        new_data = Data::make_Item( box$(e->clone()) );
        }
    TU_ARMA(Local, e) {
        new_data = Data::make_Local({
            e.pat.clone(),
            e.ty ? box$(e.ty->clone()) : ::std::unique_ptr<TypeRef>(),
            e.init ? e.init->clone() : ExprNodeP()
            });
        }
    TU_ARMA(Macro, e) {
        new_data = Data::make_Macro({ e.inv.clone(), e.style });
        }
    }
    Stmt    rv(span, mv$(new_data));
    rv.attrs = attrs.clone();
    rv.id = id;
    return rv;
}
::std::ostream& operator<<(::std::ostream& os, const Stmt& x)
{
    print_attrs(os, x.attrs);
    TU_MATCH_HDRA( (x.data), {)
    TU_ARMA(Empty, e) {
        os << ";";
        }
    TU_ARMA(Expr, e) {
        os << *e;
        }
    TU_ARMA(Semi, e) {
        os << *e.expr << ";";
        }
    TU_ARMA(Item, e) {
        os << *e;
        }
    TU_ARMA(Local, e) {
        os << "let " << e.pat;
        if( e.ty )
            os << ": " << *e.ty;
        if( e.init )
            os << " = " << *e.init;
        os << ";";
        }
    TU_ARMA(Macro, e) {
        os << e.inv;
        if( e.style == MacStmtStyle::Semicolon )
            os << ";";
        }
    }
    return os;
}

}   // namespace AST
