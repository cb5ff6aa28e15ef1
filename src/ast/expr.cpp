/*
 * synext - Syntax extension expansion core
 *
 * ast/expr.cpp
 * - AST Expression nodes
 */
#include "expr.hpp"
#include <parse/token.hpp>

namespace AST {

ExprNodeP::~ExprNodeP()
{
    delete m_ptr;
}

::std::ostream& operator<<(::std::ostream& os, const ExprNode& node)
{
    node.print(os);
    return os;
}
ExprNode::~ExprNode()
{
}
ExprNodeP ExprNode::copy_meta(ExprNodeP node) const
{
    node->set_span(m_span);
    node->set_attrs(m_attrs.clone());
    return node;
}

bool is_literal(const ExprNode& node)
{
    return dynamic_cast<const ExprNode_String*>(&node)
        || dynamic_cast<const ExprNode_Integer*>(&node)
        || dynamic_cast<const ExprNode_Bool*>(&node);
}

#define NODE(class, _print, _clone)\
    void class::visit(NodeVisitor& nv) { nv.visit(*this); } \
    void class::print(::std::ostream& os) const _print \
    ExprNodeP class::clone() const _clone
#define OPT_CLONE(node) (node.get() ? node->clone() : ::AST::ExprNodeP())

NODE(ExprNode_Macro, {
    os << m_inv;
},{
    return copy_meta(ExprNodeP(new ExprNode_Macro( m_inv.clone() )));
})

NODE(ExprNode_Error, {
    os << "/*error*/ ()";
},{
    return copy_meta(ExprNodeP(new ExprNode_Error()));
})

NODE(ExprNode_Integer, {
    if( m_datatype == CORETYPE_CHAR )
        os << Token::make_char(static_cast<uint32_t>(m_value)).to_str();
    else
        os << m_value << coretype_name(m_datatype);
},{
    return copy_meta(ExprNodeP(new ExprNode_Integer(m_value, m_datatype)));
})
NODE(ExprNode_Bool, {
    if( m_value )
        os << "true";
    else
        os << "false";
},{
    return copy_meta(ExprNodeP(new ExprNode_Bool(m_value)));
})
NODE(ExprNode_String, {
    os << Token(TOK_STRING, m_value).to_str();
},{
    return copy_meta(ExprNodeP(new ExprNode_String(m_value)));
})

NODE(ExprNode_Array, {
    os << "[";
    for(size_t i = 0; i < m_values.size(); i ++)
    {
        if( i != 0 )
            os << ", ";
        os << *m_values[i];
    }
    os << "]";
},{
    ::std::vector<ExprNodeP>    vals;
    for(const auto& v : m_values)
        vals.push_back( v->clone() );
    return copy_meta(ExprNodeP(new ExprNode_Array(mv$(vals))));
})
NODE(ExprNode_Tuple, {
    os << "(";
    for(size_t i = 0; i < m_values.size(); i ++)
    {
        if( i != 0 )
            os << ", ";
        os << *m_values[i];
    }
    if( m_values.size() == 1 )
        os << ",";
    os << ")";
},{
    ::std::vector<ExprNodeP>    vals;
    for(const auto& v : m_values)
        vals.push_back( v->clone() );
    return copy_meta(ExprNodeP(new ExprNode_Tuple(mv$(vals))));
})
NODE(ExprNode_Paren, {
    os << "(" << *m_value << ")";
},{
    return copy_meta(ExprNodeP(new ExprNode_Paren(OPT_CLONE(m_value))));
})

NODE(ExprNode_NamedValue, {
    os << m_path;
},{
    return copy_meta(ExprNodeP(new ExprNode_NamedValue(m_path)));
})
NODE(ExprNode_Borrow, {
    os << "&";
    if( m_is_mut )
        os << "mut ";
    os << *m_value;
},{
    return copy_meta(ExprNodeP(new ExprNode_Borrow(m_is_mut, OPT_CLONE(m_value))));
})

#define NV(type, actions)\
    void NodeVisitorDef::visit(type& node) { actions }

NV(ExprNode_Macro, {
    (void)node;
})
NV(ExprNode_Error, {
    (void)node;
})
NV(ExprNode_Integer, {
    (void)node;
})
NV(ExprNode_Bool, {
    (void)node;
})
NV(ExprNode_String, {
    (void)node;
})
NV(ExprNode_Array, {
    for( auto& child : node.m_values )
        visit(child);
})
NV(ExprNode_Tuple, {
    for( auto& child : node.m_values )
        visit(child);
})
NV(ExprNode_Paren, {
    visit(node.m_value);
})
NV(ExprNode_NamedValue, {
    (void)node;
})
NV(ExprNode_Borrow, {
    visit(node.m_value);
})
#undef NV

}   // namespace AST
