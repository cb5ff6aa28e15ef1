/*
 * synext - Syntax extension expansion core
 *
 * ast/expr.hpp
 * - AST Expression Nodes
 */
#ifndef AST_EXPR_INCLUDED
#define AST_EXPR_INCLUDED

#include <ostream>
#include <memory>   // unique_ptr
#include <vector>

#include "../parse/tokentree.hpp"
#include "../coretypes.hpp"
#include "types.hpp"
#include "pattern.hpp"
#include "attrs.hpp"
#include "macro.hpp"
#include "expr_ptr.hpp"

namespace AST {

class NodeVisitor;

class ExprNode
{
    AttributeList   m_attrs;
    Span    m_span;
public:
    virtual ~ExprNode() = 0;

    virtual void visit(NodeVisitor& nv) = 0;
    virtual void print(::std::ostream& os) const = 0;
    virtual ExprNodeP clone() const = 0;

    void set_span(Span s) { m_span = ::std::move(s); }
    const Span& span() const { return m_span; }

    void set_attrs(AttributeList&& mi) {
        for(auto& i : mi.m_items)
            m_attrs.m_items.push_back(mv$(i));
        mi.m_items.clear();
    }
    AttributeList& attrs() { return m_attrs; }
    const AttributeList& attrs() const { return m_attrs; }

protected:
    /// Copy span/attributes to a clone
    ExprNodeP copy_meta(ExprNodeP node) const;
};

#define NODE_METHODS()  \
    void visit(NodeVisitor& nv) override;\
    void print(::std::ostream& os) const override; \
    ExprNodeP clone() const override;

struct ExprNode_Macro:
    public ExprNode
{
    MacroInvocation m_inv;

    ExprNode_Macro(MacroInvocation inv):
        m_inv( ::std::move(inv) )
    {}

    NODE_METHODS();
};

/// Marker for an expression that failed to expand (an error was already reported)
struct ExprNode_Error:
    public ExprNode
{
    ExprNode_Error()
    {}

    NODE_METHODS();
};

// Literal integer (also used for `char` literals, with a type of CORETYPE_CHAR)
struct ExprNode_Integer:
    public ExprNode
{
    enum eCoreType  m_datatype;
    uint64_t    m_value;

    ExprNode_Integer(uint64_t value, enum eCoreType datatype):
        m_datatype(datatype),
        m_value(value)
    {
    }

    NODE_METHODS();
};
// Literal boolean
struct ExprNode_Bool:
    public ExprNode
{
    bool    m_value;

    ExprNode_Bool(bool value):
        m_value(value)
    {
    }

    NODE_METHODS();
};
// Literal string
struct ExprNode_String:
    public ExprNode
{
    ::std::string   m_value;

    ExprNode_String(::std::string value):
        m_value( ::std::move(value) )
    {}

    NODE_METHODS();
};

// Array
struct ExprNode_Array:
    public ExprNode
{
    ::std::vector<ExprNodeP>    m_values;

    ExprNode_Array(::std::vector<ExprNodeP> vals):
        m_values( ::std::move(vals) )
    {}

    NODE_METHODS();
};

// Tuple (also the unit value `()`)
struct ExprNode_Tuple:
    public ExprNode
{
    ::std::vector<ExprNodeP>    m_values;

    ExprNode_Tuple(::std::vector<ExprNodeP> vals):
        m_values( ::std::move(vals) )
    {}

    NODE_METHODS();
};
// Parenthesised expression
struct ExprNode_Paren:
    public ExprNode
{
    ExprNodeP   m_value;

    ExprNode_Paren(ExprNodeP val):
        m_value( ::std::move(val) )
    {}

    NODE_METHODS();
};
// Variable / Constant
struct ExprNode_NamedValue:
    public ExprNode
{
    Path    m_path;

    ExprNode_NamedValue(Path path):
        m_path( ::std::move(path) )
    {
    }

    NODE_METHODS();
};
// `&expr` / `&mut expr`
struct ExprNode_Borrow:
    public ExprNode
{
    bool    m_is_mut;
    ExprNodeP   m_value;

    ExprNode_Borrow(bool is_mut, ExprNodeP val):
        m_is_mut(is_mut),
        m_value( ::std::move(val) )
    {}

    NODE_METHODS();
};

#undef NODE_METHODS

/// `true` for literal nodes (strings, integers, chars and booleans)
extern bool is_literal(const ExprNode& node);

class NodeVisitor
{
public:
    virtual ~NodeVisitor() = default;
    virtual void visit(ExprNodeP& cnode) {
        if(cnode.get())
            cnode->visit(*this);
    }

    #define NT(nt) \
        virtual void visit(nt& node) = 0
    NT(ExprNode_Macro);
    NT(ExprNode_Error);
    NT(ExprNode_Integer);
    NT(ExprNode_Bool);
    NT(ExprNode_String);
    NT(ExprNode_Array);
    NT(ExprNode_Tuple);
    NT(ExprNode_Paren);
    NT(ExprNode_NamedValue);
    NT(ExprNode_Borrow);
    #undef NT
};
/// Visitor that visits every child node
class NodeVisitorDef:
    public NodeVisitor
{
public:
    using NodeVisitor::visit;

    #define NT(nt) \
        virtual void visit(nt& node) override
    NT(ExprNode_Macro);
    NT(ExprNode_Error);
    NT(ExprNode_Integer);
    NT(ExprNode_Bool);
    NT(ExprNode_String);
    NT(ExprNode_Array);
    NT(ExprNode_Tuple);
    NT(ExprNode_Paren);
    NT(ExprNode_NamedValue);
    NT(ExprNode_Borrow);
    #undef NT
};

}

#endif
