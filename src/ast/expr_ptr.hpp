/*
 * synext - Syntax extension expansion core
 *
 * ast/expr_ptr.hpp
 * - Pointer type wrapping AST::ExprNode (prevents need to know the full definition)
 */
#pragma once
#include <memory>
#include <iosfwd>

namespace AST {

class ExprNode;
class NodeVisitor;

extern ::std::ostream& operator<<(::std::ostream& os, const ExprNode& node);

class ExprNodeP
{
    ExprNode*   m_ptr;
public:
    ~ExprNodeP();
    ExprNodeP(): m_ptr(nullptr) {}
    ExprNodeP(ExprNode* node): m_ptr(node) {}

    ExprNodeP(ExprNodeP&& x): m_ptr(x.m_ptr) { x.m_ptr = nullptr; }
    ExprNodeP(const ExprNodeP& x) = delete;
    ExprNodeP& operator=(ExprNodeP&& x) { if(&x != this) { this->~ExprNodeP(); this->m_ptr = x.m_ptr; x.m_ptr = nullptr; } return *this; }
    ExprNodeP& operator=(const ExprNodeP& x) = delete;

    operator bool() const { return is_valid(); }
    bool is_valid() const { return m_ptr != nullptr; }

    ExprNode& operator*() { return *m_ptr; }
    const ExprNode& operator*() const { return *m_ptr; }
    ExprNode* operator->() { return m_ptr; }
    const ExprNode* operator->() const { return m_ptr; }

    ExprNode* get() { return m_ptr; }
    const ExprNode* get() const { return m_ptr; }

    ExprNode* release() { auto rv = m_ptr; m_ptr = nullptr; return rv; }
    void reset(ExprNode* n = nullptr) { this->~ExprNodeP(); m_ptr = n; }
};

}   // namespace AST
