/*
 * synext - Syntax extension expansion core
 *
 * ast/pattern.cpp
 * - AST::Pattern support/implementation code
 */
#include "pattern.hpp"
#include "expr.hpp"

namespace AST {

Pattern::~Pattern()
{
}

Pattern Pattern::clone() const
{
    TU_MATCH_HDRA( (m_data), {)
    TU_ARMA(Any, e) {
        return Pattern::new_wild(m_span);
        }
    TU_ARMA(MaybeBind, e) {
        return Pattern(m_span, Data::make_MaybeBind({ e.name, e.is_mut }));
        }
    TU_ARMA(Value, e) {
        return Pattern::new_value(m_span, e.val->clone());
        }
    TU_ARMA(Tuple, e) {
        ::std::vector<Pattern>  sub;
        for(const auto& p : e)
            sub.push_back( p.clone() );
        return Pattern(m_span, Data::make_Tuple(mv$(sub)));
        }
    TU_ARMA(Macro, e) {
        return Pattern(m_span, Data::make_Macro( box$(e->clone()) ));
        }
    }
    BUG(m_span, "Bad Pattern tag");
}

::std::ostream& operator<<(::std::ostream& os, const Pattern& pat)
{
    TU_MATCH_HDRA( (pat.m_data), {)
    TU_ARMA(Any, e) {
        os << "_";
        }
    TU_ARMA(MaybeBind, e) {
        if( e.is_mut )
            os << "mut ";
        os << e.name;
        }
    TU_ARMA(Value, e) {
        os << *e.val;
        }
    TU_ARMA(Tuple, e) {
        os << "(";
        for(size_t i = 0; i < e.size(); i ++)
        {
            if( i != 0 )
                os << ", ";
            os << e[i];
        }
        if( e.size() == 1 )
            os << ",";
        os << ")";
        }
    TU_ARMA(Macro, e) {
        os << *e;
        }
    }
    return os;
}

}   // namespace AST
