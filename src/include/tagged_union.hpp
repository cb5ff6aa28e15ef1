/*
 * synext - Syntax extension expansion core
 *
 * include/tagged_union.hpp
 * - Macro that allows construction of a tagged union (with various helper methods)
 *
 * Constructs a tagged union that correctly handles objects.
 *
 * Union is NOT copy-constructable
 */
#ifndef INCLUDED_SYNEXT_TAGGED_UNION_H_
#define INCLUDED_SYNEXT_TAGGED_UNION_H_

#include <cassert>
#include <string>
#include <new>
#include <type_traits>

#define TU_FIRST(a, ...)    a
#define TU_EXP1(x)  x
#define TU_EXP(...)  __VA_ARGS__

// Argument iteration
#define TU_DISP0(n)
#define TU_DISP1(n, _1)   n _1
#define TU_DISP2(n, _1, _2)   n _1 n _2
#define TU_DISP3(n, v, v2, v3)   n v n v2 n v3
#define TU_DISP4(n, v, v2, v3, v4)   n v n v2 n v3 n v4
#define TU_DISP5(n, a1,a2,a3, b1,b2   )   TU_DISP3(n, a1,a2,a3) TU_DISP2(n, b1,b2)
#define TU_DISP6(n, a1,a2,a3, b1,b2,b3)   TU_DISP3(n, a1,a2,a3) TU_DISP3(n, b1,b2,b3)
#define TU_DISP7(n, a1,a2,a3,a4, b1,b2,b3   )   TU_DISP4(n, a1,a2,a3,a4) TU_DISP3(n, b1,b2,b3)
#define TU_DISP8(n, a1,a2,a3,a4, b1,b2,b3,b4)   TU_DISP4(n, a1,a2,a3,a4) TU_DISP4(n, b1,b2,b3,b4)
#define TU_DISP9(n, a1,a2,a3,a4, b1,b2,b3,b4, c1)   TU_DISP8(n, a1,a2,a3,a4, b1,b2,b3,b4) TU_DISP1(n, c1)
#define TU_DISP10(n, a1,a2,a3,a4, b1,b2,b3,b4, c1,c2)   TU_DISP8(n, a1,a2,a3,a4, b1,b2,b3,b4) TU_DISP2(n, c1,c2)

#define TU_DISPO0(n)
#define TU_DISPO1(n, _1)   n(_1)
#define TU_DISPO2(n, _1, _2)   n(_1) n(_2)
#define TU_DISPO3(n, v, v2, v3)   n(v) n(v2) n(v3)

#define TU_DISPA(n, a)   n a
#define TU_DISPA1(n, a, _1)   TU_DISPA(n, (TU_EXP a, TU_EXP _1))
#define TU_DISPA2(n, a, _1, _2)     TU_DISPA1(n, a, _1) TU_DISPA1(n, a, _2)
#define TU_DISPA3(n, a, _1, _2, _3) TU_DISPA2(n, a, _1, _2) TU_DISPA1(n, a, _3)
#define TU_DISPA4(n, a, a1,a2, b1,b2)     TU_DISPA2(n,a, a1,a2)    TU_DISPA2(n,a, b1,b2)
#define TU_DISPA5(n, a, a1,a2,a3, b1,b2)    TU_DISPA3(n,a, a1,a2,a3) TU_DISPA2(n,a, b1,b2)
#define TU_DISPA6(n, a, a1,a2,a3, b1,b2,b3) TU_DISPA3(n,a, a1,a2,a3) TU_DISPA3(n,a, b1,b2,b3)
#define TU_DISPA7(n, a, a1,a2,a3, b1,b2, c1,c2) TU_DISPA3(n,a, a1,a2,a3) TU_DISPA2(n,a, b1,b2) TU_DISPA2(n,a, c1,c2)
#define TU_DISPA8(n, a, a1,a2,a3, b1,b2,b3, c1,c2) TU_DISPA3(n,a, a1,a2,a3) TU_DISPA3(n,a, b1,b2,b3) TU_DISPA2(n,a, c1,c2)
#define TU_DISPA9(n, a, a1,a2,a3, b1,b2,b3, c1,c2,c3) TU_DISPA3(n,a, a1,a2,a3) TU_DISPA3(n,a, b1,b2,b3) TU_DISPA3(n,a, c1,c2,c3)
#define TU_DISPA10(n, a, a1,a2,a3, b1,b2,b3, c1,c2,c3, d1) TU_DISPA9(n,a, a1,a2,a3, b1,b2,b3, c1,c2,c3) TU_DISPA1(n,a, d1)

// Macro to obtain a numbered macro for argument counts
#define TU_GM_I(SUF,_1,_2,_3,_4,_5,_6,_7,_8,_9,_10,COUNT,...) SUF##COUNT
#define TU_GM(SUF,...) TU_EXP1( TU_GM_I(SUF, __VA_ARGS__,10,9,8,7,6,5,4,3,2,1,0) )
#define TU_GMX(...) TU_EXP1( TU_GM(TU_DISP, __VA_ARGS__) )
#define TU_GMO(...) TU_EXP1( TU_GM(TU_DISPO, __VA_ARGS__) )
#define TU_GMA(...) TU_EXP1( TU_GM(TU_DISPA, __VA_ARGS__) )


// "match"-like statement
// TU_MATCH_HDRA( (value), { TU_ARMA(Variant, binding) { CODE } TU_ARMA(Variant2, binding) { CODE } })
#define TU_MATCH_HDRA(VARS, brace)  TU_MATCH_HDRA_(::std::remove_reference<decltype(TU_FIRST VARS)>::type, VARS, brace)
#define TU_MATCH_HDRA_(CLASS, VARS, brace)  /*
    */for(bool tu_lc = true; tu_lc; tu_lc=false) for(TU_EXP1(TU_MATCH_HDRA_Decl VARS); tu_lc; tu_lc=false) /*
        */switch( tu_match_hdr2_v.tag() ) brace /*
        */case CLASS::TAGDEAD: assert(!"ERROR: destructed tagged union used");
#define TU_MATCH_HDRA_DeclRest1(v1) &tu_match_hdr2_v = v1
#define TU_MATCH_HDRA_Decl(...)   auto TU_EXP1( TU_GM(TU_MATCH_HDRA_DeclRest, __VA_ARGS__)(__VA_ARGS__) )
#define TU_ARMA_DeclInner1(TAG, v1)   v1 = tu_match_hdr2_v.as_##TAG()
#define TU_ARMA_Decl(TAG, ...)   decltype(tu_match_hdr2_v.as_##TAG()) TU_EXP1( TU_GM(TU_ARMA_DeclInner, __VA_ARGS__)(TAG, __VA_ARGS__) )
#define TU_ARMA_IgnVal(v)   (void)v,
// Two for loops, the inner stops the outer after it's done.
#define TU_ARMA(TAG, ...)  break; case ::std::remove_reference<decltype(tu_match_hdr2_v)>::type::TAG_##TAG: /*
    */for(bool tu_lc = true; tu_lc; tu_lc=false) for(TU_ARMA_Decl(TAG, __VA_ARGS__); TU_EXP1( TU_GMO(__VA_ARGS__)(TU_ARMA_IgnVal, __VA_ARGS__) ) tu_lc; tu_lc=false)


#define TU_DATANAME(name)   Data_##name
// Internals of TU_CONS
#define TU_CONS_I(__name, __tag, __type) \
    __name(__type v): m_tag(TAG_##__tag) { new (&m_data.__tag) __type( ::std::move(v) ); } \
    static self_t make_##__tag(__type v) { return __name( ::std::move(v) ); }\
    bool is_##__tag() const { return m_tag == TAG_##__tag; } \
    const __type* opt_##__tag() const { if(m_tag == TAG_##__tag) return &m_data.__tag; return nullptr; } \
          __type* opt_##__tag()       { if(m_tag == TAG_##__tag) return &m_data.__tag; return nullptr; } \
    const __type& as_##__tag() const { assert(m_tag == TAG_##__tag); return m_data.__tag; } \
          __type& as_##__tag()       { assert(m_tag == TAG_##__tag); return m_data.__tag; } \
    __type unwrap_##__tag() { return ::std::move(this->as_##__tag()); } \
// Define a tagged union constructor
#define TU_CONS(__name, name, ...) TU_CONS_I(__name, name, TU_DATANAME(name))

#define TU_TYPEDEF(name, ...)    typedef __VA_ARGS__ TU_DATANAME(name);/*
*/
#define TU_TAG(name, ...)  TAG_##name,
#define TU_DEST_CASE(tag, ...)  case TAG_##tag: TU_destruct_inplace(m_data.tag); break;/*
*/
#define TU_MOVE_CASE(tag, ...)  case TAG_##tag: new(&m_data.tag) TU_DATANAME(tag)( ::std::move(x.m_data.tag) ); break;/*
*/
#define TU_TOSTR_CASE(tag,...)    case TAG_##tag: return #tag;/*
*/
#define TU_UNION_FIELD(tag, ...)    TU_DATANAME(tag) tag;/*
*/
#define TU_UNION_FIELDS(...)    TU_EXP1( TU_GMX(__VA_ARGS__)(TU_UNION_FIELD,__VA_ARGS__) )

#define TU_CONSS(_name, ...) TU_EXP1( TU_GMA(__VA_ARGS__)(TU_CONS, (_name), __VA_ARGS__) )
#define TU_TYPEDEFS(...)     TU_EXP1( TU_GMX(__VA_ARGS__)(TU_TYPEDEF   ,__VA_ARGS__) )
#define TU_TAGS(...)         TU_EXP1( TU_GMX(__VA_ARGS__)(TU_TAG       ,__VA_ARGS__) )
#define TU_DEST_CASES(...)   TU_EXP1( TU_GMX(__VA_ARGS__)(TU_DEST_CASE ,__VA_ARGS__) )
#define TU_MOVE_CASES(...)   TU_EXP1( TU_GMX(__VA_ARGS__)(TU_MOVE_CASE ,__VA_ARGS__) )
#define TU_TOSTR_CASES(...)  TU_EXP1( TU_GMX(__VA_ARGS__)(TU_TOSTR_CASE,__VA_ARGS__) )

/**
 * Define a new tagged union
 *
 * ```
 * TAGGED_UNION(Data, None,
 *     (None, (struct {})),
 *     (Bang, (::std::shared_ptr<ExpandProcMacro>)),
 *     (Derive, (struct { ::std::shared_ptr<ExpandDecorator> expander; bool legacy; }))
 *     );
 * ```
 */
#define TAGGED_UNION(_name, _def, ...)  TU_EXP1( TAGGED_UNION_EX(_name, (), _def, (TU_EXP(__VA_ARGS__)), ()) )
#define TAGGED_UNION_EX(_name, _inherit, _def, _variants, _extra) \
class _name TU_EXP _inherit { \
    typedef _name self_t;/*
*/public:\
    TU_TYPEDEFS _variants/*
*/  enum Tag { \
        TAGDEAD, \
        TU_TAGS _variants\
    };/*
*/ private:\
    Tag m_tag; \
    union DataUnion { TU_UNION_FIELDS _variants DataUnion() {} ~DataUnion() {} } m_data;/*
*/ public:\
    _name(): m_tag(TAG_##_def) { new (&m_data._def) TU_DATANAME(_def)(); }/*
*/  _name(const _name&) = delete;/*
*/  _name(_name&& x) noexcept: m_tag(x.m_tag) { switch(m_tag) { case TAGDEAD: break; TU_MOVE_CASES _variants } x.m_tag = TAGDEAD; }/*
*/  _name& operator =(_name&& x) { if(&x == this) return *this; switch(m_tag) { case TAGDEAD: break; TU_DEST_CASES _variants } m_tag = x.m_tag; switch(m_tag) { case TAGDEAD: break; TU_MOVE_CASES _variants }; return *this; }/*
*/  ~_name() { switch(m_tag) { case TAGDEAD: break; TU_DEST_CASES _variants } m_tag = TAGDEAD; } \
    \
    Tag tag() const { return m_tag; }\
    const char* tag_str() const { return tag_to_str(m_tag); }\
    TU_CONSS(_name, TU_EXP _variants) \
/*
*/    static const char *tag_to_str(Tag tag) { \
        switch(tag) {/*
*/          case TAGDEAD: return "ERR:DEAD";/*
*/          TU_TOSTR_CASES _variants/*
*/      } return ""; \
    }\
    TU_EXP _extra\
}

namespace {
    template<typename T> static void TU_destruct_inplace(T& v) { v.~T(); }
}

#endif
