/*
 * synext - Syntax extension expansion core
 *
 * compile_error.cpp
 * - Expansion error exception classes
 */
#include <compile_error.hpp>

CompileError::Base::Base(::std::string message):
    m_message( ::std::move(message) )
{
}
CompileError::Base::~Base() throw()
{
}
const char* CompileError::Base::what() const throw()
{
    return m_message.c_str();
}

CompileError::Generic::Generic(::std::string message):
    Base( "Error: " + ::std::move(message) )
{
}
CompileError::Fatal::Fatal(::std::string message):
    Base( ::std::move(message) )
{
}
CompileError::BugCheck::BugCheck(::std::string message):
    Base( "BUG: " + ::std::move(message) )
{
}
CompileError::Todo::Todo(::std::string message):
    Base( "TODO: " + ::std::move(message) )
{
}
CompileError::Todo::~Todo() throw()
{
}
