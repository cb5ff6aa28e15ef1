/*
 * synext - Syntax extension expansion core
 *
 * include/compile_error.hpp
 * - Expansion error exception classes
 */
#ifndef _SYNEXT_COMPILE_ERROR_H_
#define _SYNEXT_COMPILE_ERROR_H_

#include <exception>
#include <string>

namespace CompileError {

class Base:
    public ::std::exception
{
    ::std::string   m_message;
public:
    Base(::std::string message);
    virtual ~Base() throw();

    const char* what() const throw() override;
};

/// A generic, unrecoverable error (message is not yet reported)
class Generic:
    public Base
{
public:
    Generic(::std::string message);
    virtual ~Generic() throw () {}
};

/// Raised after a fatal diagnostic has been emitted, unwinds the current expansion
class Fatal:
    public Base
{
public:
    Fatal(::std::string message);
    virtual ~Fatal() throw () {}
};

/// Internal invariant violation
class BugCheck:
    public Base
{
public:
    BugCheck(::std::string message);
    virtual ~BugCheck() throw () {}
};

/// Reached functionality that is deliberately not implemented
class Todo:
    public Base
{
public:
    Todo(::std::string message);
    virtual ~Todo() throw ();
};

}

#endif

