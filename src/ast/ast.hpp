/*
 * synext - Syntax extension expansion core
 *
 * ast/ast.hpp
 * - Core AST header
 */
#ifndef AST_HPP_INCLUDED
#define AST_HPP_INCLUDED

#include <string>
#include <vector>
#include <memory>

#include "../common.hpp"
#include <span.hpp>
#include <ident.hpp>

#include "edition.hpp"
#include "path.hpp"
#include "attrs.hpp"
#include "macro.hpp"
#include "types.hpp"
#include "pattern.hpp"
#include "expr.hpp"
#include "item.hpp"

#endif // AST_HPP_INCLUDED
