// seda/ast/ast_printer.hpp - Canonical source text for syntax-tree nodes
#pragma once

#include <string>

#include "seda/ast/ast.hpp"

namespace seda
{

/**
 * Render a node back to Seda source.
 *
 * The output is fully parenthesized for prefix, infix, index and range
 * expressions and re-parses to a tree of the same shape. Statements inside a
 * body are separated by "; ", top-level statements of a Program by newlines.
 *
 * @code
 *   to_source(parse("a + b * c"))  // "(a + (b * c))"
 * @endcode
 */
[[nodiscard]] std::string to_source(const AstNode * node);

}  // namespace seda
