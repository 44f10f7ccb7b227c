// seda/ast/ast_enums.hpp - Node kinds and operator enumerations
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace seda
{

// ============================================================================
// NodeKind
// ============================================================================

/**
 * One enumerator per concrete node class, generated from ast_nodes.def.
 * Categories are contiguous so classof() on a category is a range check.
 */
enum class NodeKind : uint8_t {
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "seda/ast/ast_nodes.def"
};

namespace detail
{
inline constexpr NodeKind k_first_expr_kind = NodeKind::Identifier;
inline constexpr NodeKind k_last_expr_kind = NodeKind::UiElement;
inline constexpr NodeKind k_first_stmt_kind = NodeKind::VarStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::BlockStmt;
}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

/// Class name of a node kind ("InfixExpr", "VarStmt", ...).
[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "seda/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Operators
// ============================================================================

enum class PrefixOp : uint8_t {
  Neg,  ///< -
  Not,  ///< ! or not
};

enum class InfixOp : uint8_t {
  Add,    ///< +
  Sub,    ///< -
  Mul,    ///< *
  Div,    ///< /
  Mod,    ///< %
  Pow,    ///< ^
  Eq,     ///< ==
  NotEq,  ///< !=
  Lt,     ///< <
  Gt,     ///< >
  Le,     ///< <=
  Ge,     ///< >=
  And,    ///< && or and
  Or,     ///< || or or
};

/// Operators accepted between the two sides of a check/where assertion.
enum class AssertionOp : uint8_t {
  Is,
  IsA,
  IsNot,
  Contains,
  IsGreater,
  IsLess,
  StartsWith,
  EndsWith,
  Raises,
  IsTrue,
  IsFalse,
  IsEmpty,
};

[[nodiscard]] constexpr std::string_view to_string(PrefixOp op) noexcept
{
  switch (op) {
    case PrefixOp::Neg:
      return "-";
    case PrefixOp::Not:
      return "!";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(InfixOp op) noexcept
{
  switch (op) {
    case InfixOp::Add:
      return "+";
    case InfixOp::Sub:
      return "-";
    case InfixOp::Mul:
      return "*";
    case InfixOp::Div:
      return "/";
    case InfixOp::Mod:
      return "%";
    case InfixOp::Pow:
      return "^";
    case InfixOp::Eq:
      return "==";
    case InfixOp::NotEq:
      return "!=";
    case InfixOp::Lt:
      return "<";
    case InfixOp::Gt:
      return ">";
    case InfixOp::Le:
      return "<=";
    case InfixOp::Ge:
      return ">=";
    case InfixOp::And:
      return "&&";
    case InfixOp::Or:
      return "||";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssertionOp op) noexcept
{
  switch (op) {
    case AssertionOp::Is:
      return "is";
    case AssertionOp::IsA:
      return "isA";
    case AssertionOp::IsNot:
      return "isNot";
    case AssertionOp::Contains:
      return "contains";
    case AssertionOp::IsGreater:
      return "isGreater";
    case AssertionOp::IsLess:
      return "isLess";
    case AssertionOp::StartsWith:
      return "startsWith";
    case AssertionOp::EndsWith:
      return "endsWith";
    case AssertionOp::Raises:
      return "raises";
    case AssertionOp::IsTrue:
      return "isTrue";
    case AssertionOp::IsFalse:
      return "isFalse";
    case AssertionOp::IsEmpty:
      return "isEmpty";
  }
  return "";
}

/// Unary assertions (`x isTrue`) take no right-hand side.
[[nodiscard]] constexpr bool is_unary(AssertionOp op) noexcept
{
  return op == AssertionOp::IsTrue || op == AssertionOp::IsFalse || op == AssertionOp::IsEmpty;
}

[[nodiscard]] constexpr std::optional<AssertionOp> assertion_op_from_string(
  std::string_view s) noexcept
{
  constexpr AssertionOp k_all[] = {
    AssertionOp::Is,        AssertionOp::IsA,        AssertionOp::IsNot,    AssertionOp::Contains,
    AssertionOp::IsGreater, AssertionOp::IsLess,     AssertionOp::StartsWith,
    AssertionOp::EndsWith,  AssertionOp::Raises,     AssertionOp::IsTrue,   AssertionOp::IsFalse,
    AssertionOp::IsEmpty,
  };
  for (const AssertionOp op : k_all) {
    if (to_string(op) == s) {
      return op;
    }
  }
  return std::nullopt;
}

}  // namespace seda
