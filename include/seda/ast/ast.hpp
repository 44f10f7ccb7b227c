// seda/ast/ast.hpp - Syntax-tree node classes
//
// Every node carries a NodeKind tag and a byte range. Nodes live in an
// AstContext arena, are trivially destructible, and refer to children through
// raw pointers and gsl::span views into the same arena.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string_view>

#include "seda/ast/ast_enums.hpp"
#include "seda/basic/casting.hpp"
#include "seda/basic/source_manager.hpp"

namespace seda
{

// ============================================================================
// Base Classes
// ============================================================================

class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/// Supplies `kind` and classof() for a concrete node class.
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class BlockStmt;
class UiElement;

// ============================================================================
// Supporting Nodes
// ============================================================================

/// `Name` or `Name[P1, P2]`; parameters nest for generic types.
class TypeAnnotation : public NodeBase<TypeAnnotation, AstNode, NodeKind::TypeAnnotation>
{
public:
  std::string_view name;
  gsl::span<TypeAnnotation *> params;

  explicit TypeAnnotation(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}

  [[nodiscard]] bool is_generic() const noexcept { return !params.empty(); }
};

class Parameter : public NodeBase<Parameter, AstNode, NodeKind::Parameter>
{
public:
  std::string_view name;
  TypeAnnotation * type = nullptr;

  Parameter(std::string_view n, TypeAnnotation * t, SourceRange r = {})
  : NodeBase(r), name(n), type(t)
  {
  }
};

class StructField : public NodeBase<StructField, AstNode, NodeKind::StructField>
{
public:
  std::string_view name;
  TypeAnnotation * type;

  StructField(std::string_view n, TypeAnnotation * t, SourceRange r = {})
  : NodeBase(r), name(n), type(t)
  {
  }
};

class ElseIfClause : public NodeBase<ElseIfClause, AstNode, NodeKind::ElseIfClause>
{
public:
  Expr * condition;
  BlockStmt * body;

  ElseIfClause(Expr * c, BlockStmt * b, SourceRange r = {}) : NodeBase(r), condition(c), body(b)
  {
  }
};

/// `pattern => result`. A bare `_` pattern matches anything.
class CaseBranch : public NodeBase<CaseBranch, AstNode, NodeKind::CaseBranch>
{
public:
  Expr * pattern;
  Expr * result;

  CaseBranch(Expr * p, Expr * res, SourceRange r = {}) : NodeBase(r), pattern(p), result(res) {}

  [[nodiscard]] bool is_wildcard() const noexcept;
};

/// `left op [right]` inside a check or where body.
class Assertion : public NodeBase<Assertion, AstNode, NodeKind::Assertion>
{
public:
  Expr * lhs;
  AssertionOp op;
  Expr * rhs = nullptr;  ///< null for isTrue / isFalse / isEmpty

  Assertion(Expr * l, AssertionOp o, Expr * rgt, SourceRange r = {})
  : NodeBase(r), lhs(l), op(o), rhs(rgt)
  {
  }
};

/// Inline tests attached to a function declaration.
class WhereBlock : public NodeBase<WhereBlock, AstNode, NodeKind::WhereBlock>
{
public:
  gsl::span<Stmt *> statements;
  gsl::span<Assertion *> assertions;

  explicit WhereBlock(SourceRange r = {}) : NodeBase(r) {}
};

class MapEntry : public NodeBase<MapEntry, AstNode, NodeKind::MapEntry>
{
public:
  Expr * key;
  Expr * value;

  MapEntry(Expr * k, Expr * v, SourceRange r = {}) : NodeBase(r), key(k), value(v) {}
};

class UiProperty : public NodeBase<UiProperty, AstNode, NodeKind::UiProperty>
{
public:
  std::string_view name;
  Expr * value;

  UiProperty(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

class Identifier : public NodeBase<Identifier, Expr, NodeKind::Identifier>
{
public:
  std::string_view name;

  explicit Identifier(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Numbers keep their spelling; `value` is the parsed double.
class NumberLiteral : public NodeBase<NumberLiteral, Expr, NodeKind::NumberLiteral>
{
public:
  std::string_view text;
  double value;

  NumberLiteral(std::string_view t, double v, SourceRange r = {}) : NodeBase(r), text(t), value(v)
  {
  }
};

class StringLiteral : public NodeBase<StringLiteral, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;  ///< decoded contents

  explicit StringLiteral(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// "text #{expr} text": parts alternate StringLiteral text and expressions.
class InterpolatedString
: public NodeBase<InterpolatedString, Expr, NodeKind::InterpolatedString>
{
public:
  gsl::span<Expr *> parts;

  explicit InterpolatedString(gsl::span<Expr *> p, SourceRange r = {}) : NodeBase(r), parts(p) {}
};

class BooleanLiteral : public NodeBase<BooleanLiteral, Expr, NodeKind::BooleanLiteral>
{
public:
  bool value;

  explicit BooleanLiteral(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NilLiteral : public NodeBase<NilLiteral, Expr, NodeKind::NilLiteral>
{
public:
  explicit NilLiteral(SourceRange r = {}) : NodeBase(r) {}
};

class ArrayLiteral : public NodeBase<ArrayLiteral, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteral(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

class MapLiteral : public NodeBase<MapLiteral, Expr, NodeKind::MapLiteral>
{
public:
  gsl::span<MapEntry *> entries;

  explicit MapLiteral(gsl::span<MapEntry *> e, SourceRange r = {}) : NodeBase(r), entries(e) {}
};

/// Anonymous `fn(params) :: body end`.
class FunctionLiteral : public NodeBase<FunctionLiteral, Expr, NodeKind::FunctionLiteral>
{
public:
  gsl::span<Parameter *> params;
  BlockStmt * body = nullptr;

  explicit FunctionLiteral(SourceRange r = {}) : NodeBase(r) {}
};

class PrefixExpr : public NodeBase<PrefixExpr, Expr, NodeKind::PrefixExpr>
{
public:
  PrefixOp op;
  Expr * operand;

  PrefixExpr(PrefixOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class InfixExpr : public NodeBase<InfixExpr, Expr, NodeKind::InfixExpr>
{
public:
  Expr * lhs;
  InfixOp op;
  Expr * rhs;

  InfixExpr(Expr * l, InfixOp o, Expr * rgt, SourceRange r = {})
  : NodeBase(r), lhs(l), op(o), rhs(rgt)
  {
  }
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  CallExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::IndexExpr>
{
public:
  Expr * base;
  Expr * index;

  IndexExpr(Expr * b, Expr * i, SourceRange r = {}) : NodeBase(r), base(b), index(i) {}
};

/// `object.property`; the property may be spelled like a keyword.
class DotExpr : public NodeBase<DotExpr, Expr, NodeKind::DotExpr>
{
public:
  Expr * object;
  std::string_view property;

  DotExpr(Expr * o, std::string_view p, SourceRange r = {}) : NodeBase(r), object(o), property(p)
  {
  }
};

class AssignExpr : public NodeBase<AssignExpr, Expr, NodeKind::AssignExpr>
{
public:
  Expr * target;
  Expr * value;

  AssignExpr(Expr * t, Expr * v, SourceRange r = {}) : NodeBase(r), target(t), value(v) {}
};

/// `a..b` (half-open) or `a...b` (inclusive).
class RangeExpr : public NodeBase<RangeExpr, Expr, NodeKind::RangeExpr>
{
public:
  Expr * start;
  Expr * end;
  bool inclusive;

  RangeExpr(Expr * s, Expr * e, bool incl, SourceRange r = {})
  : NodeBase(r), start(s), end(e), inclusive(incl)
  {
  }
};

class CaseExpr : public NodeBase<CaseExpr, Expr, NodeKind::CaseExpr>
{
public:
  Expr * subject;
  gsl::span<CaseBranch *> branches;

  explicit CaseExpr(Expr * s, SourceRange r = {}) : NodeBase(r), subject(s) {}
};

/// `Window { title: "x", VBox { ... } }`
class UiElement : public NodeBase<UiElement, Expr, NodeKind::UiElement>
{
public:
  std::string_view typeName;
  gsl::span<UiProperty *> properties;
  gsl::span<UiElement *> children;

  explicit UiElement(std::string_view t, SourceRange r = {}) : NodeBase(r), typeName(t) {}

  /// First property called `name`, or null.
  [[nodiscard]] const UiProperty * find_property(std::string_view name) const noexcept;
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `var a, b: T = value` / `const ...`. `names` is never empty.
class VarStmt : public NodeBase<VarStmt, Stmt, NodeKind::VarStmt>
{
public:
  gsl::span<std::string_view> names;
  TypeAnnotation * type = nullptr;
  Expr * value = nullptr;
  bool isConst = false;

  explicit VarStmt(bool c, SourceRange r = {}) : NodeBase(r), isConst(c) {}
};

/// `fn [Receiver.]name(params)[: Ret] :: body [where :: ...] end`
class FnStmt : public NodeBase<FnStmt, Stmt, NodeKind::FnStmt>
{
public:
  std::string_view name;
  std::optional<std::string_view> receiver;
  gsl::span<Parameter *> params;
  TypeAnnotation * returnType = nullptr;
  BlockStmt * body = nullptr;
  WhereBlock * where = nullptr;

  explicit FnStmt(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class StructStmt : public NodeBase<StructStmt, Stmt, NodeKind::StructStmt>
{
public:
  std::string_view name;
  gsl::span<StructField *> fields;

  explicit StructStmt(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `type Name = Annotation`
class TypeStmt : public NodeBase<TypeStmt, Stmt, NodeKind::TypeStmt>
{
public:
  std::string_view name;
  TypeAnnotation * aliased;

  TypeStmt(std::string_view n, TypeAnnotation * t, SourceRange r = {})
  : NodeBase(r), name(n), aliased(t)
  {
  }
};

class ModuleStmt : public NodeBase<ModuleStmt, Stmt, NodeKind::ModuleStmt>
{
public:
  std::string_view name;
  BlockStmt * body = nullptr;

  explicit ModuleStmt(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `using "path" [as alias]`
class UsingStmt : public NodeBase<UsingStmt, Stmt, NodeKind::UsingStmt>
{
public:
  std::string_view path;
  std::optional<std::string_view> alias;

  explicit UsingStmt(std::string_view p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

/// UI component: ordinary statements followed by exactly one root element.
class ComponentStmt : public NodeBase<ComponentStmt, Stmt, NodeKind::ComponentStmt>
{
public:
  std::string_view name;
  gsl::span<Parameter *> params;
  gsl::span<Stmt *> body;
  UiElement * root = nullptr;

  explicit ComponentStmt(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  BlockStmt * consequence = nullptr;
  gsl::span<ElseIfClause *> elseIfs;
  BlockStmt * alternative = nullptr;

  explicit IfStmt(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

class CaseStmt : public NodeBase<CaseStmt, Stmt, NodeKind::CaseStmt>
{
public:
  Expr * subject;
  gsl::span<CaseBranch *> branches;

  explicit CaseStmt(Expr * s, SourceRange r = {}) : NodeBase(r), subject(s) {}
};

/// `for v in xs` or `for i, v in xs`
class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  std::optional<std::string_view> indexName;
  std::string_view valueName;
  Expr * iterable = nullptr;
  BlockStmt * body = nullptr;

  explicit ForStmt(std::string_view v, SourceRange r = {}) : NodeBase(r), valueName(v) {}
};

/// `check ["label"] :: setup... assertions... end`
class CheckStmt : public NodeBase<CheckStmt, Stmt, NodeKind::CheckStmt>
{
public:
  std::optional<std::string_view> label;
  gsl::span<Stmt *> statements;
  gsl::span<Assertion *> assertions;

  explicit CheckStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  gsl::span<Expr *> values;

  explicit ReturnStmt(gsl::span<Expr *> v, SourceRange r = {}) : NodeBase(r), values(v) {}
};

class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::BreakStmt>
{
public:
  explicit BreakStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// Statements up to (not including) the terminating keyword.
class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> statements;

  explicit BlockStmt(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), statements(s) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> statements;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

inline bool CaseBranch::is_wildcard() const noexcept
{
  const auto * id = dyn_cast<Identifier>(pattern);
  return id != nullptr && id->name == "_";
}

inline const UiProperty * UiElement::find_property(std::string_view prop_name) const noexcept
{
  for (const auto * p : properties) {
    if (p->name == prop_name) {
      return p;
    }
  }
  return nullptr;
}

}  // namespace seda
