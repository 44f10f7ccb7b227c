// seda/ast/visitor.hpp - CRTP visitors over the syntax tree
#pragma once

#include <type_traits>

#include "seda/ast/ast.hpp"
#include "seda/ast/ast_enums.hpp"
#include "seda/basic/casting.hpp"

namespace seda
{

namespace detail
{

/// `const Derived *` when the visitor walks `const AstNode *`.
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor
// ============================================================================

/**
 * Static-dispatch visitor. `visit(node)` switches on the node kind and calls
 * `visit_<snake_name>` on the derived class. Unhandled kinds fall back to
 * visit_expr / visit_stmt / visit_node.
 *
 * @code
 *   struct CountCalls : ConstAstVisitor<CountCalls> {
 *     int n = 0;
 *     void visit_call_expr(const CallExpr *) { ++n; }
 *   };
 * @endcode
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define SEDA_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                      \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR SEDA_VISIT_CASE
#define AST_NODE_STMT SEDA_VISIT_CASE
#define AST_NODE_SUPPORT SEDA_VISIT_CASE
#define AST_NODE_TOP SEDA_VISIT_CASE
#include "seda/ast/ast_nodes.def"
#undef SEDA_VISIT_CASE
    }
    return ReturnType();
  }

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "seda/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor
// ============================================================================

/**
 * Walks every child in source order. Override a visit_* method to intercept
 * a kind; call the base version to keep descending, return false to stop the
 * whole walk.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  /// Absent optional children count as visited.
  bool visit(NodePtrT node)
  {
    if (!node) {
      return true;
    }
    return Base::visit(node);
  }

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  bool visit_node(NodePtrT /*node*/) { return true; }

  // --- Expressions ---
  bool visit_interpolated_string(NodePtr<InterpolatedString> node) { return all(node->parts); }
  bool visit_array_literal(NodePtr<ArrayLiteral> node) { return all(node->elements); }
  bool visit_map_literal(NodePtr<MapLiteral> node) { return all(node->entries); }
  bool visit_function_literal(NodePtr<FunctionLiteral> node)
  {
    return all(node->params) && get_derived().visit(node->body);
  }
  bool visit_prefix_expr(NodePtr<PrefixExpr> node) { return get_derived().visit(node->operand); }
  bool visit_infix_expr(NodePtr<InfixExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }
  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    return get_derived().visit(node->callee) && all(node->args);
  }
  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    return get_derived().visit(node->base) && get_derived().visit(node->index);
  }
  bool visit_dot_expr(NodePtr<DotExpr> node) { return get_derived().visit(node->object); }
  bool visit_assign_expr(NodePtr<AssignExpr> node)
  {
    return get_derived().visit(node->target) && get_derived().visit(node->value);
  }
  bool visit_range_expr(NodePtr<RangeExpr> node)
  {
    return get_derived().visit(node->start) && get_derived().visit(node->end);
  }
  bool visit_case_expr(NodePtr<CaseExpr> node)
  {
    return get_derived().visit(node->subject) && all(node->branches);
  }
  bool visit_ui_element(NodePtr<UiElement> node)
  {
    return all(node->properties) && all(node->children);
  }

  // --- Statements ---
  bool visit_var_stmt(NodePtr<VarStmt> node)
  {
    return get_derived().visit(node->type) && get_derived().visit(node->value);
  }
  bool visit_fn_stmt(NodePtr<FnStmt> node)
  {
    return all(node->params) && get_derived().visit(node->returnType) &&
           get_derived().visit(node->body) && get_derived().visit(node->where);
  }
  bool visit_struct_stmt(NodePtr<StructStmt> node) { return all(node->fields); }
  bool visit_type_stmt(NodePtr<TypeStmt> node) { return get_derived().visit(node->aliased); }
  bool visit_module_stmt(NodePtr<ModuleStmt> node) { return get_derived().visit(node->body); }
  bool visit_component_stmt(NodePtr<ComponentStmt> node)
  {
    return all(node->params) && all(node->body) && get_derived().visit(node->root);
  }
  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->consequence) &&
           all(node->elseIfs) && get_derived().visit(node->alternative);
  }
  bool visit_case_stmt(NodePtr<CaseStmt> node)
  {
    return get_derived().visit(node->subject) && all(node->branches);
  }
  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    return get_derived().visit(node->iterable) && get_derived().visit(node->body);
  }
  bool visit_check_stmt(NodePtr<CheckStmt> node)
  {
    return all(node->statements) && all(node->assertions);
  }
  bool visit_return_stmt(NodePtr<ReturnStmt> node) { return all(node->values); }
  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expr); }
  bool visit_block_stmt(NodePtr<BlockStmt> node) { return all(node->statements); }

  // --- Supporting nodes ---
  bool visit_parameter(NodePtr<Parameter> node) { return get_derived().visit(node->type); }
  bool visit_struct_field(NodePtr<StructField> node) { return get_derived().visit(node->type); }
  bool visit_else_if_clause(NodePtr<ElseIfClause> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->body);
  }
  bool visit_case_branch(NodePtr<CaseBranch> node)
  {
    return get_derived().visit(node->pattern) && get_derived().visit(node->result);
  }
  bool visit_where_block(NodePtr<WhereBlock> node)
  {
    return all(node->statements) && all(node->assertions);
  }
  bool visit_assertion(NodePtr<Assertion> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }
  bool visit_type_annotation(NodePtr<TypeAnnotation> node) { return all(node->params); }
  bool visit_map_entry(NodePtr<MapEntry> node)
  {
    return get_derived().visit(node->key) && get_derived().visit(node->value);
  }
  bool visit_ui_property(NodePtr<UiProperty> node) { return get_derived().visit(node->value); }

  bool visit_program(NodePtr<Program> node) { return all(node->statements); }

private:
  template <typename T>
  bool all(gsl::span<T *> children)
  {
    for (auto * child : children) {
      if (!get_derived().visit(child)) return false;
    }
    return true;
  }
};

}  // namespace seda
