// seda/ast/ast_dumper.hpp - Debug tree output
//
// Prints any node and its subtree as an indented tree, one node per line.
//
#pragma once

#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "seda/ast/ast.hpp"
#include "seda/ast/ast_enums.hpp"
#include "seda/ast/visitor.hpp"

namespace seda
{

// ============================================================================
// AstDumper
// ============================================================================

/**
 * Dumps a syntax tree in a human-readable tree format.
 *
 * @code
 *   Program
 *   |-VarStmt const names='total'
 *   | `-InfixExpr op='+'
 *   |   |-NumberLiteral 1
 *   |   `-Identifier name='x'
 *   `-FnStmt name='main'
 *     `-BlockStmt
 * @endcode
 */
class AstDumper : public ConstAstVisitor<AstDumper, void>
{
public:
  explicit AstDumper(std::ostream & os) : os_(os) {}

  void dump(const AstNode * node) { visit(node); }

  /// `key='value'`, or a bare value when the key is empty.
  struct Prop
  {
    std::string_view key;
    std::string value;

    Prop(std::string_view k, std::string_view v) : key(k), value(v) {}
    Prop(std::string_view k, std::string v) : key(k), value(std::move(v)) {}
    Prop(std::string_view k, const char * v) : key(k), value(v) {}

    Prop(std::string_view v) : value(v) {}
    Prop(std::string v) : value(std::move(v)) {}
    Prop(const char * v) : value(v) {}
  };

  template <typename... Containers>
  void print_tree(
    std::string_view label, const std::vector<Prop> & props, const Containers &... childContainers)
  {
    print_prefix();
    os_ << label;
    for (const auto & prop : props) {
      if (prop.key.empty()) {
        os_ << " " << prop.value;
      } else {
        os_ << " " << prop.key << "='" << prop.value << "'";
      }
    }
    os_ << "\n";

    std::vector<const AstNode *> all_children;
    (collect_children(all_children, childContainers), ...);
    print_children(all_children);
  }

  template <typename... Containers>
  void print_tree(
    std::string_view label, std::initializer_list<Prop> props,
    const Containers &... childContainers)
  {
    print_tree(label, std::vector<Prop>(props), childContainers...);
  }

  // ===========================================================================
  // Visit methods
  // ===========================================================================

  void visit_program(const Program * node)
  {
    print_prefix();
    os_ << "Program\n";
    std::vector<const AstNode *> all_children;
    collect_children(all_children, node->statements);
    print_children(all_children);
  }

  // --- Statements ---
  void visit_var_stmt(const VarStmt * node)
  {
    std::string names;
    for (size_t i = 0; i < node->names.size(); ++i) {
      if (i > 0) names += ", ";
      names += node->names[i];
    }
    print_tree(
      "VarStmt", {{node->isConst ? "const" : "var"}, {"names", names}}, node->type, node->value);
  }
  void visit_fn_stmt(const FnStmt * node)
  {
    std::vector<Prop> props = {{"name", node->name}};
    if (node->receiver) props.emplace_back("receiver", *node->receiver);
    print_tree("FnStmt", props, node->params, node->returnType, node->body, node->where);
  }
  void visit_struct_stmt(const StructStmt * node)
  {
    print_tree("StructStmt", {{"name", node->name}}, node->fields);
  }
  void visit_type_stmt(const TypeStmt * node)
  {
    print_tree("TypeStmt", {{"name", node->name}}, node->aliased);
  }
  void visit_module_stmt(const ModuleStmt * node)
  {
    print_tree("ModuleStmt", {{"name", node->name}}, node->body);
  }
  void visit_using_stmt(const UsingStmt * node)
  {
    std::vector<Prop> props = {{"path", node->path}};
    if (node->alias) props.emplace_back("as", *node->alias);
    print_tree("UsingStmt", props);
  }
  void visit_component_stmt(const ComponentStmt * node)
  {
    print_tree("ComponentStmt", {{"name", node->name}}, node->params, node->body, node->root);
  }
  void visit_if_stmt(const IfStmt * node)
  {
    print_tree(
      "IfStmt", {}, node->condition, node->consequence, node->elseIfs, node->alternative);
  }
  void visit_case_stmt(const CaseStmt * node)
  {
    print_tree("CaseStmt", {}, node->subject, node->branches);
  }
  void visit_for_stmt(const ForStmt * node)
  {
    std::vector<Prop> props;
    if (node->indexName) props.emplace_back("index", *node->indexName);
    props.emplace_back("value", node->valueName);
    print_tree("ForStmt", props, node->iterable, node->body);
  }
  void visit_check_stmt(const CheckStmt * node)
  {
    std::vector<Prop> props;
    if (node->label) props.emplace_back("label", *node->label);
    print_tree("CheckStmt", props, node->statements, node->assertions);
  }
  void visit_return_stmt(const ReturnStmt * node) { print_tree("ReturnStmt", {}, node->values); }
  void visit_break_stmt(const BreakStmt *) { print_tree("BreakStmt", {}); }
  void visit_expr_stmt(const ExprStmt * node) { print_tree("ExprStmt", {}, node->expr); }
  void visit_block_stmt(const BlockStmt * node)
  {
    print_tree("BlockStmt", {}, node->statements);
  }

  // --- Expressions ---
  void visit_identifier(const Identifier * node)
  {
    print_tree("Identifier", {{"name", node->name}});
  }
  void visit_number_literal(const NumberLiteral * node)
  {
    print_tree("NumberLiteral", {Prop(node->text)});
  }
  void visit_string_literal(const StringLiteral * node)
  {
    print_tree("StringLiteral", {{"\"" + std::string(node->value) + "\""}});
  }
  void visit_interpolated_string(const InterpolatedString * node)
  {
    print_tree("InterpolatedString", {}, node->parts);
  }
  void visit_boolean_literal(const BooleanLiteral * node)
  {
    print_tree("BooleanLiteral", {Prop(node->value ? "true" : "false")});
  }
  void visit_nil_literal(const NilLiteral *) { print_tree("NilLiteral", {}); }
  void visit_array_literal(const ArrayLiteral * node)
  {
    print_tree("ArrayLiteral", {}, node->elements);
  }
  void visit_map_literal(const MapLiteral * node) { print_tree("MapLiteral", {}, node->entries); }
  void visit_function_literal(const FunctionLiteral * node)
  {
    print_tree("FunctionLiteral", {}, node->params, node->body);
  }
  void visit_prefix_expr(const PrefixExpr * node)
  {
    print_tree("PrefixExpr", {{"op", to_string(node->op)}}, node->operand);
  }
  void visit_infix_expr(const InfixExpr * node)
  {
    print_tree("InfixExpr", {{"op", to_string(node->op)}}, node->lhs, node->rhs);
  }
  void visit_call_expr(const CallExpr * node)
  {
    print_tree("CallExpr", {}, node->callee, node->args);
  }
  void visit_index_expr(const IndexExpr * node)
  {
    print_tree("IndexExpr", {}, node->base, node->index);
  }
  void visit_dot_expr(const DotExpr * node)
  {
    print_tree("DotExpr", {{"property", node->property}}, node->object);
  }
  void visit_assign_expr(const AssignExpr * node)
  {
    print_tree("AssignExpr", {}, node->target, node->value);
  }
  void visit_range_expr(const RangeExpr * node)
  {
    std::vector<Prop> props;
    if (node->inclusive) props.emplace_back("inclusive");
    print_tree("RangeExpr", props, node->start, node->end);
  }
  void visit_case_expr(const CaseExpr * node)
  {
    print_tree("CaseExpr", {}, node->subject, node->branches);
  }
  void visit_ui_element(const UiElement * node)
  {
    print_tree("UiElement", {{"type", node->typeName}}, node->properties, node->children);
  }

  // --- Supporting nodes ---
  void visit_parameter(const Parameter * node)
  {
    print_tree("Parameter", {{"name", node->name}}, node->type);
  }
  void visit_struct_field(const StructField * node)
  {
    print_tree("StructField", {{"name", node->name}}, node->type);
  }
  void visit_else_if_clause(const ElseIfClause * node)
  {
    print_tree("ElseIfClause", {}, node->condition, node->body);
  }
  void visit_case_branch(const CaseBranch * node)
  {
    std::vector<Prop> props;
    if (node->is_wildcard()) props.emplace_back("[wildcard]");
    print_tree("CaseBranch", props, node->pattern, node->result);
  }
  void visit_where_block(const WhereBlock * node)
  {
    print_tree("WhereBlock", {}, node->statements, node->assertions);
  }
  void visit_assertion(const Assertion * node)
  {
    print_tree("Assertion", {{"op", to_string(node->op)}}, node->lhs, node->rhs);
  }
  void visit_type_annotation(const TypeAnnotation * node)
  {
    print_tree("TypeAnnotation", {{"name", node->name}}, node->params);
  }
  void visit_map_entry(const MapEntry * node)
  {
    print_tree("MapEntry", {}, node->key, node->value);
  }
  void visit_ui_property(const UiProperty * node)
  {
    print_tree("UiProperty", {{"name", node->name}}, node->value);
  }

private:
  std::ostream & os_;
  std::string prefix_;
  bool isLast_ = true;
  int depth_ = 0;

  template <typename T>
  void collect_children(std::vector<const AstNode *> & out, T * ptr)
  {
    if (ptr) out.push_back(ptr);
  }

  template <typename T>
  void collect_children(std::vector<const AstNode *> & out, gsl::span<T *> span)
  {
    for (auto * ptr : span) {
      if (ptr) out.push_back(ptr);
    }
  }

  void print_children(const std::vector<const AstNode *> & children)
  {
    if (children.empty()) return;
    const IndentScope scope(*this);
    for (size_t i = 0; i < children.size(); ++i) {
      isLast_ = (i == children.size() - 1);
      visit(children[i]);
    }
  }

  // --- Rendering ---

  // The node a dump starts from prints flush left, without a marker.
  void print_prefix()
  {
    if (depth_ == 0) return;
    os_ << prefix_ << (isLast_ ? "`-" : "|-");
  }

  struct IndentScope
  {
    AstDumper & d;
    std::string saved;

    explicit IndentScope(AstDumper & dumper) : d(dumper), saved(d.prefix_)
    {
      if (d.depth_ > 0) {
        d.prefix_ += d.isLast_ ? "  " : "| ";
      }
      ++d.depth_;
    }

    ~IndentScope()
    {
      d.prefix_ = saved;
      --d.depth_;
    }
  };
};

// ============================================================================
// Convenience Functions
// ============================================================================

inline void dump(const AstNode * node, std::ostream & os)
{
  AstDumper dumper(os);
  dumper.dump(node);
}

inline std::string dump_to_string(const AstNode * node)
{
  std::ostringstream ss;
  dump(node, ss);
  return ss.str();
}

}  // namespace seda
