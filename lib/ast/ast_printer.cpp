// seda/ast/ast_printer.cpp - Canonical source printer
//
#include "seda/ast/ast_printer.hpp"

#include <cstddef>
#include <gsl/span>
#include <string>
#include <string_view>

#include "seda/ast/ast.hpp"
#include "seda/ast/ast_enums.hpp"
#include "seda/basic/casting.hpp"
#include "seda/syntax/lexer.hpp"

namespace seda
{

namespace
{

[[nodiscard]] std::string serialize(const AstNode * node);

[[nodiscard]] std::string quoted(std::string_view text)
{
  return "\"" + syntax::escape_string(text) + "\"";
}

template <typename T>
[[nodiscard]] std::string join(gsl::span<T *> nodes, std::string_view sep)
{
  std::string out;
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += serialize(nodes[i]);
  }
  return out;
}

/// " s1; s2 " between a block opener and its terminator, or a single space.
[[nodiscard]] std::string body_text(gsl::span<Stmt *> stmts)
{
  if (stmts.empty()) {
    return " ";
  }
  return " " + join(stmts, "; ") + " ";
}

[[nodiscard]] std::string body_text(const BlockStmt * block)
{
  return block ? body_text(block->statements) : std::string(" ");
}

/// Setup statements then assertions, as inside `check` and `where`.
[[nodiscard]] std::string test_body_text(gsl::span<Stmt *> stmts, gsl::span<Assertion *> asserts)
{
  std::string items = join(stmts, "; ");
  if (!stmts.empty() && !asserts.empty()) {
    items += "; ";
  }
  items += join(asserts, "; ");
  return items.empty() ? std::string(" ") : " " + items + " ";
}

[[nodiscard]] std::string params_text(gsl::span<Parameter *> params)
{
  return "(" + join(params, ", ") + ")";
}

[[nodiscard]] std::string case_text(const Expr * subject, gsl::span<CaseBranch *> branches)
{
  std::string out = "case " + serialize(subject) + " ::";
  out += branches.empty() ? " " : " " + join(branches, "; ") + " ";
  return out + "end";
}

[[nodiscard]] std::string serialize_expr(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::Identifier:
      return std::string(cast<Identifier>(expr)->name);
    case NodeKind::NumberLiteral:
      return std::string(cast<NumberLiteral>(expr)->text);
    case NodeKind::StringLiteral:
      return quoted(cast<StringLiteral>(expr)->value);
    case NodeKind::InterpolatedString: {
      const auto * e = cast<InterpolatedString>(expr);
      std::string out = "\"";
      for (const auto * part : e->parts) {
        if (const auto * text = dyn_cast<StringLiteral>(part)) {
          out += syntax::escape_string(text->value);
        } else {
          out += "#{" + syntax::escape_string(serialize(part)) + "}";
        }
      }
      return out + "\"";
    }
    case NodeKind::BooleanLiteral:
      return cast<BooleanLiteral>(expr)->value ? "true" : "false";
    case NodeKind::NilLiteral:
      return "nil";
    case NodeKind::ArrayLiteral:
      return "[" + join(cast<ArrayLiteral>(expr)->elements, ", ") + "]";
    case NodeKind::MapLiteral:
      return "{" + join(cast<MapLiteral>(expr)->entries, ", ") + "}";
    case NodeKind::FunctionLiteral: {
      const auto * e = cast<FunctionLiteral>(expr);
      return "fn" + params_text(e->params) + " ::" + body_text(e->body) + "end";
    }
    case NodeKind::PrefixExpr: {
      const auto * e = cast<PrefixExpr>(expr);
      return "(" + std::string(to_string(e->op)) + serialize(e->operand) + ")";
    }
    case NodeKind::InfixExpr: {
      const auto * e = cast<InfixExpr>(expr);
      return "(" + serialize(e->lhs) + " " + std::string(to_string(e->op)) + " " +
             serialize(e->rhs) + ")";
    }
    case NodeKind::CallExpr: {
      const auto * e = cast<CallExpr>(expr);
      return serialize(e->callee) + "(" + join(e->args, ", ") + ")";
    }
    case NodeKind::IndexExpr: {
      const auto * e = cast<IndexExpr>(expr);
      return "(" + serialize(e->base) + "[" + serialize(e->index) + "])";
    }
    case NodeKind::DotExpr: {
      const auto * e = cast<DotExpr>(expr);
      return serialize(e->object) + "." + std::string(e->property);
    }
    case NodeKind::AssignExpr: {
      const auto * e = cast<AssignExpr>(expr);
      return serialize(e->target) + " = " + serialize(e->value);
    }
    case NodeKind::RangeExpr: {
      const auto * e = cast<RangeExpr>(expr);
      return "(" + serialize(e->start) + (e->inclusive ? "..." : "..") + serialize(e->end) + ")";
    }
    case NodeKind::CaseExpr: {
      const auto * e = cast<CaseExpr>(expr);
      return case_text(e->subject, e->branches);
    }
    case NodeKind::UiElement: {
      const auto * e = cast<UiElement>(expr);
      std::string items = join(e->properties, ", ");
      if (!e->properties.empty() && !e->children.empty()) {
        items += ", ";
      }
      items += join(e->children, ", ");
      return std::string(e->typeName) + " {" + (items.empty() ? " " : " " + items + " ") + "}";
    }
    default:
      break;
  }
  return {};
}

[[nodiscard]] std::string serialize_stmt(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::VarStmt: {
      const auto * s = cast<VarStmt>(stmt);
      std::string out = s->isConst ? "const " : "var ";
      for (std::size_t i = 0; i < s->names.size(); ++i) {
        if (i > 0) out += ", ";
        out += s->names[i];
      }
      if (s->type) out += ": " + serialize(s->type);
      if (s->value) out += " = " + serialize(s->value);
      return out;
    }
    case NodeKind::FnStmt: {
      const auto * s = cast<FnStmt>(stmt);
      std::string out = "fn ";
      if (s->receiver) out += std::string(*s->receiver) + ".";
      out += std::string(s->name) + params_text(s->params);
      if (s->returnType) out += ": " + serialize(s->returnType);
      out += " ::" + body_text(s->body);
      if (s->where) out += serialize(s->where) + " ";
      return out + "end";
    }
    case NodeKind::StructStmt: {
      const auto * s = cast<StructStmt>(stmt);
      std::string out = "struct " + std::string(s->name) + " ::";
      out += s->fields.empty() ? " " : " " + join(s->fields, ", ") + " ";
      return out + "end";
    }
    case NodeKind::TypeStmt: {
      const auto * s = cast<TypeStmt>(stmt);
      return "type " + std::string(s->name) + " = " + serialize(s->aliased);
    }
    case NodeKind::ModuleStmt: {
      const auto * s = cast<ModuleStmt>(stmt);
      return "module " + std::string(s->name) + " ::" + body_text(s->body) + "end";
    }
    case NodeKind::UsingStmt: {
      const auto * s = cast<UsingStmt>(stmt);
      std::string out = "using " + quoted(s->path);
      if (s->alias) out += " as " + std::string(*s->alias);
      return out;
    }
    case NodeKind::ComponentStmt: {
      const auto * s = cast<ComponentStmt>(stmt);
      std::string out = "component " + std::string(s->name) + params_text(s->params) + " :: ";
      for (const auto * item : s->body) {
        out += serialize(item) + "; ";
      }
      if (s->root) out += serialize(s->root) + " ";
      return out + "end";
    }
    case NodeKind::IfStmt: {
      const auto * s = cast<IfStmt>(stmt);
      std::string out = "if " + serialize(s->condition) + " ::" + body_text(s->consequence);
      for (const auto * clause : s->elseIfs) {
        out += serialize(clause) + " ";
      }
      if (s->alternative) out += "else ::" + body_text(s->alternative);
      return out + "end";
    }
    case NodeKind::CaseStmt: {
      const auto * s = cast<CaseStmt>(stmt);
      return case_text(s->subject, s->branches);
    }
    case NodeKind::ForStmt: {
      const auto * s = cast<ForStmt>(stmt);
      std::string out = "for ";
      if (s->indexName) out += std::string(*s->indexName) + ", ";
      out += std::string(s->valueName) + " in " + serialize(s->iterable);
      return out + " ::" + body_text(s->body) + "end";
    }
    case NodeKind::CheckStmt: {
      const auto * s = cast<CheckStmt>(stmt);
      std::string out = "check ";
      if (s->label) out += quoted(*s->label) + " ";
      return out + "::" + test_body_text(s->statements, s->assertions) + "end";
    }
    case NodeKind::ReturnStmt: {
      const auto * s = cast<ReturnStmt>(stmt);
      return s->values.empty() ? std::string("return") : "return " + join(s->values, ", ");
    }
    case NodeKind::BreakStmt:
      return "break";
    case NodeKind::ExprStmt:
      return serialize(cast<ExprStmt>(stmt)->expr);
    case NodeKind::BlockStmt:
      return join(cast<BlockStmt>(stmt)->statements, "; ");
    default:
      break;
  }
  return {};
}

[[nodiscard]] std::string serialize(const AstNode * node)
{
  if (!node) {
    return {};
  }
  if (const auto * e = dyn_cast<Expr>(node)) {
    return serialize_expr(e);
  }
  if (const auto * s = dyn_cast<Stmt>(node)) {
    return serialize_stmt(s);
  }

  switch (node->get_kind()) {
    case NodeKind::Parameter: {
      const auto * p = cast<Parameter>(node);
      return p->type ? std::string(p->name) + ": " + serialize(p->type) : std::string(p->name);
    }
    case NodeKind::StructField: {
      const auto * f = cast<StructField>(node);
      return std::string(f->name) + ": " + serialize(f->type);
    }
    case NodeKind::ElseIfClause: {
      const auto * c = cast<ElseIfClause>(node);
      std::string text = "else if " + serialize(c->condition) + " ::" + body_text(c->body);
      text.pop_back();  // the caller adds the separator
      return text;
    }
    case NodeKind::CaseBranch: {
      const auto * b = cast<CaseBranch>(node);
      return serialize(b->pattern) + " => " + serialize(b->result);
    }
    case NodeKind::WhereBlock: {
      const auto * w = cast<WhereBlock>(node);
      std::string text = "where ::" + test_body_text(w->statements, w->assertions);
      text.pop_back();
      return text;
    }
    case NodeKind::Assertion: {
      const auto * a = cast<Assertion>(node);
      std::string out = serialize(a->lhs) + " " + std::string(to_string(a->op));
      if (a->rhs) out += " " + serialize(a->rhs);
      return out;
    }
    case NodeKind::TypeAnnotation: {
      const auto * t = cast<TypeAnnotation>(node);
      std::string out(t->name);
      if (t->is_generic()) out += "[" + join(t->params, ", ") + "]";
      return out;
    }
    case NodeKind::MapEntry: {
      const auto * e = cast<MapEntry>(node);
      return serialize(e->key) + ": " + serialize(e->value);
    }
    case NodeKind::UiProperty: {
      const auto * p = cast<UiProperty>(node);
      return std::string(p->name) + ": " + serialize(p->value);
    }
    case NodeKind::Program:
      return join(cast<Program>(node)->statements, "\n");
    default:
      break;
  }
  return {};
}

}  // namespace

std::string to_source(const AstNode * node) { return serialize(node); }

}  // namespace seda
