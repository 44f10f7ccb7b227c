// seda/ast/json_visitor.cpp - JSON serialization implementation
//
#include "seda/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "seda/ast/ast.hpp"
#include "seda/ast/ast_enums.hpp"
#include "seda/basic/casting.hpp"
#include "seda/basic/source_manager.hpp"

namespace seda
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

json j_node(const AstNode * n);

json j_header(const AstNode * n)
{
  return json{{"type", std::string(to_string(n->get_kind()))}, {"range", j_range(n->get_range())}};
}

json j_opt(const AstNode * n) { return n ? j_node(n) : json(nullptr); }

template <typename T>
json j_list(gsl::span<T *> nodes)
{
  json arr = json::array();
  for (const auto * n : nodes) arr.push_back(j_opt(n));
  return arr;
}

json j_names(gsl::span<std::string_view> names)
{
  json arr = json::array();
  for (auto name : names) arr.push_back(std::string(name));
  return arr;
}

// ============================================================================
// Node serialization
// ============================================================================

json j_node(const AstNode * n)
{
  json j = j_header(n);

  switch (n->get_kind()) {
    // --- Expressions ---
    case NodeKind::Identifier:
      j["name"] = std::string(cast<Identifier>(n)->name);
      break;
    case NodeKind::NumberLiteral: {
      const auto * lit = cast<NumberLiteral>(n);
      j["text"] = std::string(lit->text);
      j["value"] = lit->value;
      break;
    }
    case NodeKind::StringLiteral:
      j["value"] = std::string(cast<StringLiteral>(n)->value);
      break;
    case NodeKind::InterpolatedString:
      j["parts"] = j_list(cast<InterpolatedString>(n)->parts);
      break;
    case NodeKind::BooleanLiteral:
      j["value"] = cast<BooleanLiteral>(n)->value;
      break;
    case NodeKind::NilLiteral:
      break;
    case NodeKind::ArrayLiteral:
      j["elements"] = j_list(cast<ArrayLiteral>(n)->elements);
      break;
    case NodeKind::MapLiteral:
      j["entries"] = j_list(cast<MapLiteral>(n)->entries);
      break;
    case NodeKind::FunctionLiteral: {
      const auto * fn = cast<FunctionLiteral>(n);
      j["params"] = j_list(fn->params);
      j["body"] = j_opt(fn->body);
      break;
    }
    case NodeKind::PrefixExpr: {
      const auto * p = cast<PrefixExpr>(n);
      j["op"] = std::string(to_string(p->op));
      j["operand"] = j_opt(p->operand);
      break;
    }
    case NodeKind::InfixExpr: {
      const auto * b = cast<InfixExpr>(n);
      j["op"] = std::string(to_string(b->op));
      j["lhs"] = j_opt(b->lhs);
      j["rhs"] = j_opt(b->rhs);
      break;
    }
    case NodeKind::CallExpr: {
      const auto * c = cast<CallExpr>(n);
      j["callee"] = j_opt(c->callee);
      j["args"] = j_list(c->args);
      break;
    }
    case NodeKind::IndexExpr: {
      const auto * ix = cast<IndexExpr>(n);
      j["base"] = j_opt(ix->base);
      j["index"] = j_opt(ix->index);
      break;
    }
    case NodeKind::DotExpr: {
      const auto * d = cast<DotExpr>(n);
      j["object"] = j_opt(d->object);
      j["property"] = std::string(d->property);
      break;
    }
    case NodeKind::AssignExpr: {
      const auto * a = cast<AssignExpr>(n);
      j["target"] = j_opt(a->target);
      j["value"] = j_opt(a->value);
      break;
    }
    case NodeKind::RangeExpr: {
      const auto * r = cast<RangeExpr>(n);
      j["start"] = j_opt(r->start);
      j["end"] = j_opt(r->end);
      j["inclusive"] = r->inclusive;
      break;
    }
    case NodeKind::CaseExpr: {
      const auto * c = cast<CaseExpr>(n);
      j["subject"] = j_opt(c->subject);
      j["branches"] = j_list(c->branches);
      break;
    }
    case NodeKind::UiElement: {
      const auto * ui = cast<UiElement>(n);
      j["typeName"] = std::string(ui->typeName);
      j["properties"] = j_list(ui->properties);
      j["children"] = j_list(ui->children);
      break;
    }

    // --- Statements ---
    case NodeKind::VarStmt: {
      const auto * v = cast<VarStmt>(n);
      j["names"] = j_names(v->names);
      j["isConst"] = v->isConst;
      if (v->type) j["typeAnnotation"] = j_node(v->type);
      j["value"] = j_opt(v->value);
      break;
    }
    case NodeKind::FnStmt: {
      const auto * f = cast<FnStmt>(n);
      j["name"] = std::string(f->name);
      if (f->receiver) j["receiver"] = std::string(*f->receiver);
      j["params"] = j_list(f->params);
      if (f->returnType) j["returnType"] = j_node(f->returnType);
      j["body"] = j_opt(f->body);
      if (f->where) j["where"] = j_node(f->where);
      break;
    }
    case NodeKind::StructStmt: {
      const auto * s = cast<StructStmt>(n);
      j["name"] = std::string(s->name);
      j["fields"] = j_list(s->fields);
      break;
    }
    case NodeKind::TypeStmt: {
      const auto * t = cast<TypeStmt>(n);
      j["name"] = std::string(t->name);
      j["aliased"] = j_opt(t->aliased);
      break;
    }
    case NodeKind::ModuleStmt: {
      const auto * m = cast<ModuleStmt>(n);
      j["name"] = std::string(m->name);
      j["body"] = j_opt(m->body);
      break;
    }
    case NodeKind::UsingStmt: {
      const auto * u = cast<UsingStmt>(n);
      j["path"] = std::string(u->path);
      if (u->alias) j["alias"] = std::string(*u->alias);
      break;
    }
    case NodeKind::ComponentStmt: {
      const auto * c = cast<ComponentStmt>(n);
      j["name"] = std::string(c->name);
      j["params"] = j_list(c->params);
      j["body"] = j_list(c->body);
      j["root"] = j_opt(c->root);
      break;
    }
    case NodeKind::IfStmt: {
      const auto * s = cast<IfStmt>(n);
      j["condition"] = j_opt(s->condition);
      j["consequence"] = j_opt(s->consequence);
      j["elseIfs"] = j_list(s->elseIfs);
      if (s->alternative) j["alternative"] = j_node(s->alternative);
      break;
    }
    case NodeKind::CaseStmt: {
      const auto * c = cast<CaseStmt>(n);
      j["subject"] = j_opt(c->subject);
      j["branches"] = j_list(c->branches);
      break;
    }
    case NodeKind::ForStmt: {
      const auto * f = cast<ForStmt>(n);
      if (f->indexName) j["indexName"] = std::string(*f->indexName);
      j["valueName"] = std::string(f->valueName);
      j["iterable"] = j_opt(f->iterable);
      j["body"] = j_opt(f->body);
      break;
    }
    case NodeKind::CheckStmt: {
      const auto * c = cast<CheckStmt>(n);
      if (c->label) j["label"] = std::string(*c->label);
      j["statements"] = j_list(c->statements);
      j["assertions"] = j_list(c->assertions);
      break;
    }
    case NodeKind::ReturnStmt:
      j["values"] = j_list(cast<ReturnStmt>(n)->values);
      break;
    case NodeKind::BreakStmt:
      break;
    case NodeKind::ExprStmt:
      j["expr"] = j_opt(cast<ExprStmt>(n)->expr);
      break;
    case NodeKind::BlockStmt:
      j["statements"] = j_list(cast<BlockStmt>(n)->statements);
      break;

    // --- Supporting nodes ---
    case NodeKind::Parameter: {
      const auto * p = cast<Parameter>(n);
      j["name"] = std::string(p->name);
      if (p->type) j["typeAnnotation"] = j_node(p->type);
      break;
    }
    case NodeKind::StructField: {
      const auto * f = cast<StructField>(n);
      j["name"] = std::string(f->name);
      j["typeAnnotation"] = j_opt(f->type);
      break;
    }
    case NodeKind::ElseIfClause: {
      const auto * e = cast<ElseIfClause>(n);
      j["condition"] = j_opt(e->condition);
      j["body"] = j_opt(e->body);
      break;
    }
    case NodeKind::CaseBranch: {
      const auto * b = cast<CaseBranch>(n);
      j["pattern"] = j_opt(b->pattern);
      j["result"] = j_opt(b->result);
      j["isWildcard"] = b->is_wildcard();
      break;
    }
    case NodeKind::WhereBlock: {
      const auto * w = cast<WhereBlock>(n);
      j["statements"] = j_list(w->statements);
      j["assertions"] = j_list(w->assertions);
      break;
    }
    case NodeKind::Assertion: {
      const auto * a = cast<Assertion>(n);
      j["op"] = std::string(to_string(a->op));
      j["lhs"] = j_opt(a->lhs);
      if (a->rhs) j["rhs"] = j_node(a->rhs);
      break;
    }
    case NodeKind::TypeAnnotation: {
      const auto * t = cast<TypeAnnotation>(n);
      j["name"] = std::string(t->name);
      j["params"] = j_list(t->params);
      break;
    }
    case NodeKind::MapEntry: {
      const auto * e = cast<MapEntry>(n);
      j["key"] = j_opt(e->key);
      j["value"] = j_opt(e->value);
      break;
    }
    case NodeKind::UiProperty: {
      const auto * p = cast<UiProperty>(n);
      j["name"] = std::string(p->name);
      j["value"] = j_opt(p->value);
      break;
    }

    case NodeKind::Program:
      j["statements"] = j_list(cast<Program>(n)->statements);
      break;
  }

  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};
  return j_node(node);
}

nlohmann::json to_json(const Program * program)
{
  if (!program)
    return nlohmann::json{
      {"type", "Program"}, {"range", j_range({})}, {"statements", nlohmann::json::array()}};
  return j_node(program);
}

}  // namespace seda
