// seda/syntax/parser_statements.cpp - Statement grammar and block constructs
//
#include <fmt/core.h>

#include <string>
#include <utility>

#include "seda/syntax/lexer.hpp"
#include "seda/syntax/parser.hpp"

namespace seda::syntax
{

// ============================================================================
// Program
// ============================================================================

Program * Parser::parse_program()
{
  reset();
  const Token start = cur_;
  std::vector<Stmt *> statements;

  while (!cur_is(TokenKind::Eof)) {
    if (cur_is(TokenKind::Semicolon)) {
      next_token();
      continue;
    }
    if (Stmt * stmt = parse_statement_with_recovery()) {
      statements.push_back(stmt);
    }
    next_token();
  }

  auto * program = ast_.create<Program>(join_ranges(start.range, cur_.range));
  program->statements = to_span(statements);
  return program;
}

// ============================================================================
// Classification helpers
// ============================================================================

bool Parser::is_statement_start(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Var:
    case TokenKind::Const:
    case TokenKind::Fn:
    case TokenKind::Struct:
    case TokenKind::Type:
    case TokenKind::Module:
    case TokenKind::Using:
    case TokenKind::Component:
    case TokenKind::If:
    case TokenKind::Case:
    case TokenKind::For:
    case TokenKind::Check:
    case TokenKind::Return:
    case TokenKind::Break:
      return true;
    default:
      return false;
  }
}

/// Keywords whose construct is closed by its own `end`.
bool Parser::is_block_opener(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Fn:
    case TokenKind::Struct:
    case TokenKind::Module:
    case TokenKind::Component:
    case TokenKind::If:
    case TokenKind::Case:
    case TokenKind::For:
    case TokenKind::Check:
      return true;
    default:
      return false;
  }
}

bool Parser::at_block_terminator() const noexcept
{
  return cur_is(TokenKind::End) || cur_is(TokenKind::Eof) || cur_is(TokenKind::Where) ||
         cur_is(TokenKind::Else);
}

std::optional<std::string_view> Parser::expect_declared_name(std::string_view context)
{
  if (peek_is(TokenKind::Ident)) {
    next_token();
    return intern(cur_.text);
  }
  if (is_keyword(peek_.kind)) {
    next_token();
    validate_identifier(cur_.text, context);
    return std::nullopt;
  }
  peek_error(TokenKind::Ident);
  return std::nullopt;
}

bool Parser::expect_block_end()
{
  if (cur_is(TokenKind::End)) {
    return true;
  }
  // EOF has been reported by the block parser already.
  if (!cur_is(TokenKind::Eof)) {
    record_expected({TokenKind::End}, cur_);
  }
  return false;
}

// ============================================================================
// Statement dispatch
// ============================================================================

Stmt * Parser::parse_statement()
{
  const DepthGuard guard(*this);
  if (guard.exceeded()) {
    report_depth_exceeded();
    return nullptr;
  }

  const TokenKind start = cur_.kind;
  const size_t errors_before = errors_.size();
  Stmt * stmt = nullptr;

  switch (start) {
    case TokenKind::Var:
    case TokenKind::Const:
      stmt = parse_var_statement();
      break;
    case TokenKind::Fn:
      // `fn(` opens an anonymous function used as an expression.
      stmt = peek_is(TokenKind::LParen) ? parse_expression_statement() : parse_fn_statement();
      break;
    case TokenKind::Struct:
      stmt = parse_struct_statement();
      break;
    case TokenKind::Type:
      stmt = parse_type_statement();
      break;
    case TokenKind::Module:
      stmt = parse_module_statement();
      break;
    case TokenKind::Using:
      stmt = parse_using_statement();
      break;
    case TokenKind::Component:
      stmt = parse_component_statement();
      break;
    case TokenKind::If:
      stmt = parse_if_statement();
      break;
    case TokenKind::Case:
      stmt = parse_case_statement();
      break;
    case TokenKind::For:
      stmt = parse_for_statement();
      break;
    case TokenKind::Return:
      stmt = parse_return_statement();
      break;
    case TokenKind::Break:
      stmt = parse_break_statement();
      break;
    case TokenKind::Check:
      stmt = parse_check_statement();
      break;
    case TokenKind::Comment:
    case TokenKind::Where:
    case TokenKind::Else:
    case TokenKind::End:
      return nullptr;
    default:
      stmt = parse_expression_statement();
      break;
  }

  if (stmt == nullptr && errors_.size() == errors_before && !halted_) {
    raise_fault(fmt::format("'{}' statement produced no node and no diagnostic", to_string(start)));
  }
  return stmt;
}

// ============================================================================
// Declarations
// ============================================================================

Stmt * Parser::parse_var_statement()
{
  const Token start = cur_;
  const bool is_const = cur_is(TokenKind::Const);
  const std::string_view context = is_const ? "constant declaration" : "variable declaration";

  std::vector<std::string_view> names;
  auto name = expect_declared_name(context);
  if (!name) {
    return nullptr;
  }
  names.push_back(*name);

  while (peek_is(TokenKind::Comma)) {
    next_token();
    name = expect_declared_name(context);
    if (!name) {
      return nullptr;
    }
    names.push_back(*name);
  }

  TypeAnnotation * type = nullptr;
  if (peek_is(TokenKind::Colon)) {
    next_token();
    next_token();
    type = parse_type_annotation();
    if (!type) {
      return nullptr;
    }
  }

  if (!expect_peek(TokenKind::Assign)) {
    return nullptr;
  }
  next_token();
  Expr * value = parse_expression(Precedence::Lowest);
  if (!value) {
    return nullptr;
  }

  auto * stmt = ast_.create<VarStmt>(is_const, range_from(start));
  stmt->names = to_span(names);
  stmt->type = type;
  stmt->value = value;
  return stmt;
}

Stmt * Parser::parse_fn_statement()
{
  const Token start = cur_;

  std::optional<std::string_view> receiver;
  auto name = expect_declared_name("function name");
  if (!name) {
    return nullptr;
  }
  if (peek_is(TokenKind::Dot)) {
    next_token();
    receiver = name;
    name = expect_declared_name("method name");
    if (!name) {
      return nullptr;
    }
  }

  if (!expect_peek(TokenKind::LParen)) {
    return nullptr;
  }
  auto params = parse_function_parameters();
  if (!params) {
    return nullptr;
  }

  TypeAnnotation * return_type = nullptr;
  if (peek_is(TokenKind::Colon)) {
    next_token();
    next_token();
    return_type = parse_type_annotation();
    if (!return_type) {
      return nullptr;
    }
  }

  if (!expect_peek_with_recovery(TokenKind::DoubleColon)) {
    return nullptr;
  }
  BlockStmt * body = parse_block_statement();

  WhereBlock * where = nullptr;
  if (cur_is(TokenKind::Where)) {
    where = parse_where_block();
    if (!where) {
      return nullptr;
    }
  }
  if (!expect_block_end()) {
    return nullptr;
  }

  auto * fn = ast_.create<FnStmt>(*name, range_from(start));
  fn->receiver = receiver;
  fn->params = to_span(*params);
  fn->returnType = return_type;
  fn->body = body;
  fn->where = where;
  return fn;
}

Stmt * Parser::parse_struct_statement()
{
  const Token start = cur_;
  auto name = expect_declared_name("struct name");
  if (!name || !expect_peek_with_recovery(TokenKind::DoubleColon)) {
    return nullptr;
  }

  std::vector<StructField *> fields;
  next_token();
  while (!cur_is(TokenKind::End)) {
    if (cur_is(TokenKind::Eof)) {
      report_unterminated_block();
      return nullptr;
    }
    if (cur_is(TokenKind::Comma) || cur_is(TokenKind::Semicolon)) {
      next_token();
      continue;
    }
    if (!cur_is(TokenKind::Ident)) {
      record_expected({TokenKind::Ident, TokenKind::End}, cur_);
      return nullptr;
    }

    const Token field_start = cur_;
    if (!expect_peek(TokenKind::Colon)) {
      return nullptr;
    }
    next_token();
    TypeAnnotation * type = parse_type_annotation();
    if (!type) {
      return nullptr;
    }
    fields.push_back(
      ast_.create<StructField>(intern(field_start.text), type, range_from(field_start)));
    next_token();
  }

  auto * stmt = ast_.create<StructStmt>(*name, range_from(start));
  stmt->fields = to_span(fields);
  return stmt;
}

Stmt * Parser::parse_type_statement()
{
  const Token start = cur_;
  auto name = expect_declared_name("type name");
  if (!name || !expect_peek(TokenKind::Assign)) {
    return nullptr;
  }
  next_token();
  TypeAnnotation * aliased = parse_type_annotation();
  if (!aliased) {
    return nullptr;
  }
  return ast_.create<TypeStmt>(*name, aliased, range_from(start));
}

Stmt * Parser::parse_module_statement()
{
  const Token start = cur_;
  auto name = expect_declared_name("module name");
  if (!name || !expect_peek_with_recovery(TokenKind::DoubleColon)) {
    return nullptr;
  }
  BlockStmt * body = parse_block_statement();
  if (!expect_block_end()) {
    return nullptr;
  }
  auto * stmt = ast_.create<ModuleStmt>(*name, range_from(start));
  stmt->body = body;
  return stmt;
}

Stmt * Parser::parse_using_statement()
{
  const Token start = cur_;
  if (!expect_peek(TokenKind::String)) {
    return nullptr;
  }
  const std::string_view path = intern(unescape_string(cur_.text));

  std::optional<std::string_view> alias;
  if (peek_is(TokenKind::As)) {
    next_token();
    alias = expect_declared_name("module alias");
    if (!alias) {
      return nullptr;
    }
  }

  auto * stmt = ast_.create<UsingStmt>(path, range_from(start));
  stmt->alias = alias;
  return stmt;
}

Stmt * Parser::parse_component_statement()
{
  const Token start = cur_;
  auto name = expect_declared_name("component name");
  if (!name || !expect_peek(TokenKind::LParen)) {
    return nullptr;
  }
  auto params = parse_function_parameters();
  if (!params || !expect_peek_with_recovery(TokenKind::DoubleColon)) {
    return nullptr;
  }

  BlockStmt * body = parse_block_statement();
  if (!expect_block_end()) {
    return nullptr;
  }

  // The trailing UI element expression is the component's root.
  std::vector<Stmt *> items(body->statements.begin(), body->statements.end());
  UiElement * root = nullptr;
  if (!items.empty()) {
    if (auto * last = dyn_cast<ExprStmt>(items.back())) {
      root = dyn_cast<UiElement>(last->expr);
    }
  }
  if (root) {
    items.pop_back();
  } else {
    record_error(
      ParseErrorKind::MissingRootElement,
      fmt::format("component '{}' has no root UI element", *name), cur_);
  }

  auto * stmt = ast_.create<ComponentStmt>(*name, range_from(start));
  stmt->params = to_span(*params);
  stmt->body = to_span(items);
  stmt->root = root;
  return stmt;
}

// ============================================================================
// Control flow
// ============================================================================

Stmt * Parser::parse_if_statement()
{
  const Token start = cur_;
  next_token();
  Expr * condition = parse_expression(Precedence::Lowest);
  if (!condition || !expect_peek_with_recovery(TokenKind::DoubleColon)) {
    return nullptr;
  }
  BlockStmt * consequence = parse_block_statement();

  std::vector<ElseIfClause *> else_ifs;
  BlockStmt * alternative = nullptr;
  while (cur_is(TokenKind::Else)) {
    if (peek_is(TokenKind::If)) {
      const Token clause_start = cur_;
      next_token();
      next_token();
      Expr * clause_condition = parse_expression(Precedence::Lowest);
      if (!clause_condition || !expect_peek_with_recovery(TokenKind::DoubleColon)) {
        return nullptr;
      }
      BlockStmt * clause_body = parse_block_statement();
      else_ifs.push_back(
        ast_.create<ElseIfClause>(clause_condition, clause_body, range_from(clause_start)));
      continue;
    }

    if (!expect_peek_with_recovery(TokenKind::DoubleColon)) {
      return nullptr;
    }
    alternative = parse_block_statement();
    break;
  }

  if (!expect_block_end()) {
    return nullptr;
  }

  auto * stmt = ast_.create<IfStmt>(condition, range_from(start));
  stmt->consequence = consequence;
  stmt->elseIfs = to_span(else_ifs);
  stmt->alternative = alternative;
  return stmt;
}

Stmt * Parser::parse_case_statement()
{
  const Token start = cur_;
  next_token();
  Expr * subject = parse_expression(Precedence::Lowest);
  if (!subject || !expect_peek_with_recovery(TokenKind::DoubleColon)) {
    return nullptr;
  }

  std::vector<CaseBranch *> branches;
  if (!parse_case_branches(branches)) {
    return nullptr;
  }
  auto * stmt = ast_.create<CaseStmt>(subject, range_from(start));
  stmt->branches = to_span(branches);
  return stmt;
}

bool Parser::parse_case_branches(std::vector<CaseBranch *> & branches)
{
  next_token();
  while (!cur_is(TokenKind::End)) {
    if (cur_is(TokenKind::Eof)) {
      report_unterminated_block();
      return false;
    }
    if (cur_is(TokenKind::Comma) || cur_is(TokenKind::Semicolon)) {
      next_token();
      continue;
    }

    const Token branch_start = cur_;
    Expr * pattern = parse_expression(Precedence::Lowest);
    if (!pattern || !expect_peek(TokenKind::FatArrow)) {
      return false;
    }
    next_token();
    Expr * result = parse_expression(Precedence::Lowest);
    if (!result) {
      return false;
    }
    branches.push_back(ast_.create<CaseBranch>(pattern, result, range_from(branch_start)));
    next_token();
  }
  return true;
}

Stmt * Parser::parse_for_statement()
{
  const Token start = cur_;
  auto first = expect_declared_name("loop variable");
  if (!first) {
    return nullptr;
  }

  std::optional<std::string_view> index_name;
  std::string_view value_name = *first;
  if (peek_is(TokenKind::Comma)) {
    next_token();
    auto second = expect_declared_name("loop variable");
    if (!second) {
      return nullptr;
    }
    index_name = first;
    value_name = *second;
  }

  if (!expect_peek(TokenKind::In)) {
    return nullptr;
  }
  next_token();
  Expr * iterable = parse_expression(Precedence::Lowest);
  if (!iterable || !expect_peek_with_recovery(TokenKind::DoubleColon)) {
    return nullptr;
  }
  BlockStmt * body = parse_block_statement();
  if (!expect_block_end()) {
    return nullptr;
  }

  auto * stmt = ast_.create<ForStmt>(value_name, range_from(start));
  stmt->indexName = index_name;
  stmt->iterable = iterable;
  stmt->body = body;
  return stmt;
}

Stmt * Parser::parse_return_statement()
{
  const Token start = cur_;
  std::vector<Expr *> values;

  const bool bare = peek_is(TokenKind::Semicolon) || peek_is(TokenKind::End) ||
                    peek_is(TokenKind::Eof) || peek_is(TokenKind::Else) ||
                    peek_is(TokenKind::Where);
  if (!bare) {
    next_token();
    Expr * value = parse_expression(Precedence::Lowest);
    if (!value) {
      return nullptr;
    }
    values.push_back(value);
    while (peek_is(TokenKind::Comma)) {
      next_token();
      next_token();
      value = parse_expression(Precedence::Lowest);
      if (!value) {
        return nullptr;
      }
      values.push_back(value);
    }
  }
  return ast_.create<ReturnStmt>(to_span(values), range_from(start));
}

Stmt * Parser::parse_break_statement() { return ast_.create<BreakStmt>(range_from(cur_)); }

Stmt * Parser::parse_expression_statement()
{
  const Token start = cur_;
  Expr * expr = parse_expression(Precedence::Lowest);
  if (!expr) {
    return nullptr;
  }
  return ast_.create<ExprStmt>(expr, range_from(start));
}

BlockStmt * Parser::parse_block_statement()
{
  if (options_.recover_in_blocks) {
    return parse_block_statement_with_recovery();
  }

  const Token start = cur_;
  std::vector<Stmt *> statements;

  next_token();
  while (!at_block_terminator()) {
    if (cur_is(TokenKind::Semicolon)) {
      next_token();
      continue;
    }
    if (Stmt * stmt = parse_statement()) {
      statements.push_back(stmt);
    }
    next_token();
  }

  if (cur_is(TokenKind::Eof)) {
    report_unterminated_block();
  }
  return ast_.create<BlockStmt>(to_span(statements), range_from(start));
}

// ============================================================================
// Tests: check and where
// ============================================================================

Stmt * Parser::parse_check_statement()
{
  const Token start = cur_;
  std::optional<std::string_view> label;
  if (peek_is(TokenKind::String)) {
    next_token();
    label = intern(unescape_string(cur_.text));
  }
  if (!expect_peek_with_recovery(TokenKind::DoubleColon)) {
    return nullptr;
  }

  std::vector<Stmt *> statements;
  std::vector<Assertion *> assertions;
  if (!parse_test_body(statements, assertions)) {
    return nullptr;
  }

  auto * stmt = ast_.create<CheckStmt>(range_from(start));
  stmt->label = label;
  stmt->statements = to_span(statements);
  stmt->assertions = to_span(assertions);
  return stmt;
}

WhereBlock * Parser::parse_where_block()
{
  const Token start = cur_;
  if (!expect_peek_with_recovery(TokenKind::DoubleColon)) {
    return nullptr;
  }

  std::vector<Stmt *> statements;
  std::vector<Assertion *> assertions;
  if (!parse_test_body(statements, assertions)) {
    return nullptr;
  }

  auto * block = ast_.create<WhereBlock>(range_from(start));
  block->statements = to_span(statements);
  block->assertions = to_span(assertions);
  return block;
}

std::optional<AssertionOp> Parser::peek_assertion_op() const noexcept
{
  switch (peek_.kind) {
    case TokenKind::Is:
      return AssertionOp::Is;
    case TokenKind::IsA:
      return AssertionOp::IsA;
    case TokenKind::Contains:
      return AssertionOp::Contains;
    case TokenKind::Ident:
      // isNot, isGreater, startsWith, ... are contextual.
      return assertion_op_from_string(peek_.text);
    default:
      return std::nullopt;
  }
}

bool Parser::parse_test_body(std::vector<Stmt *> & stmts, std::vector<Assertion *> & assertions)
{
  next_token();
  while (!cur_is(TokenKind::End)) {
    if (cur_is(TokenKind::Eof)) {
      report_unterminated_block();
      return false;
    }
    if (cur_is(TokenKind::Semicolon)) {
      next_token();
      continue;
    }

    if (is_statement_start(cur_.kind) && !cur_is(TokenKind::Case)) {
      Stmt * stmt = parse_statement();
      if (!stmt) {
        return false;
      }
      stmts.push_back(stmt);
      next_token();
      continue;
    }

    const Token item_start = cur_;
    Expr * lhs = parse_expression(Precedence::Lowest);
    if (!lhs) {
      return false;
    }

    if (const auto op = peek_assertion_op()) {
      next_token();
      Expr * rhs = nullptr;
      if (!is_unary(*op)) {
        next_token();
        rhs = parse_expression(Precedence::Lowest);
        if (!rhs) {
          return false;
        }
      }
      assertions.push_back(ast_.create<Assertion>(lhs, *op, rhs, range_from(item_start)));
    } else {
      stmts.push_back(ast_.create<ExprStmt>(lhs, range_from(item_start)));
    }
    next_token();
  }
  return true;
}

// ============================================================================
// Parameters and type annotations
// ============================================================================

std::optional<std::vector<Parameter *>> Parser::parse_function_parameters()
{
  std::vector<Parameter *> params;

  if (peek_is(TokenKind::RParen)) {
    next_token();
    return params;
  }

  next_token();
  Parameter * param = parse_parameter();
  if (!param) {
    return std::nullopt;
  }
  params.push_back(param);

  while (peek_is(TokenKind::Comma)) {
    next_token();
    next_token();
    param = parse_parameter();
    if (!param) {
      return std::nullopt;
    }
    params.push_back(param);
  }

  if (!expect_peek(TokenKind::RParen)) {
    return std::nullopt;
  }
  return params;
}

Parameter * Parser::parse_parameter()
{
  const Token start = cur_;
  if (!cur_is(TokenKind::Ident)) {
    if (is_keyword(cur_.kind)) {
      validate_identifier(cur_.text, "parameter name");
    } else {
      record_expected({TokenKind::Ident}, cur_);
    }
    return nullptr;
  }

  TypeAnnotation * type = nullptr;
  if (peek_is(TokenKind::Colon)) {
    next_token();
    next_token();
    type = parse_type_annotation();
    if (!type) {
      return nullptr;
    }
  }
  return ast_.create<Parameter>(intern(start.text), type, range_from(start));
}

TypeAnnotation * Parser::parse_type_annotation()
{
  const DepthGuard guard(*this);
  if (guard.exceeded()) {
    report_depth_exceeded();
    return nullptr;
  }

  const Token start = cur_;
  switch (cur_.kind) {
    case TokenKind::Ident:
    case TokenKind::NumberType:
    case TokenKind::StringType:
    case TokenKind::BooleanType:
      break;
    default:
      record_expected(
        {TokenKind::Ident, TokenKind::NumberType, TokenKind::StringType, TokenKind::BooleanType},
        cur_);
      return nullptr;
  }

  auto * type = ast_.create<TypeAnnotation>(intern(cur_.text));
  if (peek_is(TokenKind::LBracket)) {
    next_token();
    std::vector<TypeAnnotation *> params;
    while (true) {
      next_token();
      TypeAnnotation * param = parse_type_annotation();
      if (!param) {
        return nullptr;
      }
      params.push_back(param);
      if (!peek_is(TokenKind::Comma)) {
        break;
      }
      next_token();
    }
    if (!expect_peek(TokenKind::RBracket)) {
      return nullptr;
    }
    type->params = to_span(params);
  }
  type->range_ = range_from(start);
  return type;
}

}  // namespace seda::syntax
