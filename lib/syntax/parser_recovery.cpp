// seda/syntax/parser_recovery.cpp - Error recovery and the fault barrier
//
#include <fmt/core.h>

#include "seda/syntax/parser.hpp"

namespace seda::syntax
{

namespace
{
/// How far expect_peek_with_recovery looks for the expected token.
constexpr size_t k_recovery_lookahead = 5;
}  // namespace

Stmt * Parser::parse_statement_with_recovery()
{
  Stmt * stmt = parse_statement();
  if (!fault_) {
    return stmt;
  }

  record_error(
    ParseErrorKind::InternalFault, fmt::format("internal fault during parsing: {}", fault_->what),
    cur_);
  fault_.reset();
  synchronize();
  return nullptr;
}

BlockStmt * Parser::parse_block_statement_with_recovery()
{
  const Token start = cur_;
  std::vector<Stmt *> statements;

  next_token();
  while (!at_block_terminator()) {
    if (cur_is(TokenKind::Semicolon)) {
      next_token();
      continue;
    }

    const TokenKind first = cur_.kind;
    const size_t errors_before = errors_.size();
    Stmt * stmt = parse_statement_with_recovery();
    if (stmt) {
      statements.push_back(stmt);
      next_token();
      continue;
    }
    if (errors_.size() == errors_before) {
      next_token();
      continue;
    }

    if (is_block_opener(first)) {
      // Skip the rest of the broken construct, including its `end`.
      if (!cur_is(TokenKind::End)) {
        skip_to_end();
      }
      if (cur_is(TokenKind::End)) {
        next_token();
      }
    } else if (!at_block_terminator()) {
      next_token();
      skip_to_next_statement();
    }
  }

  if (cur_is(TokenKind::Eof)) {
    report_unterminated_block();
  }
  return ast_.create<BlockStmt>(to_span(statements), range_from(start));
}

bool Parser::expect_peek_with_recovery(TokenKind kind)
{
  if (peek_is(kind)) {
    next_token();
    return true;
  }
  peek_error(kind);
  if (peek_is(TokenKind::End) || peek_is(TokenKind::Eof) || is_statement_start(peek_.kind)) {
    return false;
  }

  // Distance from the current token: peek is 1.
  size_t distance = 1;
  size_t i = pos_;
  while (distance < k_recovery_lookahead && i < tokens_.size()) {
    const Token & tok = tokens_[i++];
    if (tok.kind == TokenKind::Comment) {
      continue;
    }
    ++distance;
    if (tok.kind == kind) {
      for (size_t n = 0; n < distance; ++n) {
        next_token();
      }
      return true;
    }
    // The repair never reaches into the next construct.
    if (tok.kind == TokenKind::Eof || tok.kind == TokenKind::End || is_statement_start(tok.kind)) {
      break;
    }
  }
  return false;
}

void Parser::synchronize()
{
  while (!cur_is(TokenKind::End) && !cur_is(TokenKind::Eof) && !is_statement_start(peek_.kind)) {
    next_token();
  }
}

void Parser::skip_to_end()
{
  const DepthGuard guard(*this);
  if (guard.exceeded()) {
    report_depth_exceeded();
    return;
  }

  // Each nested construct is skipped by a recursive call that stops on its
  // own `end`. The `if` of `else if` belongs to the enclosing `if`.
  TokenKind previous = TokenKind::Illegal;
  while (!cur_is(TokenKind::End) && !cur_is(TokenKind::Eof)) {
    const bool opens_block =
      is_block_opener(cur_.kind) && !(cur_is(TokenKind::If) && previous == TokenKind::Else);
    previous = cur_.kind;
    next_token();
    if (!opens_block) {
      continue;
    }
    skip_to_end();
    if (!cur_is(TokenKind::End)) {
      return;
    }
    previous = TokenKind::End;
    next_token();
  }
}

void Parser::skip_to_next_statement()
{
  while (!is_statement_start(cur_.kind) && !at_block_terminator()) {
    next_token();
  }
}

bool Parser::validate_identifier(std::string_view name, std::string_view context)
{
  if (name.empty()) {
    record_error(
      ParseErrorKind::ReservedWord, fmt::format("empty identifier (in {})", context), cur_);
    return false;
  }
  if (lookup_keyword(name) != TokenKind::Ident) {
    record_error(
      ParseErrorKind::ReservedWord, fmt::format("'{}' is a reserved word (in {})", name, context),
      cur_);
    return false;
  }
  return true;
}

}  // namespace seda::syntax
