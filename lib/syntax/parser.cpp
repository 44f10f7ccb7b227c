// seda/syntax/parser.cpp - Token window, dispatch tables and expressions
//
#include "seda/syntax/parser.hpp"

#include <fmt/core.h>

#include <cstdlib>
#include <string>
#include <utility>

#include "seda/syntax/lexer.hpp"

namespace seda::syntax
{

namespace
{

constexpr size_t index_of(TokenKind k) noexcept { return static_cast<size_t>(k); }

[[nodiscard]] InfixOp infix_op_for(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Plus:
      return InfixOp::Add;
    case TokenKind::Minus:
      return InfixOp::Sub;
    case TokenKind::Asterisk:
      return InfixOp::Mul;
    case TokenKind::Slash:
      return InfixOp::Div;
    case TokenKind::Percent:
      return InfixOp::Mod;
    case TokenKind::Caret:
      return InfixOp::Pow;
    case TokenKind::Eq:
      return InfixOp::Eq;
    case TokenKind::NotEq:
      return InfixOp::NotEq;
    case TokenKind::Lt:
      return InfixOp::Lt;
    case TokenKind::Gt:
      return InfixOp::Gt;
    case TokenKind::Le:
      return InfixOp::Le;
    case TokenKind::Ge:
      return InfixOp::Ge;
    case TokenKind::And:
      return InfixOp::And;
    case TokenKind::Or:
      return InfixOp::Or;
    default:
      break;
  }
  return InfixOp::Add;
}

}  // namespace

// ============================================================================
// Construction and dispatch tables
// ============================================================================

Parser::Parser(AstContext & ast, std::vector<Token> tokens, ParserOptions options)
: ast_(ast), options_(options), tokens_(std::move(tokens))
{
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    eof.kind = TokenKind::Eof;
    if (!tokens_.empty()) {
      eof.line = tokens_.back().line;
      eof.column = tokens_.back().column;
      eof.range = SourceRange(tokens_.back().range.get_end(), tokens_.back().range.get_end());
    }
    tokens_.push_back(eof);
  }
  reset();
}

Parser::Parser(AstContext & ast, std::string_view source, ParserOptions options)
: Parser(ast, Lexer(source).lex_all(), options)
{
}

const Parser::Tables & Parser::tables()
{
  static const Tables k_tables = [] {
    Tables t;
    t.precedence.fill(Precedence::Lowest);

    auto prefix = [&t](TokenKind k, PrefixFn fn) { t.prefix[index_of(k)] = fn; };
    auto infix = [&t](TokenKind k, InfixFn fn, Precedence p) {
      t.infix[index_of(k)] = fn;
      t.precedence[index_of(k)] = p;
    };

    prefix(TokenKind::Ident, &Parser::parse_identifier);
    prefix(TokenKind::Number, &Parser::parse_number_literal);
    prefix(TokenKind::String, &Parser::parse_string_literal);
    prefix(TokenKind::True, &Parser::parse_boolean_literal);
    prefix(TokenKind::False, &Parser::parse_boolean_literal);
    prefix(TokenKind::Nil, &Parser::parse_nil_literal);
    prefix(TokenKind::Minus, &Parser::parse_prefix_expression);
    prefix(TokenKind::Bang, &Parser::parse_prefix_expression);
    prefix(TokenKind::Not, &Parser::parse_prefix_expression);
    prefix(TokenKind::LParen, &Parser::parse_grouped_expression);
    prefix(TokenKind::LBracket, &Parser::parse_array_literal);
    prefix(TokenKind::LBrace, &Parser::parse_map_literal);
    prefix(TokenKind::Self, &Parser::parse_self_expression);
    prefix(TokenKind::Case, &Parser::parse_case_expression);
    prefix(TokenKind::Fn, &Parser::parse_function_literal);

    infix(TokenKind::Assign, &Parser::parse_assignment_expression, Precedence::Assign);
    infix(TokenKind::Eq, &Parser::parse_infix_expression, Precedence::Equals);
    infix(TokenKind::NotEq, &Parser::parse_infix_expression, Precedence::Equals);
    infix(TokenKind::And, &Parser::parse_infix_expression, Precedence::Equals);
    infix(TokenKind::Or, &Parser::parse_infix_expression, Precedence::Equals);
    infix(TokenKind::Lt, &Parser::parse_infix_expression, Precedence::LessGreater);
    infix(TokenKind::Gt, &Parser::parse_infix_expression, Precedence::LessGreater);
    infix(TokenKind::Le, &Parser::parse_infix_expression, Precedence::LessGreater);
    infix(TokenKind::Ge, &Parser::parse_infix_expression, Precedence::LessGreater);
    infix(TokenKind::Range, &Parser::parse_range_expression, Precedence::Range);
    infix(TokenKind::RangeInclusive, &Parser::parse_range_expression, Precedence::Range);
    infix(TokenKind::Plus, &Parser::parse_infix_expression, Precedence::Sum);
    infix(TokenKind::Minus, &Parser::parse_infix_expression, Precedence::Sum);
    infix(TokenKind::Asterisk, &Parser::parse_infix_expression, Precedence::Product);
    infix(TokenKind::Slash, &Parser::parse_infix_expression, Precedence::Product);
    infix(TokenKind::Percent, &Parser::parse_infix_expression, Precedence::Product);
    infix(TokenKind::Caret, &Parser::parse_infix_expression, Precedence::Power);
    infix(TokenKind::LParen, &Parser::parse_call_expression, Precedence::Call);
    infix(TokenKind::LBracket, &Parser::parse_index_expression, Precedence::Index);
    infix(TokenKind::Dot, &Parser::parse_dot_expression, Precedence::Dot);
    return t;
  }();
  return k_tables;
}

Precedence Parser::precedence_of(TokenKind kind) noexcept
{
  const size_t i = index_of(kind);
  return i < k_token_kind_count ? tables().precedence[i] : Precedence::Lowest;
}

// ============================================================================
// Token window
// ============================================================================

void Parser::reset()
{
  pos_ = 0;
  depth_ = 0;
  halted_ = false;
  fault_.reset();
  cur_ = pull();
  peek_ = pull();
}

const Token & Parser::pull()
{
  while (pos_ < tokens_.size() && tokens_[pos_].kind == TokenKind::Comment) {
    ++pos_;
  }
  if (pos_ >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[pos_++];
}

void Parser::next_token()
{
  cur_ = peek_;
  peek_ = pull();
}

bool Parser::expect_peek(TokenKind k)
{
  if (peek_is(k)) {
    next_token();
    return true;
  }
  peek_error(k);
  return false;
}

// ============================================================================
// Error recording
// ============================================================================

void Parser::record_error(ParseErrorKind kind, std::string message, const Token & at)
{
  // Once the depth limit trips the rest of the input is not parsed.
  if (halted_) {
    return;
  }
  ParseError err;
  err.kind = kind;
  err.message = std::move(message);
  err.line = at.line;
  err.column = at.column;
  err.actual = at.kind;
  err.range = at.range;
  errors_.push_back(std::move(err));
}

void Parser::record_expected(std::vector<TokenKind> expected, const Token & at)
{
  if (halted_) {
    return;
  }
  ParseError err;
  err.kind = ParseErrorKind::UnexpectedToken;
  err.message = "unexpected token";
  err.line = at.line;
  err.column = at.column;
  err.expected = std::move(expected);
  err.actual = at.kind;
  err.range = at.range;
  errors_.push_back(std::move(err));
}

void Parser::peek_error(TokenKind expected) { record_expected({expected}, peek_); }

void Parser::report_unterminated_block()
{
  record_error(ParseErrorKind::UnterminatedBlock, "expected 'end' keyword, got EOF", cur_);
}

void Parser::report_depth_exceeded()
{
  if (halted_) {
    return;
  }
  record_error(
    ParseErrorKind::DepthExceeded,
    fmt::format("maximum nesting depth exceeded ({})", options_.max_depth), cur_);
  halt();
}

void Parser::halt()
{
  halted_ = true;
  // Drain the window so every open loop sees EOF and unwinds.
  pos_ = tokens_.size();
  cur_ = tokens_.back();
  peek_ = tokens_.back();
}

void Parser::raise_fault(std::string what)
{
  if (!fault_) {
    fault_ = ParseFault{std::move(what)};
  }
}

std::vector<std::string> Parser::error_messages() const
{
  std::vector<std::string> out;
  out.reserve(errors_.size());
  for (const auto & e : errors_) {
    out.push_back(e.to_string());
  }
  return out;
}

std::vector<std::string> Parser::format_errors() const { return syntax::format_errors(errors_); }

// ============================================================================
// Node helpers
// ============================================================================

SourceRange Parser::range_from(const Token & start) const noexcept
{
  if (origin_) {
    return origin_->range;
  }
  return join_ranges(start.range, cur_.range);
}

SourceRange Parser::range_from(const AstNode * start) const noexcept
{
  if (origin_) {
    return origin_->range;
  }
  return join_ranges(get_range(start), cur_.range);
}

bool Parser::is_identifier_like(TokenKind k) noexcept
{
  return k == TokenKind::Ident || is_keyword(k);
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expression(Precedence min_precedence)
{
  const DepthGuard guard(*this);
  if (guard.exceeded()) {
    report_depth_exceeded();
    return nullptr;
  }

  // Token streams handed in directly are not checked by the lexer.
  if (index_of(cur_.kind) >= k_token_kind_count) {
    raise_fault(fmt::format("token kind {} is outside the token table", index_of(cur_.kind)));
    return nullptr;
  }
  const PrefixFn prefix = tables().prefix[index_of(cur_.kind)];
  if (prefix == nullptr) {
    record_error(
      ParseErrorKind::NoPrefixParser,
      fmt::format("no prefix parse function for {} found", to_string(cur_.kind)), cur_);
    return nullptr;
  }

  Expr * left = (this->*prefix)();

  while (left != nullptr && !peek_is(TokenKind::Eof) && min_precedence < peek_precedence()) {
    const InfixFn infix = tables().infix[index_of(peek_.kind)];
    if (infix == nullptr) {
      return left;
    }
    next_token();
    left = (this->*infix)(left);
  }
  return left;
}

// --- Prefix handlers ---

Expr * Parser::parse_identifier()
{
  if (peek_is(TokenKind::LBrace)) {
    return parse_ui_element();
  }
  return ast_.create<Identifier>(intern(cur_.text), range_from(cur_));
}

Expr * Parser::parse_number_literal()
{
  const std::string tmp(cur_.text);
  const double value = std::strtod(tmp.c_str(), nullptr);
  return ast_.create<NumberLiteral>(intern(cur_.text), value, range_from(cur_));
}

Expr * Parser::parse_string_literal()
{
  const std::string decoded = unescape_string(cur_.text);
  if (decoded.find("#{") == std::string::npos) {
    return ast_.create<StringLiteral>(intern(decoded), range_from(cur_));
  }
  return parse_interpolated_string(decoded);
}

Expr * Parser::parse_boolean_literal()
{
  return ast_.create<BooleanLiteral>(cur_is(TokenKind::True), range_from(cur_));
}

Expr * Parser::parse_nil_literal() { return ast_.create<NilLiteral>(range_from(cur_)); }

Expr * Parser::parse_prefix_expression()
{
  const Token start = cur_;
  const PrefixOp op = cur_is(TokenKind::Minus) ? PrefixOp::Neg : PrefixOp::Not;

  next_token();
  Expr * operand = parse_expression(Precedence::Prefix);
  if (!operand) {
    return nullptr;
  }
  return ast_.create<PrefixExpr>(op, operand, range_from(start));
}

Expr * Parser::parse_grouped_expression()
{
  next_token();
  Expr * inner = parse_expression(Precedence::Lowest);
  if (!inner) {
    return nullptr;
  }
  if (!expect_peek(TokenKind::RParen)) {
    return nullptr;
  }
  return inner;
}

Expr * Parser::parse_array_literal()
{
  const Token start = cur_;
  auto elements = parse_expression_list(TokenKind::RBracket);
  if (!elements) {
    return nullptr;
  }
  return ast_.create<ArrayLiteral>(to_span(*elements), range_from(start));
}

Expr * Parser::parse_map_literal()
{
  const Token start = cur_;
  std::vector<MapEntry *> entries;

  if (peek_is(TokenKind::RBrace)) {
    next_token();
    return ast_.create<MapLiteral>(to_span(entries), range_from(start));
  }

  while (true) {
    next_token();
    const Token entry_start = cur_;
    Expr * key = parse_expression(Precedence::Lowest);
    if (!key || !expect_peek(TokenKind::Colon)) {
      return nullptr;
    }
    next_token();
    Expr * value = parse_expression(Precedence::Lowest);
    if (!value) {
      return nullptr;
    }
    entries.push_back(ast_.create<MapEntry>(key, value, range_from(entry_start)));

    if (!peek_is(TokenKind::Comma)) {
      break;
    }
    next_token();
  }

  if (!expect_peek(TokenKind::RBrace)) {
    return nullptr;
  }
  return ast_.create<MapLiteral>(to_span(entries), range_from(start));
}

Expr * Parser::parse_self_expression()
{
  return ast_.create<Identifier>(intern("self"), range_from(cur_));
}

Expr * Parser::parse_case_expression()
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
  auto * expr = ast_.create<CaseExpr>(subject, range_from(start));
  expr->branches = to_span(branches);
  return expr;
}

Expr * Parser::parse_function_literal()
{
  const Token start = cur_;
  if (!expect_peek(TokenKind::LParen)) {
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

  auto * fn = ast_.create<FunctionLiteral>(range_from(start));
  fn->params = to_span(*params);
  fn->body = body;
  return fn;
}

// --- Infix handlers ---

Expr * Parser::parse_infix_expression(Expr * left)
{
  const InfixOp op = infix_op_for(cur_.kind);
  const Precedence precedence = cur_precedence();

  next_token();
  Expr * right = parse_expression(precedence);
  if (!right) {
    return nullptr;
  }
  return ast_.create<InfixExpr>(left, op, right, range_from(left));
}

Expr * Parser::parse_call_expression(Expr * callee)
{
  auto args = parse_expression_list(TokenKind::RParen);
  if (!args) {
    return nullptr;
  }
  return ast_.create<CallExpr>(callee, to_span(*args), range_from(callee));
}

Expr * Parser::parse_index_expression(Expr * base)
{
  next_token();
  Expr * index = parse_expression(Precedence::Lowest);
  if (!index || !expect_peek(TokenKind::RBracket)) {
    return nullptr;
  }
  return ast_.create<IndexExpr>(base, index, range_from(base));
}

Expr * Parser::parse_dot_expression(Expr * object)
{
  // Property names are not reserved: `list.end`, `x.type` are fine.
  next_token();
  if (!is_identifier_like(cur_.kind)) {
    record_error(
      ParseErrorKind::InvalidPropertyName,
      fmt::format("expected property name, got {} instead", to_string(cur_.kind)), cur_);
    return nullptr;
  }
  return ast_.create<DotExpr>(object, intern(cur_.text), range_from(object));
}

Expr * Parser::parse_assignment_expression(Expr * target)
{
  next_token();
  Expr * value = parse_expression(Precedence::Lowest);
  if (!value) {
    return nullptr;
  }
  return ast_.create<AssignExpr>(target, value, range_from(target));
}

Expr * Parser::parse_range_expression(Expr * start)
{
  const bool inclusive = cur_is(TokenKind::RangeInclusive);
  const Precedence precedence = cur_precedence();

  next_token();
  Expr * end = parse_expression(precedence);
  if (!end) {
    return nullptr;
  }
  return ast_.create<RangeExpr>(start, end, inclusive, range_from(start));
}

// ============================================================================
// Expression lists and UI elements
// ============================================================================

std::optional<std::vector<Expr *>> Parser::parse_expression_list(TokenKind end)
{
  std::vector<Expr *> items;

  if (peek_is(end)) {
    next_token();
    return items;
  }

  next_token();
  Expr * first = parse_expression(Precedence::Lowest);
  if (!first) {
    return std::nullopt;
  }
  items.push_back(first);

  while (peek_is(TokenKind::Comma)) {
    next_token();
    next_token();
    Expr * item = parse_expression(Precedence::Lowest);
    if (!item) {
      return std::nullopt;
    }
    items.push_back(item);
  }

  if (!expect_peek(end)) {
    return std::nullopt;
  }
  return items;
}

UiElement * Parser::parse_ui_element()
{
  const DepthGuard guard(*this);
  if (guard.exceeded()) {
    report_depth_exceeded();
    return nullptr;
  }

  const Token start = cur_;
  auto * element = ast_.create<UiElement>(intern(cur_.text), range_from(start));
  std::vector<UiProperty *> properties;
  std::vector<UiElement *> children;

  next_token();  // {
  next_token();
  while (!cur_is(TokenKind::RBrace)) {
    if (cur_is(TokenKind::Eof)) {
      record_expected({TokenKind::RBrace}, cur_);
      return nullptr;
    }
    if (cur_is(TokenKind::Comma) || cur_is(TokenKind::Semicolon)) {
      next_token();
      continue;
    }

    if (is_identifier_like(cur_.kind) && peek_is(TokenKind::Colon)) {
      const Token name = cur_;
      next_token();
      next_token();
      Expr * value = parse_expression(Precedence::Lowest);
      if (!value) {
        return nullptr;
      }
      properties.push_back(ast_.create<UiProperty>(intern(name.text), value, range_from(name)));
    } else if (cur_is(TokenKind::Ident) && peek_is(TokenKind::LBrace)) {
      UiElement * child = parse_ui_element();
      if (!child) {
        return nullptr;
      }
      children.push_back(child);
    } else {
      record_expected({TokenKind::Ident, TokenKind::RBrace}, cur_);
      return nullptr;
    }
    next_token();
  }

  element->properties = to_span(properties);
  element->children = to_span(children);
  element->range_ = range_from(start);
  return element;
}

// ============================================================================
// String interpolation
// ============================================================================

Expr * Parser::parse_interpolated_string(const std::string & text)
{
  const Token start = cur_;
  std::vector<Expr *> parts;
  std::string plain;

  size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, 2, "#{") != 0) {
      plain.push_back(text[i]);
      ++i;
      continue;
    }

    if (!plain.empty()) {
      parts.push_back(ast_.create<StringLiteral>(intern(plain), range_from(start)));
      plain.clear();
    }

    i += 2;
    const size_t expr_begin = i;
    int depth = 1;
    while (i < text.size()) {
      if (text[i] == '{') {
        ++depth;
      } else if (text[i] == '}') {
        --depth;
        if (depth == 0) {
          break;
        }
      }
      ++i;
    }
    if (depth != 0) {
      // Unbalanced: the whole text is a plain string.
      return ast_.create<StringLiteral>(intern(text), range_from(start));
    }

    if (Expr * part = parse_interpolation_fragment(text.substr(expr_begin, i - expr_begin))) {
      parts.push_back(part);
    }
    ++i;  // closing }
  }

  if (!plain.empty()) {
    parts.push_back(ast_.create<StringLiteral>(intern(plain), range_from(start)));
  }

  if (parts.size() == 1 && isa<StringLiteral>(parts.front())) {
    return parts.front();
  }
  return ast_.create<InterpolatedString>(to_span(parts), range_from(start));
}

Expr * Parser::parse_interpolation_fragment(const std::string & fragment)
{
  if (halted_) {
    return nullptr;
  }
  ParserOptions sub_options = options_;
  sub_options.max_depth = options_.max_depth > depth_ ? options_.max_depth - depth_ : 1;

  Parser sub(ast_, std::string_view(fragment), sub_options);
  sub.origin_ = origin_ ? origin_ : std::optional<Token>(cur_);

  Expr * expr = sub.parse_expression(Precedence::Lowest);
  if (expr && !sub.peek_is(TokenKind::Eof)) {
    sub.record_expected({TokenKind::Eof}, sub.peek_);
    expr = nullptr;
  }

  const Token & at = *sub.origin_;
  for (auto err : sub.errors_) {
    const std::string detail = err.expected.empty()
                                 ? err.message
                                 : fmt::format(
                                     "expected {}, got {}", join_expected(err.expected),
                                     to_string(err.actual));
    err.message = "in string interpolation: " + detail;
    err.expected.clear();
    err.line = at.line;
    err.column = at.column;
    err.range = at.range;
    errors_.push_back(std::move(err));
  }
  // The sub-parser already reported the limit; stop this parser as well.
  if (sub.halted_) {
    halt();
  }
  return expr;
}

}  // namespace seda::syntax
