// seda/syntax/lexer.cpp - Hand-written tokenizer
//
#include "seda/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace seda::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_' || c >= 0x80; }
bool is_ident_continue(unsigned char c) { return is_ident_start(c) || (std::isdigit(c) != 0); }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

struct KeywordEntry
{
  std::string_view text;
  TokenKind kind;
};

constexpr std::array<KeywordEntry, 32> k_keywords = {{
  {"var", TokenKind::Var},
  {"const", TokenKind::Const},
  {"fn", TokenKind::Fn},
  {"type", TokenKind::Type},
  {"module", TokenKind::Module},
  {"using", TokenKind::Using},
  {"as", TokenKind::As},
  {"struct", TokenKind::Struct},
  {"component", TokenKind::Component},
  {"if", TokenKind::If},
  {"else", TokenKind::Else},
  {"case", TokenKind::Case},
  {"for", TokenKind::For},
  {"in", TokenKind::In},
  {"check", TokenKind::Check},
  {"where", TokenKind::Where},
  {"end", TokenKind::End},
  {"is", TokenKind::Is},
  {"isA", TokenKind::IsA},
  {"contains", TokenKind::Contains},
  {"self", TokenKind::Self},
  {"return", TokenKind::Return},
  {"break", TokenKind::Break},
  {"true", TokenKind::True},
  {"false", TokenKind::False},
  {"nil", TokenKind::Nil},
  {"number", TokenKind::NumberType},
  {"string", TokenKind::StringType},
  {"boolean", TokenKind::BooleanType},
  {"and", TokenKind::And},
  {"or", TokenKind::Or},
  {"not", TokenKind::Not},
}};

}  // namespace

TokenKind lookup_keyword(std::string_view ident) noexcept
{
  for (const auto & kw : k_keywords) {
    if (kw.text == ident) {
      return kw.kind;
    }
  }
  return TokenKind::Ident;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    out.push_back(next_token());
    if (out.back().kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::advance(size_t n) noexcept
{
  for (size_t i = 0; i < n && !eof(); ++i) {
    if (src_[pos_] == '\n') {
      ++line_;
      line_start_ = pos_ + 1;
    }
    ++pos_;
  }
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, size_t start, uint32_t line, uint32_t column) const noexcept
{
  Token t;
  t.kind = kind;
  t.text = src_.substr(start, pos_ - start);
  t.line = line;
  t.column = column;
  t.range = SourceRange(static_cast<uint32_t>(start), static_cast<uint32_t>(pos_));
  return t;
}

Token Lexer::next_token()
{
  skip_whitespace();

  const size_t start = pos_;
  const uint32_t line = line_;
  const auto column = static_cast<uint32_t>(pos_ - line_start_ + 1);

  if (eof()) {
    return make_token(TokenKind::Eof, start, line, column);
  }

  const auto c = static_cast<unsigned char>(peek());
  if (c == '#') {
    return lex_comment();
  }
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }
  if (is_digit(peek())) {
    return lex_number();
  }
  if (c == '"') {
    return lex_string();
  }
  return lex_operator();
}

Token Lexer::lex_comment()
{
  const size_t start = pos_;
  const uint32_t line = line_;
  const auto column = static_cast<uint32_t>(pos_ - line_start_ + 1);

  if (!starts_with("#|")) {
    while (!eof() && peek() != '\n') {
      advance();
    }
    return make_token(TokenKind::Comment, start, line, column);
  }

  // Block comments nest: `#| outer #| inner |# still outer |#`.
  advance(2);
  int depth = 1;
  while (!eof() && depth > 0) {
    if (starts_with("#|")) {
      ++depth;
      advance(2);
    } else if (starts_with("|#")) {
      --depth;
      advance(2);
    } else {
      advance();
    }
  }
  return make_token(depth == 0 ? TokenKind::Comment : TokenKind::Illegal, start, line, column);
}

Token Lexer::lex_identifier_or_keyword()
{
  const size_t start = pos_;
  const uint32_t line = line_;
  const auto column = static_cast<uint32_t>(pos_ - line_start_ + 1);

  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }
  Token t = make_token(TokenKind::Ident, start, line, column);
  t.kind = lookup_keyword(t.text);
  return t;
}

Token Lexer::lex_number()
{
  const size_t start = pos_;
  const uint32_t line = line_;
  const auto column = static_cast<uint32_t>(pos_ - line_start_ + 1);

  while (is_digit(peek())) {
    advance();
  }
  // `1..5` is a range, so a fraction needs a digit right after the dot.
  if (peek() == '.' && is_digit(peek(1))) {
    advance();
    while (is_digit(peek())) {
      advance();
    }
  }
  return make_token(TokenKind::Number, start, line, column);
}

Token Lexer::lex_string()
{
  const size_t start = pos_;
  const uint32_t line = line_;
  const auto column = static_cast<uint32_t>(pos_ - line_start_ + 1);

  advance();  // opening quote
  const size_t payload_start = pos_;

  while (!eof() && peek() != '"') {
    if (peek() == '\\' && pos_ + 1 < src_.size()) {
      advance(2);
      continue;
    }
    advance();
  }

  if (eof()) {
    // Unterminated: the token text keeps the opening quote for the message.
    return make_token(TokenKind::Illegal, start, line, column);
  }

  const size_t payload_end = pos_;
  advance();  // closing quote

  Token t = make_token(TokenKind::String, start, line, column);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_operator()
{
  const size_t start = pos_;
  const uint32_t line = line_;
  const auto column = static_cast<uint32_t>(pos_ - line_start_ + 1);

  static constexpr std::array<std::pair<std::string_view, TokenKind>, 11> k_multi = {{
    {"...", TokenKind::RangeInclusive},
    {"..", TokenKind::Range},
    {"::", TokenKind::DoubleColon},
    {"==", TokenKind::Eq},
    {"=>", TokenKind::FatArrow},
    {"!=", TokenKind::NotEq},
    {"<=", TokenKind::Le},
    {">=", TokenKind::Ge},
    {"->", TokenKind::Arrow},
    {"&&", TokenKind::And},
    {"||", TokenKind::Or},
  }};
  for (const auto & [text, kind] : k_multi) {
    if (starts_with(text)) {
      advance(text.size());
      return make_token(kind, start, line, column);
    }
  }

  TokenKind kind = TokenKind::Illegal;
  switch (peek()) {
    case '=':
      kind = TokenKind::Assign;
      break;
    case '+':
      kind = TokenKind::Plus;
      break;
    case '-':
      kind = TokenKind::Minus;
      break;
    case '!':
      kind = TokenKind::Bang;
      break;
    case '*':
      kind = TokenKind::Asterisk;
      break;
    case '/':
      kind = TokenKind::Slash;
      break;
    case '%':
      kind = TokenKind::Percent;
      break;
    case '^':
      kind = TokenKind::Caret;
      break;
    case '<':
      kind = TokenKind::Lt;
      break;
    case '>':
      kind = TokenKind::Gt;
      break;
    case ',':
      kind = TokenKind::Comma;
      break;
    case ';':
      kind = TokenKind::Semicolon;
      break;
    case ':':
      kind = TokenKind::Colon;
      break;
    case '.':
      kind = TokenKind::Dot;
      break;
    case '(':
      kind = TokenKind::LParen;
      break;
    case ')':
      kind = TokenKind::RParen;
      break;
    case '{':
      kind = TokenKind::LBrace;
      break;
    case '}':
      kind = TokenKind::RBrace;
      break;
    case '[':
      kind = TokenKind::LBracket;
      break;
    case ']':
      kind = TokenKind::RBracket;
      break;
    default:
      // Includes a lone '&' or '|'.
      kind = TokenKind::Illegal;
      break;
  }
  advance();
  return make_token(kind, start, line, column);
}

std::string unescape_string(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }
    const char e = raw[++i];
    switch (e) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case '"':
        out.push_back('"');
        break;
      case '0':
        out.push_back('\0');
        break;
      default:
        out.push_back('\\');
        out.push_back(e);
        break;
    }
  }
  return out;
}

std::string escape_string(std::string_view text)
{
  std::string out;
  out.reserve(text.size() + 2);
  for (const char c : text) {
    switch (c) {
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\0':
        out += "\\0";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

}  // namespace seda::syntax
