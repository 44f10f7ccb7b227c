// seda/syntax/token.hpp - Token kinds and the token record
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "seda/basic/source_manager.hpp"

namespace seda::syntax
{

enum class TokenKind : uint8_t {
  Illegal,
  Eof,
  Comment,  // `# ...` or `#| ... |#`; filtered by the parser

  Ident,
  Number,
  String,  // token.text is the raw contents between the quotes

  // Operators
  Assign,    // =
  Plus,      // +
  Minus,     // -
  Bang,      // !
  Asterisk,  // *
  Slash,     // /
  Percent,   // %
  Caret,     // ^
  Lt,        // <
  Gt,        // >
  Le,        // <=
  Ge,        // >=
  Eq,        // ==
  NotEq,     // !=
  And,       // && or `and`
  Or,        // || or `or`
  FatArrow,  // =>
  Arrow,     // ->

  // Delimiters
  Comma,
  Semicolon,
  Colon,
  DoubleColon,     // ::
  Dot,             // .
  Range,           // ..
  RangeInclusive,  // ...
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  // Keywords
  Var,
  Const,
  Fn,
  Type,
  Module,
  Using,
  As,
  Struct,
  Component,
  If,
  Else,
  Case,
  For,
  In,
  Check,
  Where,
  End,
  Is,
  IsA,
  Contains,
  Self,
  Return,
  Break,
  True,
  False,
  Nil,
  NumberType,   // number
  StringType,   // string
  BooleanType,  // boolean
  Not,          // not
};

inline constexpr size_t k_token_kind_count = static_cast<size_t>(TokenKind::Not) + 1;

struct Token
{
  TokenKind kind = TokenKind::Illegal;
  std::string_view text;  // slice of the source
  uint32_t line = 0;      // 1-based
  uint32_t column = 0;    // 1-based
  SourceRange range;      // byte span in the script (quotes included)
};

/// Printable name used in diagnostics ("expected =, got EOF").
[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Illegal:
      return "ILLEGAL";
    case TokenKind::Eof:
      return "EOF";
    case TokenKind::Comment:
      return "COMMENT";
    case TokenKind::Ident:
      return "IDENT";
    case TokenKind::Number:
      return "NUMBER";
    case TokenKind::String:
      return "STRING";
    case TokenKind::Assign:
      return "=";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Asterisk:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::Eq:
      return "==";
    case TokenKind::NotEq:
      return "!=";
    case TokenKind::And:
      return "AND";
    case TokenKind::Or:
      return "OR";
    case TokenKind::FatArrow:
      return "=>";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Colon:
      return ":";
    case TokenKind::DoubleColon:
      return "::";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Range:
      return "..";
    case TokenKind::RangeInclusive:
      return "...";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Var:
      return "var";
    case TokenKind::Const:
      return "const";
    case TokenKind::Fn:
      return "fn";
    case TokenKind::Type:
      return "type";
    case TokenKind::Module:
      return "module";
    case TokenKind::Using:
      return "using";
    case TokenKind::As:
      return "as";
    case TokenKind::Struct:
      return "struct";
    case TokenKind::Component:
      return "component";
    case TokenKind::If:
      return "if";
    case TokenKind::Else:
      return "else";
    case TokenKind::Case:
      return "case";
    case TokenKind::For:
      return "for";
    case TokenKind::In:
      return "in";
    case TokenKind::Check:
      return "check";
    case TokenKind::Where:
      return "where";
    case TokenKind::End:
      return "end";
    case TokenKind::Is:
      return "is";
    case TokenKind::IsA:
      return "isA";
    case TokenKind::Contains:
      return "contains";
    case TokenKind::Self:
      return "self";
    case TokenKind::Return:
      return "return";
    case TokenKind::Break:
      return "break";
    case TokenKind::True:
      return "true";
    case TokenKind::False:
      return "false";
    case TokenKind::Nil:
      return "nil";
    case TokenKind::NumberType:
      return "number";
    case TokenKind::StringType:
      return "string";
    case TokenKind::BooleanType:
      return "boolean";
    case TokenKind::Not:
      return "NOT";
  }
  return "";
}

/// Keyword kind for `ident`, or Ident when it is not reserved.
[[nodiscard]] TokenKind lookup_keyword(std::string_view ident) noexcept;

/// True for every kind produced by lookup_keyword other than Ident.
[[nodiscard]] constexpr bool is_keyword(TokenKind k) noexcept
{
  return k >= TokenKind::Var && k <= TokenKind::Not;
}

}  // namespace seda::syntax
