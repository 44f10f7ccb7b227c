// seda/syntax/parse_error.hpp - Structured parse errors
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "seda/basic/diagnostic.hpp"
#include "seda/basic/source_manager.hpp"
#include "seda/syntax/token.hpp"

namespace seda::syntax
{

enum class ParseErrorKind : uint8_t {
  UnexpectedToken,      ///< a specific kind was required
  NoPrefixParser,       ///< token cannot start an expression
  UnterminatedBlock,    ///< EOF before `end`
  InvalidPropertyName,  ///< bad token after `.`
  ReservedWord,         ///< keyword used as a declared name
  MissingRootElement,   ///< component without a trailing UI element
  DepthExceeded,        ///< nesting deeper than ParserOptions::max_depth
  InternalFault,        ///< converted by the statement fault barrier
};

/// Stable diagnostic code, "P001".."P008".
[[nodiscard]] constexpr std::string_view error_code(ParseErrorKind kind) noexcept
{
  switch (kind) {
    case ParseErrorKind::UnexpectedToken:
      return "P001";
    case ParseErrorKind::NoPrefixParser:
      return "P002";
    case ParseErrorKind::UnterminatedBlock:
      return "P003";
    case ParseErrorKind::InvalidPropertyName:
      return "P004";
    case ParseErrorKind::ReservedWord:
      return "P005";
    case ParseErrorKind::MissingRootElement:
      return "P006";
    case ParseErrorKind::DepthExceeded:
      return "P007";
    case ParseErrorKind::InternalFault:
      return "P008";
  }
  return "";
}

/**
 * One recorded parse failure.
 *
 * When `expected` is non-empty the error renders as
 * `line L, column C: expected A, B or C, got X`; otherwise as
 * `line L, column C: message`.
 */
struct ParseError
{
  ParseErrorKind kind = ParseErrorKind::UnexpectedToken;
  std::string message;
  uint32_t line = 0;
  uint32_t column = 0;
  std::vector<TokenKind> expected;
  TokenKind actual = TokenKind::Illegal;
  SourceRange range;

  [[nodiscard]] std::string to_string() const;
};

/// "=", "= or :", "(, [ or {"
[[nodiscard]] std::string join_expected(const std::vector<TokenKind> & kinds);

/// Numbered list for humans: "  1. line 1, column 6: expected =, got EOF".
[[nodiscard]] std::vector<std::string> format_errors(const std::vector<ParseError> & errors);

/// Convert to a renderable diagnostic labelled at the offending token.
[[nodiscard]] Diagnostic to_diagnostic(const ParseError & error);

void report_parse_errors(const std::vector<ParseError> & errors, DiagnosticBag & diags);

}  // namespace seda::syntax
