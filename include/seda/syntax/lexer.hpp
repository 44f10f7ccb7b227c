// seda/syntax/lexer.hpp - Source text to token stream
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "seda/syntax/token.hpp"

namespace seda::syntax
{

/**
 * Hand-written scanner for Seda source.
 *
 * Comments are emitted as Comment tokens so tools can see them; the parser
 * drops them from its lookahead window. String tokens carry the raw text
 * between the quotes, escapes still encoded (see unescape_string).
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  /// Scan the whole input. The last token is always Eof.
  [[nodiscard]] std::vector<Token> lex_all();

  [[nodiscard]] Token next_token();

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept;

  void skip_whitespace();

  [[nodiscard]] Token lex_comment();
  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_operator();

  /// Build a token spanning [start, pos_) that began at (line, column).
  [[nodiscard]] Token make_token(
    TokenKind kind, size_t start, uint32_t line, uint32_t column) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  size_t line_start_ = 0;
};

/**
 * Decode the escapes of a string token: \n \t \r \\ \" \0.
 * Any other escape keeps its backslash.
 */
[[nodiscard]] std::string unescape_string(std::string_view raw);

/// Inverse of unescape_string, used when printing string literals.
[[nodiscard]] std::string escape_string(std::string_view text);

}  // namespace seda::syntax
