// seda/syntax/parser.hpp - Pratt expression parser and statement grammar
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "seda/ast/ast.hpp"
#include "seda/ast/ast_context.hpp"
#include "seda/basic/source_manager.hpp"
#include "seda/syntax/parse_error.hpp"
#include "seda/syntax/token.hpp"

namespace seda::syntax
{

/// Binding strength, weakest first.
enum class Precedence : uint8_t {
  Lowest,
  Assign,       // =
  Equals,       // == != and or && ||
  LessGreater,  // < > <= >=
  Range,        // .. ...
  Sum,          // + -
  Product,      // * / %
  Power,        // ^
  Prefix,       // -x !x not x
  Call,         // f(x)
  Index,        // a[i]
  Dot,          // a.b
};

inline constexpr uint32_t k_default_max_depth = 256;

struct ParserOptions
{
  /// Nested statements plus nested expressions allowed before parsing stops
  /// with a "maximum nesting depth exceeded" error.
  uint32_t max_depth = k_default_max_depth;
  /// Use parse_block_statement_with_recovery for every `::` body.
  bool recover_in_blocks = false;
};

/// Internal inconsistency noticed by a parse routine. Converted into an
/// ordinary error by parse_statement_with_recovery.
struct ParseFault
{
  std::string what;
};

/**
 * Parser for one Seda source text.
 *
 * Tokens are read through a two-slot window (current and peek); comment
 * tokens never reach it. Each parse routine starts with its first token in
 * the current slot and returns with its last token there, so callers advance
 * past it themselves.
 *
 * Errors are recorded, never thrown; a routine that fails returns null and
 * its callers propagate the null without reporting again.
 *
 * @code
 *   AstContext ctx;
 *   Parser parser(ctx, "var total = 1 + 2");
 *   Program * program = parser.parse_program();
 *   for (const auto & line : parser.format_errors()) std::cerr << line << "\n";
 * @endcode
 */
class Parser
{
public:
  Parser(AstContext & ast, std::vector<Token> tokens, ParserOptions options = {});
  Parser(AstContext & ast, std::string_view source, ParserOptions options = {});

  /// Parse from the first token. Never returns null. Calling it again
  /// re-parses the same tokens; errors accumulate until clear_errors().
  [[nodiscard]] Program * parse_program();

  [[nodiscard]] Expr * parse_expression(Precedence min_precedence);

  // --- Errors ---
  [[nodiscard]] const std::vector<ParseError> & errors() const noexcept { return errors_; }
  [[nodiscard]] bool has_errors() const noexcept { return !errors_.empty(); }
  /// "line L, column C: ..." for each error, in order.
  [[nodiscard]] std::vector<std::string> error_messages() const;
  /// Numbered form: "  1. line L, column C: ...".
  [[nodiscard]] std::vector<std::string> format_errors() const;
  void clear_errors() noexcept { errors_.clear(); }

  // --- Recovery ---
  [[nodiscard]] Stmt * parse_statement_with_recovery();
  [[nodiscard]] BlockStmt * parse_block_statement_with_recovery();
  /// Like expect_peek, but on a miss look up to five tokens ahead for `kind`
  /// and skip to it when found. The miss is recorded either way.
  bool expect_peek_with_recovery(TokenKind kind);
  /// Advance until `end`, EOF, or a statement keyword is next.
  void synchronize();
  void skip_to_end();
  void skip_to_next_statement();
  /// Record "'x' is a reserved word (in <context>)" and return false for
  /// keywords and empty names.
  bool validate_identifier(std::string_view name, std::string_view context);

  [[nodiscard]] const Token & current_token() const noexcept { return cur_; }
  [[nodiscard]] const Token & peek_token() const noexcept { return peek_; }

  [[nodiscard]] static Precedence precedence_of(TokenKind kind) noexcept;

private:
  using PrefixFn = Expr * (Parser::*)();
  using InfixFn = Expr * (Parser::*)(Expr *);

  struct Tables
  {
    std::array<PrefixFn, k_token_kind_count> prefix{};
    std::array<InfixFn, k_token_kind_count> infix{};
    std::array<Precedence, k_token_kind_count> precedence{};
  };
  [[nodiscard]] static const Tables & tables();

  /// Counts one level of statement or expression nesting for its lifetime.
  class DepthGuard
  {
  public:
    explicit DepthGuard(Parser & p) : p_(p) { ++p_.depth_; }
    ~DepthGuard() { --p_.depth_; }
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard & operator=(const DepthGuard &) = delete;

    [[nodiscard]] bool exceeded() const noexcept { return p_.depth_ > p_.options_.max_depth; }

  private:
    Parser & p_;
  };

  // Token window
  void reset();
  void next_token();
  [[nodiscard]] const Token & pull();
  [[nodiscard]] bool cur_is(TokenKind k) const noexcept { return cur_.kind == k; }
  [[nodiscard]] bool peek_is(TokenKind k) const noexcept { return peek_.kind == k; }
  bool expect_peek(TokenKind k);
  [[nodiscard]] Precedence peek_precedence() const noexcept { return precedence_of(peek_.kind); }
  [[nodiscard]] Precedence cur_precedence() const noexcept { return precedence_of(cur_.kind); }

  // Error recording
  void record_error(ParseErrorKind kind, std::string message, const Token & at);
  void record_expected(std::vector<TokenKind> expected, const Token & at);
  void peek_error(TokenKind expected);
  void report_unterminated_block();
  void report_depth_exceeded();
  void halt();
  void raise_fault(std::string what);

  // Node helpers
  [[nodiscard]] SourceRange range_from(const Token & start) const noexcept;
  [[nodiscard]] SourceRange range_from(const AstNode * start) const noexcept;
  [[nodiscard]] std::string_view intern(std::string_view s) { return ast_.intern(s); }
  template <typename T>
  [[nodiscard]] gsl::span<T> to_span(const std::vector<T> & v)
  {
    return ast_.copy_to_arena(v);
  }
  [[nodiscard]] static bool is_identifier_like(TokenKind k) noexcept;
  [[nodiscard]] static bool is_statement_start(TokenKind k) noexcept;
  [[nodiscard]] static bool is_block_opener(TokenKind k) noexcept;
  [[nodiscard]] bool at_block_terminator() const noexcept;
  /// Name in a declaring position (peek slot). Keywords are consumed and
  /// rejected through validate_identifier.
  [[nodiscard]] std::optional<std::string_view> expect_declared_name(std::string_view context);
  /// After a body: the current token must be `end` (EOF was reported already).
  bool expect_block_end();

  // Statements
  [[nodiscard]] Stmt * parse_statement();
  [[nodiscard]] Stmt * parse_var_statement();
  [[nodiscard]] Stmt * parse_fn_statement();
  [[nodiscard]] Stmt * parse_struct_statement();
  [[nodiscard]] Stmt * parse_type_statement();
  [[nodiscard]] Stmt * parse_module_statement();
  [[nodiscard]] Stmt * parse_using_statement();
  [[nodiscard]] Stmt * parse_component_statement();
  [[nodiscard]] Stmt * parse_if_statement();
  [[nodiscard]] Stmt * parse_case_statement();
  [[nodiscard]] Stmt * parse_for_statement();
  [[nodiscard]] Stmt * parse_return_statement();
  [[nodiscard]] Stmt * parse_break_statement();
  [[nodiscard]] Stmt * parse_check_statement();
  [[nodiscard]] Stmt * parse_expression_statement();
  [[nodiscard]] BlockStmt * parse_block_statement();

  // Constructs shared by statements and expressions
  [[nodiscard]] WhereBlock * parse_where_block();
  /// Body of `check` / `where`: statements and assertions until `end`.
  bool parse_test_body(std::vector<Stmt *> & stmts, std::vector<Assertion *> & assertions);
  [[nodiscard]] std::optional<AssertionOp> peek_assertion_op() const noexcept;
  bool parse_case_branches(std::vector<CaseBranch *> & branches);
  [[nodiscard]] std::optional<std::vector<Parameter *>> parse_function_parameters();
  [[nodiscard]] Parameter * parse_parameter();
  [[nodiscard]] TypeAnnotation * parse_type_annotation();
  [[nodiscard]] std::optional<std::vector<Expr *>> parse_expression_list(TokenKind end);
  [[nodiscard]] UiElement * parse_ui_element();

  // Prefix handlers
  [[nodiscard]] Expr * parse_identifier();
  [[nodiscard]] Expr * parse_number_literal();
  [[nodiscard]] Expr * parse_string_literal();
  [[nodiscard]] Expr * parse_boolean_literal();
  [[nodiscard]] Expr * parse_nil_literal();
  [[nodiscard]] Expr * parse_prefix_expression();
  [[nodiscard]] Expr * parse_grouped_expression();
  [[nodiscard]] Expr * parse_array_literal();
  [[nodiscard]] Expr * parse_map_literal();
  [[nodiscard]] Expr * parse_self_expression();
  [[nodiscard]] Expr * parse_case_expression();
  [[nodiscard]] Expr * parse_function_literal();

  // Infix handlers
  [[nodiscard]] Expr * parse_infix_expression(Expr * left);
  [[nodiscard]] Expr * parse_call_expression(Expr * callee);
  [[nodiscard]] Expr * parse_index_expression(Expr * base);
  [[nodiscard]] Expr * parse_dot_expression(Expr * object);
  [[nodiscard]] Expr * parse_assignment_expression(Expr * target);
  [[nodiscard]] Expr * parse_range_expression(Expr * start);

  // String interpolation
  [[nodiscard]] Expr * parse_interpolated_string(const std::string & text);
  [[nodiscard]] Expr * parse_interpolation_fragment(const std::string & fragment);

  AstContext & ast_;
  ParserOptions options_;
  std::vector<Token> tokens_;
  size_t pos_ = 0;

  Token cur_;
  Token peek_;

  std::vector<ParseError> errors_;
  std::optional<ParseFault> fault_;
  uint32_t depth_ = 0;
  bool halted_ = false;  // set once the depth limit trips

  /// Set on interpolation sub-parsers: every node and error is placed at
  /// the enclosing string token.
  std::optional<Token> origin_;
};

}  // namespace seda::syntax
