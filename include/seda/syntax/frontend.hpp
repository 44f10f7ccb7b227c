// seda/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "seda/ast/ast.hpp"
#include "seda/ast/ast_context.hpp"
#include "seda/basic/diagnostic.hpp"
#include "seda/basic/source_manager.hpp"
#include "seda/syntax/parse_error.hpp"
#include "seda/syntax/parser.hpp"

namespace seda
{

/// Everything produced by parsing one script. Heap-allocated so the source
/// buffer never moves while tokens still point into it.
struct ParsedUnit
{
  SourceManager source;
  AstContext ast;
  Program * program = nullptr;
  std::vector<syntax::ParseError> errors;
  DiagnosticBag diags;

  [[nodiscard]] bool has_errors() const noexcept { return !errors.empty(); }
};

// Parse pipeline:
// source -> lexer (token stream) -> Pratt parser (AST) -> diagnostics
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  const std::filesystem::path & path, std::string source_text,
  syntax::ParserOptions options = {});

[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::string source_text, syntax::ParserOptions options = {});

}  // namespace seda
