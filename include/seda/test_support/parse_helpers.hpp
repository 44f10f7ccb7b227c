// seda/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-file parsing pipeline with a few accessors that keep test bodies
// short. The ParsedUnit stays heap-allocated so node pointers stay valid for
// the lifetime of the TestParseUnit.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "seda/ast/ast.hpp"
#include "seda/ast/ast_printer.hpp"
#include "seda/basic/casting.hpp"
#include "seda/syntax/frontend.hpp"

namespace seda::test_support
{

struct TestParseUnit
{
  std::unique_ptr<ParsedUnit> unit;
  Program * program = nullptr;

  [[nodiscard]] const std::vector<syntax::ParseError> & errors() const noexcept
  {
    return unit->errors;
  }

  [[nodiscard]] bool has_errors() const noexcept { return unit->has_errors(); }

  [[nodiscard]] const DiagnosticBag & diags() const noexcept { return unit->diags; }

  /// "line L, column C: ..." strings, in order.
  [[nodiscard]] std::vector<std::string> messages() const
  {
    std::vector<std::string> out;
    for (const auto & e : unit->errors) {
      out.push_back(e.to_string());
    }
    return out;
  }

  [[nodiscard]] size_t size() const noexcept { return program->statements.size(); }

  [[nodiscard]] Stmt * stmt(size_t i) const { return program->statements[i]; }

  template <typename T>
  [[nodiscard]] T * stmt_as(size_t i) const
  {
    return i < size() ? dyn_cast<T>(stmt(i)) : nullptr;
  }

  /// Expression of the i-th top-level statement, when it is an ExprStmt.
  [[nodiscard]] Expr * expr(size_t i = 0) const
  {
    auto * s = stmt_as<ExprStmt>(i);
    return s ? s->expr : nullptr;
  }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return unit->source.get_slice(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, syntax::ParserOptions options = {},
  const std::filesystem::path & virtual_path = "<test>.s")
{
  TestParseUnit out;
  out.unit = parse_source(virtual_path, std::move(src), options);
  out.program = out.unit->program;
  return out;
}

/// Canonical text of the first expression in `src`.
[[nodiscard]] inline std::string expr_source(std::string src)
{
  const auto unit = parse(std::move(src));
  return to_source(unit.expr(0));
}

}  // namespace seda::test_support
