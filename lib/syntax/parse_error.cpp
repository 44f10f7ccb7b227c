// seda/syntax/parse_error.cpp - Parse error formatting
//
#include "seda/syntax/parse_error.hpp"

#include <fmt/core.h>

#include <string>
#include <utility>
#include <vector>

namespace seda::syntax
{

std::string join_expected(const std::vector<TokenKind> & kinds)
{
  std::string out;
  for (size_t i = 0; i < kinds.size(); ++i) {
    if (i > 0) {
      out += (i == kinds.size() - 1) ? " or " : ", ";
    }
    out += syntax::to_string(kinds[i]);
  }
  return out;
}

std::string ParseError::to_string() const
{
  if (expected.empty()) {
    return fmt::format("line {}, column {}: {}", line, column, message);
  }
  return fmt::format(
    "line {}, column {}: expected {}, got {}", line, column, join_expected(expected),
    syntax::to_string(actual));
}

std::vector<std::string> format_errors(const std::vector<ParseError> & errors)
{
  std::vector<std::string> out;
  out.reserve(errors.size());
  for (size_t i = 0; i < errors.size(); ++i) {
    out.push_back(fmt::format("  {}. {}", i + 1, errors[i].to_string()));
  }
  return out;
}

Diagnostic to_diagnostic(const ParseError & error)
{
  Diagnostic diag;
  diag.severity = Severity::Error;
  diag.code = std::string(error_code(error.kind));

  if (error.expected.empty()) {
    diag.message = error.message;
    diag.labels.push_back(Label{error.range, "", LabelStyle::Primary});
  } else {
    diag.message =
      fmt::format("expected {}, got {}", join_expected(error.expected), syntax::to_string(error.actual));
    diag.labels.push_back(
      Label{error.range, fmt::format("expected {}", join_expected(error.expected)),
            LabelStyle::Primary});
  }

  switch (error.kind) {
    case ParseErrorKind::UnterminatedBlock:
      diag.help_message = "every `::` block is closed by `end`";
      break;
    case ParseErrorKind::ReservedWord:
      diag.help_message = "rename it; keywords cannot be used as names";
      break;
    case ParseErrorKind::MissingRootElement:
      diag.help_message = "a component body ends with a single UI element such as `Window { }`";
      break;
    case ParseErrorKind::DepthExceeded:
      diag.help_message = "raise `parser.max_depth` in seda.yaml or pass --max-depth";
      break;
    default:
      break;
  }
  return diag;
}

void report_parse_errors(const std::vector<ParseError> & errors, DiagnosticBag & diags)
{
  for (const auto & error : errors) {
    diags.add(to_diagnostic(error));
  }
}

}  // namespace seda::syntax
