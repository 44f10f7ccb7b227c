// seda/basic/diagnostic_printer.cpp - fmt for layout, rang for color
#include "seda/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace seda
{

namespace
{

constexpr std::string_view k_arrow = "    -->";
constexpr std::string_view k_pipe = "      |";
constexpr std::string_view k_tab = "    ";

rang::fg severity_color(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Note:
      return rang::fg::cyan;
  }
  return rang::fg::reset;
}

uint32_t primary_offset(const Diagnostic & diag)
{
  return diag.primary_range().get_begin().get_offset();
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color) : os_(os), color_(use_color)
{
  rang::setControlMode(color_ ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  print_header(diag);

  const FullSourceRange where = source.get_full_range(diag.primary_range());
  if (where.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", k_arrow, source.get_display_name(), where.start_line,
      where.start_column);
  } else {
    fmt::print(os_, "{} {}\n", k_arrow, source.get_display_name());
  }
  fmt::print(os_, "{}\n", k_pipe);

  for (const Label & label : diag.labels) {
    print_snippet(label, source);
  }
  if (diag.help_message) {
    print_help(*diag.help_message);
  }
  os_ << '\n';
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const Diagnostic & diag : diags) {
    ordered.push_back(&diag);
  }
  // Invalid ranges carry the largest offset and sort last.
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return primary_offset(*a) < primary_offset(*b);
  });
  for (const Diagnostic * diag : ordered) {
    print(*diag, source);
  }

  const size_t errors = diags.error_count();
  if (errors == 0) {
    return;
  }
  const std::string summary =
    fmt::format("{} error{} in {}", errors, errors == 1 ? "" : "s", source.get_display_name());
  if (color_) {
    os_ << rang::style::bold << rang::fg::red << summary << rang::style::reset << rang::fg::reset;
  } else {
    os_ << summary;
  }
  os_ << '\n';
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  std::string head(to_string(diag.severity));
  if (!diag.code.empty()) {
    head = fmt::format("{}[{}]", head, diag.code);
  }

  if (color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << head << rang::fg::reset << ": "
        << diag.message << rang::style::reset << '\n';
  } else {
    fmt::print(os_, "{}: {}\n", head, diag.message);
  }
}

void DiagnosticPrinter::print_snippet(const Label & label, const SourceManager & source)
{
  const FullSourceRange where = source.get_full_range(label.range);
  if (!where.is_valid()) {
    return;
  }

  // Tabs are echoed as four spaces; the indent under them widens to match.
  const std::string_view line = source.get_line(where.start_line - 1);
  std::string echoed;
  std::string indent;
  for (size_t i = 0; i < line.size(); ++i) {
    const bool is_tab = line[i] == '\t';
    if (is_tab) {
      echoed += k_tab;
    } else {
      echoed += line[i];
    }
    if (i + 1 < where.start_column) {
      indent += is_tab ? k_tab : std::string_view(" ");
    }
  }

  const bool one_line = where.end_line == where.start_line && where.end_column > where.start_column;
  const uint32_t width = one_line ? where.end_column - where.start_column : 1;
  const bool primary = label.style == LabelStyle::Primary;
  std::string underline(width, primary ? '^' : '-');
  if (!label.message.empty()) {
    underline += ' ';
    underline += label.message;
  }

  const std::string line_no = fmt::format(" {:>4} ", where.start_line);
  if (color_) {
    os_ << rang::fg::cyan << line_no << rang::fg::reset << rang::style::bold << "| "
        << rang::style::reset << echoed << '\n';
    os_ << k_pipe << ' ' << indent << (primary ? rang::fg::red : rang::fg::cyan)
        << rang::style::bold << underline << rang::style::reset << rang::fg::reset << '\n';
  } else {
    fmt::print(os_, "{}| {}\n", line_no, echoed);
    fmt::print(os_, "{} {}{}\n", k_pipe, indent, underline);
  }
}

void DiagnosticPrinter::print_help(std::string_view help)
{
  fmt::print(os_, "{}\n", k_pipe);
  if (color_) {
    os_ << rang::style::bold << "      = help" << rang::style::reset << ": " << help << '\n';
  } else {
    fmt::print(os_, "      = help: {}\n", help);
  }
}

}  // namespace seda
