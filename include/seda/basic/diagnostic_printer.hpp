// seda/basic/diagnostic_printer.hpp
//
// Renders diagnostics the way sedac shows them on stderr:
//
//   error[P001]: expected =, got EOF
//       --> main.s:1:6
//         |
//       1 | var x
//         |      ^ expected =
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "seda/basic/diagnostic.hpp"
#include "seda/basic/source_manager.hpp"

namespace seda
{

class DiagnosticPrinter
{
public:
  /// Colors go through rang and are off for plain streams and tests.
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Sorted by position, then "N error(s) in <file>" when any are errors.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_header(const Diagnostic & diag);
  void print_snippet(const Label & label, const SourceManager & source);
  void print_help(std::string_view help);

  std::ostream & os_;
  bool color_;
};

}  // namespace seda
