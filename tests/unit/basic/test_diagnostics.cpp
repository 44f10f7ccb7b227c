// test_diagnostics.cpp - Source manager, diagnostic bag and printer
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "seda/basic/diagnostic.hpp"
#include "seda/basic/diagnostic_printer.hpp"
#include "seda/basic/source_manager.hpp"
#include "seda/syntax/frontend.hpp"
#include "seda/syntax/parse_error.hpp"

namespace seda
{

// ============================================================================
// SourceManager
// ============================================================================

TEST(SourceManager, LineColumnLookup)
{
  const SourceManager sm("var a = 1\nvar b = 2\n");
  EXPECT_EQ(sm.get_line_count(), 3U);

  const auto first = sm.get_line_column(0U);
  EXPECT_EQ(first.line, 1U);
  EXPECT_EQ(first.column, 1U);

  const auto b = sm.get_line_column(14U);
  EXPECT_EQ(b.line, 2U);
  EXPECT_EQ(b.column, 5U);

  EXPECT_EQ(sm.get_offset(2, 5), 14U);
  EXPECT_FALSE(sm.get_line_column(SourceLocation()).is_valid());
}

TEST(SourceManager, LinesAndSlices)
{
  const SourceManager sm("one\r\ntwo\nthree");
  EXPECT_EQ(sm.get_line(0), "one");
  EXPECT_EQ(sm.get_line(1), "two");
  EXPECT_EQ(sm.get_line(2), "three");
  EXPECT_EQ(sm.get_line(3), "");

  EXPECT_EQ(sm.get_slice(SourceRange(5, 8)), "two");
  EXPECT_EQ(sm.get_slice(SourceRange(9, 100)), "three");
  EXPECT_EQ(sm.get_slice(SourceRange()), "");
}

TEST(SourceManager, FullRange)
{
  const SourceManager sm("a\nbcd");
  const FullSourceRange fr = sm.get_full_range(SourceRange(3, 5));
  ASSERT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 2U);
  EXPECT_EQ(fr.start_column, 2U);
  EXPECT_EQ(fr.end_line, 2U);
  EXPECT_EQ(fr.end_column, 4U);
  EXPECT_FALSE(sm.get_full_range(SourceRange()).is_valid());
}

TEST(SourceManager, DisplayNameWithoutPath)
{
  const SourceManager sm("x");
  EXPECT_FALSE(sm.has_path());
  EXPECT_EQ(sm.get_display_name(), "<input>");
}

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(DiagnosticBag, BuilderCommitsOnDestruction)
{
  DiagnosticBag bag;
  bag.report_error(SourceRange(0, 3), "bad thing", "here")
    .with_code("P001")
    .with_secondary_label(SourceRange(4, 5), "opened here")
    .with_help("fix it");
  bag.report_warning(SourceRange(1, 2), "odd thing");
  bag.report_note(SourceRange(), "for context");

  ASSERT_EQ(bag.size(), 3U);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.error_count(), 1U);

  const Diagnostic & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "P001");
  EXPECT_EQ(d.message, "bad thing");
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "here");
  EXPECT_TRUE(d.primary_range() == SourceRange(0, 3));
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "fix it");
}

TEST(DiagnosticBag, MergeAndClear)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_warning(SourceRange(0, 1), "w");
  b.report_error(SourceRange(0, 1), "e");

  EXPECT_FALSE(a.has_errors());
  a.merge(b);
  EXPECT_EQ(a.size(), 2U);
  EXPECT_TRUE(a.has_errors());

  a.clear();
  EXPECT_TRUE(a.empty());
}

// ============================================================================
// Parse errors as diagnostics
// ============================================================================

TEST(ParseDiagnostics, CodesFollowErrorKinds)
{
  using syntax::ParseErrorKind;
  EXPECT_EQ(syntax::error_code(ParseErrorKind::UnexpectedToken), "P001");
  EXPECT_EQ(syntax::error_code(ParseErrorKind::NoPrefixParser), "P002");
  EXPECT_EQ(syntax::error_code(ParseErrorKind::UnterminatedBlock), "P003");
  EXPECT_EQ(syntax::error_code(ParseErrorKind::InvalidPropertyName), "P004");
  EXPECT_EQ(syntax::error_code(ParseErrorKind::ReservedWord), "P005");
  EXPECT_EQ(syntax::error_code(ParseErrorKind::MissingRootElement), "P006");
  EXPECT_EQ(syntax::error_code(ParseErrorKind::DepthExceeded), "P007");
  EXPECT_EQ(syntax::error_code(ParseErrorKind::InternalFault), "P008");
}

TEST(ParseDiagnostics, ExpectedTokenBecomesLabel)
{
  const auto unit = parse_source(std::string("var x"));
  ASSERT_EQ(unit->diags.size(), 1U);

  const Diagnostic & d = unit->diags.all()[0];
  EXPECT_EQ(d.code, "P001");
  EXPECT_EQ(d.message, "expected =, got EOF");
  ASSERT_EQ(d.labels.size(), 1U);
  EXPECT_EQ(d.labels[0].message, "expected =");
  EXPECT_TRUE(d.primary_range() == SourceRange(5, 5));
  EXPECT_FALSE(d.help_message.has_value());
}

TEST(ParseDiagnostics, UnterminatedBlockCarriesHelp)
{
  const auto unit = parse_source(std::string("fn f() :: 1"));
  ASSERT_EQ(unit->diags.size(), 1U);
  const Diagnostic & d = unit->diags.all()[0];
  EXPECT_EQ(d.code, "P003");
  EXPECT_EQ(d.message, "expected 'end' keyword, got EOF");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "every `::` block is closed by `end`");
}

TEST(ParseDiagnostics, JoinExpected)
{
  using syntax::TokenKind;
  EXPECT_EQ(syntax::join_expected({TokenKind::Assign}), "=");
  EXPECT_EQ(syntax::join_expected({TokenKind::Assign, TokenKind::Colon}), "= or :");
  EXPECT_EQ(
    syntax::join_expected({TokenKind::LParen, TokenKind::LBracket, TokenKind::LBrace}),
    "(, [ or {");
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(DiagnosticPrinter, PlainSnippet)
{
  const auto unit = parse_source(std::string("var x"));
  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(unit->diags, unit->source);

  EXPECT_EQ(
    os.str(),
    "error[P001]: expected =, got EOF\n"
    "    --> <input>:1:6\n"
    "      |\n"
    "    1 | var x\n"
    "      |      ^ expected =\n"
    "\n"
    "1 error in <input>\n");
}

TEST(DiagnosticPrinter, HelpAndMarkerWidth)
{
  const SourceManager sm("var if = 1");
  DiagnosticBag bag;
  bag.report_error(SourceRange(4, 6), "'if' is a reserved word").with_help("rename it");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print(bag.all()[0], sm);

  EXPECT_EQ(
    os.str(),
    "error: 'if' is a reserved word\n"
    "    --> <input>:1:5\n"
    "      |\n"
    "    1 | var if = 1\n"
    "      |     ^^\n"
    "      |\n"
    "      = help: rename it\n"
    "\n");
}

TEST(DiagnosticPrinter, SortsBySourcePositionAndCounts)
{
  const SourceManager sm("a\nb");
  DiagnosticBag bag;
  bag.report_error(SourceRange(2, 3), "second");
  bag.report_error(SourceRange(0, 1), "first");
  bag.report_warning(SourceRange(0, 1), "just a warning");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(bag, sm);

  const std::string out = os.str();
  const auto first = out.find("error: first");
  const auto second = out.find("error: second");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_NE(out.find("warning: just a warning"), std::string::npos);
  EXPECT_NE(out.find("2 errors in <input>"), std::string::npos);
}

TEST(DiagnosticPrinter, NoSummaryWithoutErrors)
{
  const SourceManager sm("a");
  DiagnosticBag bag;
  bag.report_note(SourceRange(0, 1), "fyi");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(bag, sm);
  EXPECT_EQ(os.str().find("error"), std::string::npos);
}

}  // namespace seda
