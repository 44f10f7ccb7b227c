// test_printer_roundtrip.cpp - Canonical source printing
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "seda/ast/ast_printer.hpp"
#include "seda/test_support/parse_helpers.hpp"

namespace seda
{

namespace
{

std::string canonical(const std::string & src)
{
  const auto unit = test_support::parse(src);
  EXPECT_FALSE(unit.has_errors()) << src;
  return to_source(unit.program);
}

}  // namespace

TEST(AstPrinter, CanonicalForms)
{
  struct Case
  {
    const char * input;
    const char * expected;
  };
  const std::vector<Case> cases = {
    {"a + b * c", "(a + (b * c))"},
    {"not a and b", "((!a) && b)"},
    {"var x: number = -1", "var x: number = (-1)"},
    {"const a, b = 1", "const a, b = 1"},
    {"a.b = c[0]", "a.b = (c[0])"},
    {"0...n", "(0...n)"},
    {"{a: [1, 2], b: nil}", "{a: [1, 2], b: nil}"},
    {"f()(1)", "f()(1)"},
    {"fn add(a: number, b) :: return a + b end", "fn add(a: number, b) :: return (a + b) end"},
    {"fn f(x) :: x where :: f(1) is 1 end", "fn f(x) :: x where :: f(1) is 1 end"},
    {"fn() :: end", "fn() :: end"},
    {"fn f() :: return end", "fn f() :: return end"},
    {"if a :: 1 else if b :: 2 else :: 3 end", "if a :: 1 else if b :: 2 else :: 3 end"},
    {"struct P ::\n  x: number\n  y: string\nend", "struct P :: x: number, y: string end"},
    {"type T = Map[string, number]", "type T = Map[string, number]"},
    {"module M :: end", "module M :: end"},
    {"using \"m\" as m", "using \"m\" as m"},
    {"check \"c\" :: var n = 1; n is 1 end", "check \"c\" :: var n = 1; n is 1 end"},
    {"check :: ok isTrue end", "check :: ok isTrue end"},
    {"case x :: 1 => \"a\"\n_ => \"b\" end", "case x :: 1 => \"a\"; _ => \"b\" end"},
    {"for i, v in xs :: print(v) end", "for i, v in xs :: print(v) end"},
    {"component C(a) :: var b = a\nWindow { title: b, Label { } } end",
     "component C(a) :: var b = a; Window { title: b, Label { } } end"},
    {"\"say \\\"hi\\\"\"", "\"say \\\"hi\\\"\""},
    {"\"n = #{n + 1}\"", "\"n = #{(n + 1)}\""},
    {"var a = 1\nvar b = 2", "var a = 1\nvar b = 2"},
  };

  for (const auto & c : cases) {
    EXPECT_EQ(canonical(c.input), c.expected) << c.input;
  }
}

TEST(AstPrinter, OutputReparsesToTheSameShape)
{
  const std::vector<std::string> programs = {
    "var total = price * (1 + rate) ^ 2",
    "fn Point.dist(o: Point): number ::\n  var dx = self.x - o.x\n  return dx\nend",
    "if ready and not busy ::\n  start()\nelse ::\n  wait(1..10)\nend",
    "component Panel(items) ::\n  var n = items.size()\n  VBox { spacing: 4, Label { text: \"#{n} items\" } }\nend",
    "check \"math\" ::\n  [] isEmpty\n  [1, 2] contains 2\n  \"abc\" startsWith \"a\"\nend",
    "var f = fn(x) :: case x :: 0 => \"zero\"; _ => \"other\" end end",
  };

  for (const auto & src : programs) {
    const std::string once = canonical(src);
    const std::string twice = canonical(once);
    EXPECT_EQ(once, twice) << src;
  }
}

TEST(AstPrinter, SingleNodes)
{
  const auto unit = test_support::parse("fn f(a: Array[number]) :: a end");
  ASSERT_FALSE(unit.has_errors());
  auto * fn = unit.stmt_as<FnStmt>(0);
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(to_source(fn->params[0]), "a: Array[number]");
  EXPECT_EQ(to_source(fn->params[0]->type), "Array[number]");
  EXPECT_EQ(to_source(fn->body), "a");
  EXPECT_EQ(to_source(nullptr), "");
}

}  // namespace seda
