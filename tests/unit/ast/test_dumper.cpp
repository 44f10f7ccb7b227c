// test_dumper.cpp - Tree dump format
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "seda/ast/ast_dumper.hpp"
#include "seda/test_support/parse_helpers.hpp"

namespace seda
{

namespace
{

std::string dump_source(const std::string & src)
{
  const auto unit = test_support::parse(src);
  EXPECT_FALSE(unit.has_errors());
  return dump_to_string(unit.program);
}

}  // namespace

TEST(AstDumper, VarWithInfix)
{
  EXPECT_EQ(
    dump_source("var total = 1 + x"),
    "Program\n"
    "`-VarStmt var names='total'\n"
    "  `-InfixExpr op='+'\n"
    "    |-NumberLiteral 1\n"
    "    `-Identifier name='x'\n");
}

TEST(AstDumper, SiblingsKeepTheirRails)
{
  EXPECT_EQ(
    dump_source("if a :: b end\nconst c = \"s\""),
    "Program\n"
    "|-IfStmt\n"
    "| |-Identifier name='a'\n"
    "| `-BlockStmt\n"
    "|   `-ExprStmt\n"
    "|     `-Identifier name='b'\n"
    "`-VarStmt const names='c'\n"
    "  `-StringLiteral \"s\"\n");
}

TEST(AstDumper, FunctionParametersAndBody)
{
  EXPECT_EQ(
    dump_source("fn f(a: number) :: a end"),
    "Program\n"
    "`-FnStmt name='f'\n"
    "  |-Parameter name='a'\n"
    "  | `-TypeAnnotation name='number'\n"
    "  `-BlockStmt\n"
    "    `-ExprStmt\n"
    "      `-Identifier name='a'\n");
}

TEST(AstDumper, FlagsAndOptionalProps)
{
  EXPECT_EQ(
    dump_source("for i, v in 0...n :: break end"),
    "Program\n"
    "`-ForStmt index='i' value='v'\n"
    "  |-RangeExpr inclusive\n"
    "  | |-NumberLiteral 0\n"
    "  | `-Identifier name='n'\n"
    "  `-BlockStmt\n"
    "    `-BreakStmt\n");
}

TEST(AstDumper, SubtreeStartsFlushLeft)
{
  const auto unit = test_support::parse("f(x, 2)");
  ASSERT_FALSE(unit.has_errors());
  EXPECT_EQ(
    dump_to_string(unit.expr()),
    "CallExpr\n"
    "|-Identifier name='f'\n"
    "|-Identifier name='x'\n"
    "`-NumberLiteral 2\n");
}

TEST(AstDumper, WritesToStream)
{
  const auto unit = test_support::parse("nil");
  std::ostringstream os;
  dump(unit.program, os);
  EXPECT_EQ(os.str(), "Program\n`-ExprStmt\n  `-NilLiteral\n");
}

TEST(AstDumper, NullNodePrintsNothing) { EXPECT_EQ(dump_to_string(nullptr), ""); }

}  // namespace seda
