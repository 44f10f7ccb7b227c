// Statement grammar: declarations, control flow, tests and error reporting.
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "seda/ast/ast.hpp"
#include "seda/ast/ast_context.hpp"
#include "seda/basic/casting.hpp"
#include "seda/syntax/parser.hpp"
#include "seda/test_support/parse_helpers.hpp"

using seda::dyn_cast;
using seda::isa;
using seda::test_support::parse;

// ============================================================================
// Declarations
// ============================================================================

TEST(ParserStatements, VarAndConst)
{
  const auto unit = parse("var x = 5\nconst a, b: number = 1");
  ASSERT_FALSE(unit.has_errors());
  ASSERT_EQ(unit.size(), 2U);

  auto * x = unit.stmt_as<seda::VarStmt>(0);
  ASSERT_NE(x, nullptr);
  EXPECT_FALSE(x->isConst);
  ASSERT_EQ(x->names.size(), 1U);
  EXPECT_EQ(x->names[0], "x");
  EXPECT_EQ(x->type, nullptr);

  auto * ab = unit.stmt_as<seda::VarStmt>(1);
  ASSERT_NE(ab, nullptr);
  EXPECT_TRUE(ab->isConst);
  ASSERT_EQ(ab->names.size(), 2U);
  EXPECT_EQ(ab->names[1], "b");
  ASSERT_NE(ab->type, nullptr);
  EXPECT_EQ(ab->type->name, "number");
}

TEST(ParserStatements, FunctionDeclaration)
{
  const auto unit = parse("fn add(a: number, b: number): number ::\n  return a + b\nend");
  ASSERT_FALSE(unit.has_errors());
  auto * fn = unit.stmt_as<seda::FnStmt>(0);
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->name, "add");
  EXPECT_FALSE(fn->receiver.has_value());
  ASSERT_EQ(fn->params.size(), 2U);
  ASSERT_NE(fn->returnType, nullptr);
  EXPECT_EQ(fn->returnType->name, "number");
  ASSERT_NE(fn->body, nullptr);
  ASSERT_EQ(fn->body->statements.size(), 1U);

  auto * ret = dyn_cast<seda::ReturnStmt>(fn->body->statements[0]);
  ASSERT_NE(ret, nullptr);
  ASSERT_EQ(ret->values.size(), 1U);
  EXPECT_TRUE(isa<seda::InfixExpr>(ret->values[0]));
}

TEST(ParserStatements, MethodWithReceiver)
{
  const auto unit = parse("fn Point.length() :: 0 end");
  ASSERT_FALSE(unit.has_errors());
  auto * fn = unit.stmt_as<seda::FnStmt>(0);
  ASSERT_NE(fn, nullptr);
  ASSERT_TRUE(fn->receiver.has_value());
  EXPECT_EQ(*fn->receiver, "Point");
  EXPECT_EQ(fn->name, "length");
}

TEST(ParserStatements, AnonymousFunctionIsAnExpression)
{
  const auto anon = parse("fn() :: 1 end");
  ASSERT_FALSE(anon.has_errors());
  ASSERT_EQ(anon.size(), 1U);
  EXPECT_TRUE(isa<seda::FunctionLiteral>(anon.expr()));

  const auto named = parse("fn add() :: 1 end");
  ASSERT_FALSE(named.has_errors());
  EXPECT_NE(named.stmt_as<seda::FnStmt>(0), nullptr);
}

TEST(ParserStatements, WhereBlockAssertions)
{
  const auto unit = parse(
    "fn double(x) ::\n"
    "  x * 2\n"
    "where ::\n"
    "  var n = 2\n"
    "  double(n) is 4\n"
    "  double(0) isNot 1\n"
    "  digits(double(1)) contains 2\n"
    "end");
  ASSERT_FALSE(unit.has_errors()) << unit.messages()[0];
  auto * fn = unit.stmt_as<seda::FnStmt>(0);
  ASSERT_NE(fn, nullptr);
  ASSERT_NE(fn->where, nullptr);
  EXPECT_EQ(fn->where->statements.size(), 1U);
  ASSERT_EQ(fn->where->assertions.size(), 3U);
  EXPECT_EQ(fn->where->assertions[0]->op, seda::AssertionOp::Is);
  EXPECT_EQ(fn->where->assertions[1]->op, seda::AssertionOp::IsNot);
  EXPECT_EQ(fn->where->assertions[2]->op, seda::AssertionOp::Contains);
  EXPECT_EQ(fn->body->statements.size(), 1U);
}

TEST(ParserStatements, StructDeclaration)
{
  const auto unit = parse("struct Point ::\n  x: number,\n  y: number\n  tags: Array[string]\nend");
  ASSERT_FALSE(unit.has_errors());
  auto * s = unit.stmt_as<seda::StructStmt>(0);
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->name, "Point");
  ASSERT_EQ(s->fields.size(), 3U);
  EXPECT_EQ(s->fields[0]->name, "x");
  EXPECT_EQ(s->fields[2]->type->name, "Array");
  ASSERT_EQ(s->fields[2]->type->params.size(), 1U);
  EXPECT_EQ(s->fields[2]->type->params[0]->name, "string");
}

TEST(ParserStatements, TypeAliasWithNestedGenerics)
{
  const auto unit = parse("type Table = Map[string, Array[number]]");
  ASSERT_FALSE(unit.has_errors());
  auto * t = unit.stmt_as<seda::TypeStmt>(0);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->name, "Table");
  ASSERT_NE(t->aliased, nullptr);
  EXPECT_EQ(t->aliased->name, "Map");
  ASSERT_EQ(t->aliased->params.size(), 2U);
  EXPECT_TRUE(t->aliased->params[1]->is_generic());
}

TEST(ParserStatements, ModuleAndUsing)
{
  const auto unit = parse(
    "using \"lib/json.s\" as json\n"
    "using \"math\"\n"
    "module Geometry ::\n"
    "  fn area(w, h) :: w * h end\n"
    "end");
  ASSERT_FALSE(unit.has_errors());
  ASSERT_EQ(unit.size(), 3U);

  auto * first = unit.stmt_as<seda::UsingStmt>(0);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->path, "lib/json.s");
  ASSERT_TRUE(first->alias.has_value());
  EXPECT_EQ(*first->alias, "json");

  auto * second = unit.stmt_as<seda::UsingStmt>(1);
  ASSERT_NE(second, nullptr);
  EXPECT_FALSE(second->alias.has_value());

  auto * mod = unit.stmt_as<seda::ModuleStmt>(2);
  ASSERT_NE(mod, nullptr);
  EXPECT_EQ(mod->name, "Geometry");
  ASSERT_EQ(mod->body->statements.size(), 1U);
  EXPECT_TRUE(isa<seda::FnStmt>(mod->body->statements[0]));
}

TEST(ParserStatements, ComponentWithRootElement)
{
  const auto unit = parse(
    "component Counter(start) ::\n"
    "  var count = start\n"
    "  Window {\n"
    "    title: \"Counter\",\n"
    "    Button { text: \"+\" }\n"
    "  }\n"
    "end");
  ASSERT_FALSE(unit.has_errors());
  auto * c = unit.stmt_as<seda::ComponentStmt>(0);
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->name, "Counter");
  ASSERT_EQ(c->params.size(), 1U);
  ASSERT_EQ(c->body.size(), 1U);
  EXPECT_TRUE(isa<seda::VarStmt>(c->body[0]));
  ASSERT_NE(c->root, nullptr);
  EXPECT_EQ(c->root->typeName, "Window");
  EXPECT_EQ(c->root->children.size(), 1U);
}

TEST(ParserStatements, ComponentWithoutRootElement)
{
  const auto unit = parse("component Empty() :: var x = 1 end");
  ASSERT_EQ(unit.errors().size(), 1U);
  EXPECT_EQ(unit.messages()[0], "line 1, column 32: component 'Empty' has no root UI element");
  EXPECT_EQ(unit.errors()[0].kind, seda::syntax::ParseErrorKind::MissingRootElement);

  auto * c = unit.stmt_as<seda::ComponentStmt>(0);
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->root, nullptr);
  EXPECT_EQ(c->body.size(), 1U);
}

// ============================================================================
// Control flow
// ============================================================================

TEST(ParserStatements, IfElseIfElse)
{
  const auto unit = parse(
    "if a ::\n  1\nelse if b ::\n  2\nelse if c ::\n  3\nelse ::\n  4\nend");
  ASSERT_FALSE(unit.has_errors());
  auto * s = unit.stmt_as<seda::IfStmt>(0);
  ASSERT_NE(s, nullptr);
  ASSERT_NE(s->consequence, nullptr);
  EXPECT_EQ(s->consequence->statements.size(), 1U);
  ASSERT_EQ(s->elseIfs.size(), 2U);
  ASSERT_NE(s->alternative, nullptr);
  EXPECT_EQ(s->alternative->statements.size(), 1U);
}

TEST(ParserStatements, NestedIfInsideFor)
{
  const auto unit = parse(
    "for i, item in items ::\n"
    "  if item == nil :: break end\n"
    "  print(i)\n"
    "end");
  ASSERT_FALSE(unit.has_errors());
  auto * loop = unit.stmt_as<seda::ForStmt>(0);
  ASSERT_NE(loop, nullptr);
  ASSERT_TRUE(loop->indexName.has_value());
  EXPECT_EQ(*loop->indexName, "i");
  EXPECT_EQ(loop->valueName, "item");
  ASSERT_EQ(loop->body->statements.size(), 2U);

  auto * inner = dyn_cast<seda::IfStmt>(loop->body->statements[0]);
  ASSERT_NE(inner, nullptr);
  ASSERT_EQ(inner->consequence->statements.size(), 1U);
  EXPECT_TRUE(isa<seda::BreakStmt>(inner->consequence->statements[0]));
}

TEST(ParserStatements, ForOverRange)
{
  const auto unit = parse("for x in 1..10 :: print(x) end");
  ASSERT_FALSE(unit.has_errors());
  auto * loop = unit.stmt_as<seda::ForStmt>(0);
  ASSERT_NE(loop, nullptr);
  EXPECT_FALSE(loop->indexName.has_value());
  EXPECT_TRUE(isa<seda::RangeExpr>(loop->iterable));
}

TEST(ParserStatements, CaseStatement)
{
  const auto unit = parse("case n ::\n  1 => \"one\"\n  _ => \"many\"\nend");
  ASSERT_FALSE(unit.has_errors());
  auto * s = unit.stmt_as<seda::CaseStmt>(0);
  ASSERT_NE(s, nullptr);
  ASSERT_EQ(s->branches.size(), 2U);
  EXPECT_TRUE(s->branches[1]->is_wildcard());
}

TEST(ParserStatements, ReturnForms)
{
  const auto unit = parse("fn f() :: return end\nfn g() :: return 1, 2 end");
  ASSERT_FALSE(unit.has_errors());

  auto * f = unit.stmt_as<seda::FnStmt>(0);
  ASSERT_NE(f, nullptr);
  auto * bare = dyn_cast<seda::ReturnStmt>(f->body->statements[0]);
  ASSERT_NE(bare, nullptr);
  EXPECT_TRUE(bare->values.empty());

  auto * g = unit.stmt_as<seda::FnStmt>(1);
  ASSERT_NE(g, nullptr);
  auto * pair = dyn_cast<seda::ReturnStmt>(g->body->statements[0]);
  ASSERT_NE(pair, nullptr);
  EXPECT_EQ(pair->values.size(), 2U);
}

TEST(ParserStatements, CheckWithUnaryAssertions)
{
  const auto unit = parse(
    "check \"flags\" ::\n"
    "  var ok = true\n"
    "  ok isTrue\n"
    "  [] isEmpty\n"
    "  name startsWith \"A\"\n"
    "end");
  ASSERT_FALSE(unit.has_errors());
  auto * check = unit.stmt_as<seda::CheckStmt>(0);
  ASSERT_NE(check, nullptr);
  ASSERT_TRUE(check->label.has_value());
  EXPECT_EQ(*check->label, "flags");
  EXPECT_EQ(check->statements.size(), 1U);
  ASSERT_EQ(check->assertions.size(), 3U);
  EXPECT_EQ(check->assertions[0]->op, seda::AssertionOp::IsTrue);
  EXPECT_EQ(check->assertions[0]->rhs, nullptr);
  EXPECT_EQ(check->assertions[1]->op, seda::AssertionOp::IsEmpty);
  EXPECT_EQ(check->assertions[2]->op, seda::AssertionOp::StartsWith);
  EXPECT_NE(check->assertions[2]->rhs, nullptr);
}

TEST(ParserStatements, CheckWithoutLabel)
{
  const auto unit = parse("check :: 1 + 1 is 2 end");
  ASSERT_FALSE(unit.has_errors());
  auto * check = unit.stmt_as<seda::CheckStmt>(0);
  ASSERT_NE(check, nullptr);
  EXPECT_FALSE(check->label.has_value());
  ASSERT_EQ(check->assertions.size(), 1U);
  EXPECT_TRUE(isa<seda::InfixExpr>(check->assertions[0]->lhs));
}

TEST(ParserStatements, CommentsAndSemicolonsAreSkipped)
{
  const auto unit = parse(
    "# leading comment\n"
    "var a = 1; var b = 2 # trailing\n"
    "#| block\n   comment |#\n"
    "a + b;");
  ASSERT_FALSE(unit.has_errors());
  ASSERT_EQ(unit.size(), 3U);
  EXPECT_TRUE(isa<seda::ExprStmt>(unit.stmt(2)));
}

TEST(ParserStatements, StrayTerminatorsProduceNoNode)
{
  const auto unit = parse("end\nvar x = 1");
  ASSERT_FALSE(unit.has_errors());
  ASSERT_EQ(unit.size(), 1U);
  EXPECT_TRUE(isa<seda::VarStmt>(unit.stmt(0)));
}

// ============================================================================
// Errors
// ============================================================================

TEST(ParserStatements, VarWithoutInitializer)
{
  const auto unit = parse("var x");
  ASSERT_NE(unit.program, nullptr);
  ASSERT_EQ(unit.errors().size(), 1U);
  EXPECT_EQ(unit.messages()[0], "line 1, column 6: expected =, got EOF");
  EXPECT_EQ(unit.size(), 0U);

  const auto & err = unit.errors()[0];
  EXPECT_EQ(err.kind, seda::syntax::ParseErrorKind::UnexpectedToken);
  ASSERT_EQ(err.expected.size(), 1U);
  EXPECT_EQ(err.expected[0], seda::syntax::TokenKind::Assign);
  EXPECT_EQ(err.actual, seda::syntax::TokenKind::Eof);
}

TEST(ParserStatements, ReservedWordAsName)
{
  const auto unit = parse("var if = 1");
  ASSERT_FALSE(unit.errors().empty());
  EXPECT_EQ(
    unit.messages()[0], "line 1, column 5: 'if' is a reserved word (in variable declaration)");
  EXPECT_EQ(unit.errors()[0].kind, seda::syntax::ParseErrorKind::ReservedWord);
}

TEST(ParserStatements, ReservedWordAsParameter)
{
  const auto unit = parse("fn f(end) :: 1 end");
  ASSERT_FALSE(unit.errors().empty());
  EXPECT_EQ(unit.messages()[0], "line 1, column 6: 'end' is a reserved word (in parameter name)");
}

TEST(ParserStatements, MissingDeclaredName)
{
  const auto unit = parse("struct 1 :: end");
  ASSERT_FALSE(unit.errors().empty());
  EXPECT_EQ(unit.messages()[0], "line 1, column 8: expected IDENT, got NUMBER");
}

TEST(ParserStatements, BadTypeAnnotation)
{
  const auto unit = parse("var x: 5 = 1");
  ASSERT_FALSE(unit.errors().empty());
  EXPECT_EQ(
    unit.messages()[0], "line 1, column 8: expected IDENT, number, string or boolean, got NUMBER");
}

TEST(ParserStatements, EveryBlockReportsMissingEnd)
{
  const std::vector<std::string> inputs = {
    "fn f() :: 1",
    "if x :: 1",
    "if x :: 1 else :: 2",
    "for x in xs :: 1",
    "module M :: 1",
    "struct S :: a: number",
    "check :: 1 is 1",
    "case x :: 1 => 2",
    "component C() :: Window { }",
    "var f = fn() :: 1",
  };

  for (const auto & src : inputs) {
    const auto unit = parse(src);
    ASSERT_NE(unit.program, nullptr) << src;
    ASSERT_EQ(unit.errors().size(), 1U) << src;
    EXPECT_EQ(unit.errors()[0].message, "expected 'end' keyword, got EOF") << src;
    EXPECT_EQ(unit.errors()[0].kind, seda::syntax::ParseErrorKind::UnterminatedBlock) << src;
  }
}

TEST(ParserStatements, ErrorsAccumulateUntilCleared)
{
  seda::AstContext ctx;
  seda::syntax::Parser parser(ctx, std::string_view("var x\n(1 +"));

  (void)parser.parse_program();
  const auto first = parser.error_messages();
  ASSERT_EQ(first.size(), 2U);

  (void)parser.parse_program();
  EXPECT_EQ(parser.errors().size(), 4U);

  parser.clear_errors();
  (void)parser.parse_program();
  EXPECT_EQ(parser.error_messages(), first);

  parser.clear_errors();
  (void)parser.parse_program();
  EXPECT_EQ(parser.error_messages(), first);
}

TEST(ParserStatements, FormatErrorsNumbersEachLine)
{
  seda::AstContext ctx;
  seda::syntax::Parser parser(ctx, std::string_view("var x\nvar y"));
  seda::Program * program = parser.parse_program();
  ASSERT_NE(program, nullptr);

  const auto lines = parser.format_errors();
  ASSERT_EQ(lines.size(), 2U);
  EXPECT_EQ(lines[0], "  1. line 2, column 1: expected =, got var");
  EXPECT_EQ(lines[1], "  2. line 2, column 6: expected =, got EOF");
}
