// Error recovery: lookahead on `::`, block-level resynchronization and the
// low-level skipping routines.
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "seda/ast/ast.hpp"
#include "seda/ast/ast_context.hpp"
#include "seda/basic/casting.hpp"
#include "seda/syntax/lexer.hpp"
#include "seda/syntax/parser.hpp"
#include "seda/test_support/parse_helpers.hpp"

using seda::dyn_cast;
using seda::isa;
using seda::syntax::ParseErrorKind;
using seda::syntax::Parser;
using seda::syntax::ParserOptions;
using seda::syntax::TokenKind;
using seda::test_support::parse;

namespace
{

ParserOptions recovering()
{
  ParserOptions options;
  options.recover_in_blocks = true;
  return options;
}

}  // namespace

// ============================================================================
// Lookahead on `::`
// ============================================================================

TEST(ParserRecovery, StrayTokenBeforeDoubleColon)
{
  const auto unit = parse("if x y :: 1 end");
  ASSERT_EQ(unit.errors().size(), 1U);
  EXPECT_EQ(unit.messages()[0], "line 1, column 6: expected ::, got IDENT");

  auto * s = unit.stmt_as<seda::IfStmt>(0);
  ASSERT_NE(s, nullptr);
  ASSERT_NE(s->consequence, nullptr);
  EXPECT_EQ(s->consequence->statements.size(), 1U);
}

TEST(ParserRecovery, DoubleColonTooFarAway)
{
  const auto unit = parse("module M a b c d e :: end");
  ASSERT_FALSE(unit.errors().empty());
  EXPECT_EQ(unit.messages()[0], "line 1, column 10: expected ::, got IDENT");
  EXPECT_EQ(unit.stmt_as<seda::ModuleStmt>(0), nullptr);
}

TEST(ParserRecovery, ExpectPeekWithRecoveryOnParser)
{
  seda::AstContext ctx;
  Parser parser(ctx, std::string_view("a b c :: d"));

  EXPECT_TRUE(parser.expect_peek_with_recovery(TokenKind::DoubleColon));
  EXPECT_EQ(parser.current_token().kind, TokenKind::DoubleColon);
  EXPECT_EQ(parser.peek_token().text, "d");
  ASSERT_EQ(parser.errors().size(), 1U);
  EXPECT_EQ(parser.errors()[0].actual, TokenKind::Ident);
}

TEST(ParserRecovery, DoubleColonSearchStopsAtEnd)
{
  const auto unit = parse("if a :: 1 else 2 end if b :: end");
  ASSERT_EQ(unit.errors().size(), 1U);
  EXPECT_EQ(unit.messages()[0], "line 1, column 16: expected ::, got NUMBER");

  ASSERT_GE(unit.size(), 1U);
  auto * last = unit.stmt_as<seda::IfStmt>(unit.size() - 1);
  ASSERT_NE(last, nullptr);
  auto * cond = dyn_cast<seda::Identifier>(last->condition);
  ASSERT_NE(cond, nullptr);
  EXPECT_EQ(cond->name, "b");
}

TEST(ParserRecovery, ExpectPeekWithRecoveryStopsAtStatementKeyword)
{
  seda::AstContext ctx;
  Parser parser(ctx, std::string_view("a var b :: c"));

  EXPECT_FALSE(parser.expect_peek_with_recovery(TokenKind::DoubleColon));
  EXPECT_EQ(parser.current_token().text, "a");
  EXPECT_EQ(parser.peek_token().kind, TokenKind::Var);
  ASSERT_EQ(parser.errors().size(), 1U);
  EXPECT_EQ(parser.errors()[0].actual, TokenKind::Var);
}

TEST(ParserRecovery, ExpectPeekWithRecoveryHit)
{
  seda::AstContext ctx;
  Parser parser(ctx, std::string_view("a :: b"));

  EXPECT_TRUE(parser.expect_peek_with_recovery(TokenKind::DoubleColon));
  EXPECT_EQ(parser.current_token().kind, TokenKind::DoubleColon);
  EXPECT_FALSE(parser.has_errors());
}

// ============================================================================
// Block recovery
// ============================================================================

TEST(ParserRecovery, BadStatementInsideFunctionBody)
{
  const std::string src = "fn f() :: var = 1; var y = 2 end";

  const auto with_recovery = parse(src, recovering());
  ASSERT_EQ(with_recovery.errors().size(), 1U);
  EXPECT_EQ(with_recovery.messages()[0], "line 1, column 15: expected IDENT, got =");
  auto * fn = with_recovery.stmt_as<seda::FnStmt>(0);
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->body->statements.size(), 1U);
  EXPECT_TRUE(isa<seda::VarStmt>(fn->body->statements[0]));

  const auto without = parse(src);
  EXPECT_EQ(without.errors().size(), 2U);
  auto * fn2 = without.stmt_as<seda::FnStmt>(0);
  ASSERT_NE(fn2, nullptr);
  EXPECT_EQ(fn2->body->statements.size(), 2U);
}

TEST(ParserRecovery, BrokenNestedBlockIsSkippedWhole)
{
  const auto unit = parse("module M :: if :: 1 end; var ok = 1 end", recovering());
  ASSERT_EQ(unit.errors().size(), 1U);
  EXPECT_EQ(unit.errors()[0].kind, ParseErrorKind::NoPrefixParser);

  auto * mod = unit.stmt_as<seda::ModuleStmt>(0);
  ASSERT_NE(mod, nullptr);
  ASSERT_EQ(mod->body->statements.size(), 1U);
  auto * var = dyn_cast<seda::VarStmt>(mod->body->statements[0]);
  ASSERT_NE(var, nullptr);
  EXPECT_EQ(var->names[0], "ok");
}

TEST(ParserRecovery, RecoveryReachesLaterTopLevelStatements)
{
  const auto unit = parse(
    "fn broken() ::\n"
    "  var = 1\n"
    "  var good = 2\n"
    "end\n"
    "var after = 3",
    recovering());
  ASSERT_EQ(unit.errors().size(), 1U);
  ASSERT_EQ(unit.size(), 2U);
  EXPECT_NE(unit.stmt_as<seda::FnStmt>(0), nullptr);
  EXPECT_NE(unit.stmt_as<seda::VarStmt>(1), nullptr);
}

TEST(ParserRecovery, ElseIfInsideSkippedBlockKeepsFollowingStatements)
{
  const auto unit = parse(
    "fn f() ::\n"
    "  if ) :: 1 else if b :: 2 end\n"
    "  var ok = 1\n"
    "end\n"
    "var after = 3\n",
    recovering());
  ASSERT_EQ(unit.errors().size(), 1U);
  EXPECT_EQ(unit.errors()[0].kind, ParseErrorKind::NoPrefixParser);
  EXPECT_EQ(unit.messages()[0], "line 2, column 6: no prefix parse function for ) found");

  ASSERT_EQ(unit.size(), 2U);
  auto * fn = unit.stmt_as<seda::FnStmt>(0);
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->body->statements.size(), 1U);
  auto * ok = dyn_cast<seda::VarStmt>(fn->body->statements[0]);
  ASSERT_NE(ok, nullptr);
  EXPECT_EQ(ok->names[0], "ok");

  auto * after = unit.stmt_as<seda::VarStmt>(1);
  ASSERT_NE(after, nullptr);
  EXPECT_EQ(after->names[0], "after");
}

TEST(ParserRecovery, FaultBecomesErrorAndParsingContinues)
{
  const std::string src = "var a = 1\nvar b = x + 1\nvar c = 3";
  std::vector<seda::syntax::Token> tokens = seda::syntax::Lexer(src).lex_all();
  for (auto & tok : tokens) {
    if (tok.text == "x") {
      tok.kind = static_cast<TokenKind>(200);
    }
  }

  seda::AstContext ctx;
  Parser parser(ctx, std::move(tokens));
  seda::Program * program = parser.parse_program();
  ASSERT_NE(program, nullptr);

  ASSERT_EQ(parser.errors().size(), 1U);
  EXPECT_EQ(parser.errors()[0].kind, ParseErrorKind::InternalFault);
  EXPECT_EQ(
    parser.errors()[0].to_string(),
    "line 2, column 9: internal fault during parsing: token kind 200 is outside the token table");

  ASSERT_EQ(program->statements.size(), 2U);
  auto * a = dyn_cast<seda::VarStmt>(program->statements[0]);
  auto * c = dyn_cast<seda::VarStmt>(program->statements[1]);
  ASSERT_NE(a, nullptr);
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(a->names[0], "a");
  EXPECT_EQ(c->names[0], "c");
}

TEST(ParserRecovery, UnterminatedRecoveringBlock)
{
  const auto unit = parse("module M :: var x = 1", recovering());
  ASSERT_EQ(unit.errors().size(), 1U);
  EXPECT_EQ(unit.errors()[0].kind, ParseErrorKind::UnterminatedBlock);
}

// ============================================================================
// Skipping routines
// ============================================================================

TEST(ParserRecovery, SynchronizeStopsBeforeStatementKeyword)
{
  seda::AstContext ctx;
  Parser parser(ctx, std::string_view("1 2 3 var x = 1"));
  parser.synchronize();
  EXPECT_EQ(parser.current_token().text, "3");
  EXPECT_EQ(parser.peek_token().kind, TokenKind::Var);
}

TEST(ParserRecovery, SynchronizeStopsAtEnd)
{
  seda::AstContext ctx;
  Parser parser(ctx, std::string_view("a b end c"));
  parser.synchronize();
  EXPECT_EQ(parser.current_token().kind, TokenKind::End);
}

TEST(ParserRecovery, SkipToEndHonoursNesting)
{
  seda::AstContext ctx;
  Parser parser(ctx, std::string_view("a if b end end c"));
  parser.skip_to_end();
  EXPECT_EQ(parser.current_token().kind, TokenKind::End);
  EXPECT_EQ(parser.peek_token().text, "c");
}

TEST(ParserRecovery, SkipToEndTreatsElseIfAsOneBlock)
{
  seda::AstContext ctx;
  Parser parser(ctx, std::string_view("x else if b end c"));
  parser.skip_to_end();
  EXPECT_EQ(parser.current_token().kind, TokenKind::End);
  EXPECT_EQ(parser.peek_token().text, "c");
}

TEST(ParserRecovery, SkipToNextStatement)
{
  seda::AstContext ctx;
  Parser parser(ctx, std::string_view("a b var c"));
  parser.skip_to_next_statement();
  EXPECT_EQ(parser.current_token().kind, TokenKind::Var);
}

TEST(ParserRecovery, ValidateIdentifier)
{
  seda::AstContext ctx;
  Parser parser(ctx, std::string_view("x"));

  EXPECT_TRUE(parser.validate_identifier("count", "parameter name"));
  EXPECT_FALSE(parser.has_errors());

  EXPECT_FALSE(parser.validate_identifier("end", "parameter name"));
  EXPECT_FALSE(parser.validate_identifier("", "struct name"));
  const auto messages = parser.error_messages();
  ASSERT_EQ(messages.size(), 2U);
  EXPECT_EQ(messages[0], "line 1, column 1: 'end' is a reserved word (in parameter name)");
  EXPECT_EQ(messages[1], "line 1, column 1: empty identifier (in struct name)");
}

// ============================================================================
// Depth limit
// ============================================================================

TEST(ParserRecovery, DepthLimitReportsOnce)
{
  ParserOptions options;
  options.max_depth = 10;
  const auto unit = parse("((((((((((((1)))))))))))) + ((((((((((((2))))))))))))", options);
  ASSERT_NE(unit.program, nullptr);
  ASSERT_EQ(unit.errors().size(), 1U);
  EXPECT_EQ(unit.errors()[0].kind, ParseErrorKind::DepthExceeded);
  EXPECT_EQ(unit.errors()[0].message, "maximum nesting depth exceeded (10)");
}

TEST(ParserRecovery, DepthLimitAppliesToBlocks)
{
  ParserOptions options;
  options.max_depth = 4;
  const auto unit = parse(
    "if a :: if b :: if c :: if d :: 1 end end end end\nvar later = 1", options);
  ASSERT_NE(unit.program, nullptr);
  ASSERT_EQ(unit.errors().size(), 1U);
  EXPECT_EQ(unit.errors()[0].kind, ParseErrorKind::DepthExceeded);
}

TEST(ParserRecovery, DefaultDepthAcceptsOrdinaryNesting)
{
  std::string src;
  for (int i = 0; i < 50; ++i) {
    src += "[";
  }
  src += "1";
  for (int i = 0; i < 50; ++i) {
    src += "]";
  }
  const auto unit = parse(src);
  EXPECT_FALSE(unit.has_errors());
  EXPECT_TRUE(isa<seda::ArrayLiteral>(unit.expr()));
}
