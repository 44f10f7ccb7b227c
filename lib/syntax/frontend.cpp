// seda/syntax/frontend.cpp - High-level parse pipeline
#include "seda/syntax/frontend.hpp"

#include <utility>

#include "seda/syntax/lexer.hpp"

namespace seda
{

namespace
{

std::unique_ptr<ParsedUnit> run_pipeline(
  std::unique_ptr<ParsedUnit> unit, syntax::ParserOptions options)
{
  syntax::Lexer lexer(unit->source.get_source());
  syntax::Parser parser(unit->ast, lexer.lex_all(), options);

  unit->program = parser.parse_program();
  unit->errors = parser.errors();
  syntax::report_parse_errors(unit->errors, unit->diags);
  return unit;
}

}  // namespace

std::unique_ptr<ParsedUnit> parse_source(
  const std::filesystem::path & path, std::string source_text, syntax::ParserOptions options)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceManager(path, std::move(source_text));
  return run_pipeline(std::move(unit), options);
}

std::unique_ptr<ParsedUnit> parse_source(std::string source_text, syntax::ParserOptions options)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceManager(std::move(source_text));
  return run_pipeline(std::move(unit), options);
}

}  // namespace seda
