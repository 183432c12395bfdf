// portlang/syntax/frontend.cpp - High-level parse pipeline
#include "portlang/syntax/frontend.hpp"

#include "portlang/syntax/lexer.hpp"
#include "portlang/syntax/parser.hpp"

namespace portlang
{

ParseOutput parse_source(std::string_view source_text, DiagnosticBag & diags)
{
  ParseOutput out;

  auto tokens = syntax::tokenize(source_text, diags);
  out.token_count = tokens.size();

  syntax::Parser parser(std::move(tokens), diags);
  out.document = parser.parse();
  return out;
}

}  // namespace portlang
