// portlang/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <optional>
#include <string_view>

#include "portlang/ast/document.hpp"
#include "portlang/basic/diagnostic.hpp"

namespace portlang
{

struct ParseOutput
{
  size_t token_count = 0;  // including the Eof token
  std::optional<PortfolioDocument> document;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (document) -> diagnostics
[[nodiscard]] ParseOutput parse_source(std::string_view source_text, DiagnosticBag & diags);

}  // namespace portlang
