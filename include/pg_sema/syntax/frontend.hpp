// pg_sema/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>

#include "pg_sema/ast/ast.hpp"
#include "pg_sema/ast/ast_context.hpp"
#include "pg_sema/basic/diagnostic.hpp"
#include "pg_sema/basic/source_manager.hpp"

namespace pg_sema
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Script * script = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
//
// The file is registered (or its content replaced) in `sources`. The returned
// Script is never null; malformed statements are dropped after an E0001.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

}  // namespace pg_sema
