// pg_sema/syntax/frontend.cpp - High-level parse pipeline
#include "pg_sema/syntax/frontend.hpp"

#include "pg_sema/syntax/lexer.hpp"
#include "pg_sema/syntax/parser.hpp"

namespace pg_sema
{

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;

  if (auto existing = sources.find_by_path(path)) {
    out.file_id = *existing;
    sources.update_content(out.file_id, std::move(source_text));
  } else {
    out.file_id = sources.register_file(path, std::move(source_text));
  }

  const SourceFile * file = sources.get_file(out.file_id);
  if (file == nullptr) {
    diags.report_error({}, "failed to register source file `" + path.string() + "`");
    out.script = ast.create<Script>();
    return out;
  }

  syntax::Lexer lexer(out.file_id, file->content());
  syntax::Parser parser(ast, out.file_id, *file, diags, lexer.lex_all());
  out.script = parser.parse_script();
  return out;
}

}  // namespace pg_sema
