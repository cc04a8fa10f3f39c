// pg_sema/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-file parsing pipeline for tests. Ownership stays explicit
// (SourceRegistry + AstContext) behind a small wrapper.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "pg_sema/ast/ast_context.hpp"
#include "pg_sema/basic/diagnostic.hpp"
#include "pg_sema/basic/source_manager.hpp"
#include "pg_sema/syntax/frontend.hpp"

namespace pg_sema::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Script * script = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] Stmt * stmt(size_t i) const
  {
    return i < script->statements.size() ? script->statements[i] : nullptr;
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.sql")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.script = parsed.script;
  return out;
}

/// First target expression of the single SELECT in `src`.
[[nodiscard]] inline Expr * first_target(const TestParseUnit & unit)
{
  auto * sel = dyn_cast<SelectStmt>(unit.stmt(0));
  if (sel == nullptr || sel->target_list.empty()) return nullptr;
  return sel->target_list[0]->val;
}

}  // namespace pg_sema::test_support
