// pg_sema/test_support/sema_helpers.hpp - inference fixtures for unit tests
//
// Builds a catalog from schema text and infers ad-hoc queries against it,
// without running the Linker or the Analyzer.
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pg_sema/catalog/catalog.hpp"
#include "pg_sema/catalog/object_builder.hpp"
#include "pg_sema/sema/metadata.hpp"
#include "pg_sema/sema/query_inferrer.hpp"
#include "pg_sema/sema/scope.hpp"
#include "pg_sema/test_support/parse_helpers.hpp"

namespace pg_sema::test_support
{

struct InferredQuery
{
  TestParseUnit unit;
  DiagnosticBag diags;
  std::optional<std::vector<Field>> fields;

  [[nodiscard]] bool ok() const noexcept { return fields.has_value(); }

  [[nodiscard]] const Field & at(size_t i) const { return fields->at(i); }

  [[nodiscard]] bool has_code(std::string_view code) const
  {
    return diags.has_code(code) || unit.diags.has_code(code);
  }
};

struct SchemaFixture
{
  TestParseUnit schema;
  Catalog catalog;
  DiagnosticBag build_diags;
  std::unique_ptr<JsonTypeContext> json = std::make_unique<JsonTypeContext>();
  std::unique_ptr<CatalogMetadata> metadata;

  /// Output fields of the single SELECT in `sql`.
  [[nodiscard]] std::unique_ptr<InferredQuery> infer(const std::string & sql)
  {
    auto out = std::make_unique<InferredQuery>();
    out->unit = parse(sql, "<query>.sql");
    const auto * sel = dyn_cast<SelectStmt>(out->unit.stmt(0));
    if (!sel) return out;

    Scope scope(*metadata);
    QueryInferrer inferrer(*metadata, *json, out->diags);
    out->fields = inferrer.infer_select(sel, scope);
    return out;
  }

  /// `pg_catalog` or user type name of `type_oid`, with `[]` for arrays.
  [[nodiscard]] std::string type_name(uint32_t type_oid) const
  {
    auto info = metadata->get_type_name(type_oid);
    if (!info) return "?";
    const std::string base =
      info->id.schema == k_system_schema ? info->id.name : info->id.qualified();
    return info->array ? base + "[]" : base;
  }

  template <typename T>
  [[nodiscard]] const T * get(std::string_view name, std::string_view schema = "") const
  {
    return dyn_cast<T>(catalog.resolve(Identifier(schema, name), namespace_of(T::kind)));
  }
};

[[nodiscard]] inline std::unique_ptr<SchemaFixture> build_schema(const std::string & sql)
{
  auto out = std::make_unique<SchemaFixture>();
  out->schema = parse(sql, "<schema>.sql");
  ObjectBuilder builder(out->catalog, out->build_diags);
  (void)builder.build(out->schema.script);
  out->metadata = std::make_unique<CatalogMetadata>(out->catalog, *out->json);
  return out;
}

}  // namespace pg_sema::test_support
