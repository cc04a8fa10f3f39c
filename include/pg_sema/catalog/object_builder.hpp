// pg_sema/catalog/object_builder.hpp - Parsed statements -> schema objects
#pragma once

#include <optional>

#include "pg_sema/ast/ast.hpp"
#include "pg_sema/basic/diagnostic.hpp"
#include "pg_sema/catalog/catalog.hpp"
#include "pg_sema/catalog/schema_object.hpp"

namespace pg_sema
{

/**
 * Populates a Catalog from parsed scripts.
 *
 * Statements are processed in source order, the way the database would
 * execute them: `tbl.col%TYPE` resolves against relations declared earlier,
 * and `CREATE EXTENSION` makes extension types known to later statements.
 * Top-level queries and unhandled statements are ignored here.
 */
class ObjectBuilder
{
public:
  ObjectBuilder(Catalog & catalog, DiagnosticBag & diags) : catalog_(catalog), diags_(diags) {}

  /**
   * Add the objects declared by `script`.
   *
   * @return true if no error was reported for this script
   */
  bool build(const Script * script);

  /// Add the object declared by one statement; nullptr for non-declarations.
  SchemaObject * build_statement(const Stmt * stmt);

  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

  /**
   * Resolve a written type name to a TypeRef.
   *
   * Unqualified built-in names map to `pg_catalog`; other unqualified names
   * default to `public`. `%TYPE` references are looked up in the catalog.
   */
  [[nodiscard]] std::optional<TypeRef> resolve_type_name(const TypeName * type);

private:
  SchemaObject * build_table(const CreateTableStmt * stmt);
  SchemaObject * build_composite(const CompositeTypeStmt * stmt);
  SchemaObject * build_enum(const CreateEnumStmt * stmt);
  SchemaObject * build_view(const ViewStmt * stmt);
  SchemaObject * build_routine(const CreateFunctionStmt * stmt);
  void build_extension(const CreateExtensionStmt * stmt);

  std::optional<ColumnDesc> build_column(const ColumnDef * def);
  SchemaObject * commit(std::unique_ptr<SchemaObject> obj);

  Catalog & catalog_;
  DiagnosticBag & diags_;
  size_t error_count_ = 0;
};

/// Identifier named by a RangeVar; an empty schema means `public`.
[[nodiscard]] Identifier to_identifier(const RangeVar * rv);

/**
 * Identifier a type name refers to, without `%TYPE` handling: built-in names
 * map to `pg_catalog` when unqualified.
 */
[[nodiscard]] Identifier type_identifier(const TypeName * type);

}  // namespace pg_sema
