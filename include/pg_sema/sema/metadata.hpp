// pg_sema/sema/metadata.hpp - Relation, type and function metadata lookups
#pragma once

#include <cstdint>
#include <gsl/span>
#include <map>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "pg_sema/catalog/catalog.hpp"
#include "pg_sema/catalog/identifier.hpp"
#include "pg_sema/sema/builtin_functions.hpp"
#include "pg_sema/sema/field.hpp"
#include "pg_sema/sema/json_type.hpp"

namespace pg_sema
{

/// Name of a type OID. `array` is set when the OID is the array type of `id`.
struct TypeInfo
{
  Identifier id;
  bool array = false;
};

/// Result of calling a function with given argument types.
struct FunctionResult
{
  uint32_t type_oid = 0;  ///< array OID when dims > 0
  int32_t dims = 0;
  NullRule null_rule = NullRule::Strict;
  bool aggregate = false;
  bool returns_set = false;
  std::vector<Field> columns;            ///< routines returning a column list
  const JsonType * json_type = nullptr;  ///< known shape of a json/jsonb result
};

// ============================================================================
// MetadataResolver
// ============================================================================

/**
 * Source of schema metadata for inference.
 *
 * The interface is what a live-database implementation would answer with
 * catalog queries; CatalogMetadata answers from the parsed catalog alone.
 */
class MetadataResolver
{
public:
  virtual ~MetadataResolver() = default;

  /// Columns of a table, view or composite type; nullptr if not found.
  virtual const RelationBinding * resolve_relation(const Identifier & id) = 0;

  virtual std::optional<TypeInfo> get_type_name(uint32_t type_oid) = 0;

  /// OID of type `id`, or of its array type when `array` is set.
  virtual std::optional<uint32_t> get_type_oid(const Identifier & id, bool array) = 0;

  /**
   * Result of calling `schema.name(args)`. An empty schema searches the
   * catalog's routines first, then the built-in functions.
   */
  virtual std::optional<FunctionResult> get_function_result(
    std::string_view schema, std::string_view name, gsl::span<const Field> args) = 0;
};

// ============================================================================
// CatalogMetadata
// ============================================================================

/**
 * MetadataResolver over a Catalog without a database connection.
 *
 * Built-in types keep their real OIDs. User-defined types (relations,
 * composite and enum types, then extension types) get synthetic OIDs from
 * 16384 upward in catalog order, each type followed by its array type.
 *
 * View bindings come from committed analysis results, or are inferred on
 * demand and memoised.
 */
class CatalogMetadata : public MetadataResolver
{
public:
  CatalogMetadata(const Catalog & catalog, JsonTypeContext & json);

  const RelationBinding * resolve_relation(const Identifier & id) override;
  std::optional<TypeInfo> get_type_name(uint32_t type_oid) override;
  std::optional<uint32_t> get_type_oid(const Identifier & id, bool array) override;
  std::optional<FunctionResult> get_function_result(
    std::string_view schema, std::string_view name, gsl::span<const Field> args) override;

  // ===========================================================================
  // Analysis results
  // ===========================================================================

  /// Record the inferred fields of a view or routine.
  void commit_fields(const SchemaObject * obj, std::vector<Field> fields);

  /// Make `obj` unavailable to every later lookup.
  void mark_failed(const SchemaObject * obj);

  [[nodiscard]] bool is_failed(const SchemaObject * obj) const
  {
    return failed_.count(obj) > 0;
  }

  [[nodiscard]] const std::vector<Field> * committed_fields(const SchemaObject * obj) const;

  /// Field for a declared column (type OID resolved, no shape).
  [[nodiscard]] Field column_field(const ColumnDesc & column);

  /// OID of a user-defined type (relation, composite, enum); 0 if none.
  [[nodiscard]] uint32_t type_oid_of(const SchemaObject * obj) const;

  [[nodiscard]] const Catalog & catalog() const noexcept { return catalog_; }
  [[nodiscard]] JsonTypeContext & json() noexcept { return json_; }

private:
  struct TypeOids
  {
    uint32_t oid = 0;
    uint32_t array_oid = 0;
  };

  void assign_type_oids();
  void add_user_type(const Identifier & id, const SchemaObject * obj);
  const RelationBinding * bind_relation(const SchemaObject * obj);
  std::optional<FunctionResult> routine_result(const RoutineObject * routine);
  std::optional<FunctionResult> builtin_result(
    const BuiltinFunction & fn, gsl::span<const Field> args);
  std::optional<uint32_t> builtin_oid(std::string_view name, bool array);

  const Catalog & catalog_;
  JsonTypeContext & json_;

  std::map<Identifier, TypeOids> user_types_;
  std::unordered_map<uint32_t, TypeInfo> user_types_by_oid_;
  std::unordered_map<const SchemaObject *, TypeOids> object_oids_;

  std::unordered_map<const SchemaObject *, RelationBinding> relations_;
  std::unordered_map<const SchemaObject *, std::vector<Field>> committed_;
  std::unordered_set<const SchemaObject *> failed_;
  std::unordered_set<const SchemaObject *> in_progress_;
};

}  // namespace pg_sema
