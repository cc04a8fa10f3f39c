// pg_sema/catalog/schema_object.hpp - Tables, views, types and routines
//
// Schema objects are created once per analysis run by ObjectBuilder, owned
// by the Catalog, and linked to each other by the Linker. Dependency edges
// are non-owning pointers into the same Catalog.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pg_sema/ast/ast.hpp"
#include "pg_sema/basic/source_manager.hpp"
#include "pg_sema/catalog/identifier.hpp"

namespace pg_sema
{

// ============================================================================
// Kinds
// ============================================================================

enum class ObjectKind : uint8_t {
  Table,
  View,
  CompositeType,
  EnumType,
  Routine,
};

[[nodiscard]] constexpr std::string_view to_string(ObjectKind k) noexcept
{
  switch (k) {
    case ObjectKind::Table:
      return "table";
    case ObjectKind::View:
      return "view";
    case ObjectKind::CompositeType:
      return "composite type";
    case ObjectKind::EnumType:
      return "enum type";
    case ObjectKind::Routine:
      return "routine";
  }
  return "object";
}

/**
 * Name space an object is declared in. Tables, views and types share one
 * (every relation is also a row type); routines have their own.
 */
enum class ObjectNamespace : uint8_t {
  Relation,
  Routine,
};

[[nodiscard]] constexpr ObjectNamespace namespace_of(ObjectKind k) noexcept
{
  return k == ObjectKind::Routine ? ObjectNamespace::Routine : ObjectNamespace::Relation;
}

// ============================================================================
// Members
// ============================================================================

/// Declared type of a column or parameter.
struct TypeRef
{
  Identifier id;
  int32_t dims = 0;  ///< array dimensions
};

struct ColumnDesc
{
  std::string name;
  TypeRef type;
  bool nullable = true;
  std::vector<Identifier> refs;  ///< foreign-key targets
  SourceRange range;
};

struct RoutineParam
{
  std::string name;  ///< may be empty
  TypeRef type;
  ParamMode mode = ParamMode::In;
  SourceRange range;
};

// ============================================================================
// SchemaObject
// ============================================================================

class SchemaObject
{
public:
  virtual ~SchemaObject() = default;

  SchemaObject(const SchemaObject &) = delete;
  SchemaObject & operator=(const SchemaObject &) = delete;

  [[nodiscard]] ObjectKind get_kind() const noexcept { return kind_; }
  [[nodiscard]] const Identifier & id() const noexcept { return id_; }
  [[nodiscard]] std::string qualified_name() const { return id_.qualified(); }

  /// Range of the declaring statement.
  [[nodiscard]] SourceRange range() const noexcept { return range_; }
  [[nodiscard]] const Stmt * decl() const noexcept { return decl_; }

  /// Objects this one refers to, in link order.
  [[nodiscard]] const std::vector<SchemaObject *> & dependencies() const noexcept
  {
    return dependencies_;
  }

  /// Objects referring to this one. Back-references only.
  [[nodiscard]] const std::vector<SchemaObject *> & dependents() const noexcept
  {
    return dependents_;
  }

  /**
   * Add an edge `this -> dep` and the inverse dependent edge.
   *
   * @return false if the edge already existed or `dep` is this object
   */
  bool add_dependency(SchemaObject * dep);

  [[nodiscard]] bool depends_on(const SchemaObject * other) const noexcept;

  void clear_links() noexcept;

protected:
  SchemaObject(ObjectKind k, Identifier id, SourceRange r, const Stmt * decl)
  : kind_(k), id_(std::move(id)), range_(r), decl_(decl)
  {
  }

private:
  ObjectKind kind_;
  Identifier id_;
  SourceRange range_;
  const Stmt * decl_;
  std::vector<SchemaObject *> dependencies_;
  std::vector<SchemaObject *> dependents_;
};

/// CRTP helper implementing classof() for one ObjectKind.
template <ObjectKind K>
class SchemaObjectBase : public SchemaObject
{
public:
  static constexpr ObjectKind kind = K;

  static bool classof(const SchemaObject * obj) { return obj->get_kind() == K; }

protected:
  SchemaObjectBase(Identifier id, SourceRange r, const Stmt * decl)
  : SchemaObject(K, std::move(id), r, decl)
  {
  }
};

// ============================================================================
// Concrete objects
// ============================================================================

class TableObject : public SchemaObjectBase<ObjectKind::Table>
{
public:
  std::vector<ColumnDesc> columns;
  std::vector<std::string> primary_key;

  TableObject(Identifier id, SourceRange r, const Stmt * decl)
  : SchemaObjectBase(std::move(id), r, decl)
  {
  }

  [[nodiscard]] const ColumnDesc * find_column(std::string_view name) const noexcept;
};

class CompositeTypeObject : public SchemaObjectBase<ObjectKind::CompositeType>
{
public:
  std::vector<ColumnDesc> columns;

  CompositeTypeObject(Identifier id, SourceRange r, const Stmt * decl)
  : SchemaObjectBase(std::move(id), r, decl)
  {
  }
};

class EnumTypeObject : public SchemaObjectBase<ObjectKind::EnumType>
{
public:
  std::vector<std::string> labels;

  EnumTypeObject(Identifier id, SourceRange r, const Stmt * decl)
  : SchemaObjectBase(std::move(id), r, decl)
  {
  }
};

class ViewObject : public SchemaObjectBase<ObjectKind::View>
{
public:
  std::vector<Identifier> refs;          ///< relations and cast target types
  std::vector<Identifier> routine_refs;  ///< called functions
  std::vector<std::string> aliases;      ///< `CREATE VIEW v (a, b)`
  const SelectStmt * query = nullptr;
  bool materialized = false;

  ViewObject(Identifier id, SourceRange r, const Stmt * decl)
  : SchemaObjectBase(std::move(id), r, decl)
  {
  }
};

class RoutineObject : public SchemaObjectBase<ObjectKind::Routine>
{
public:
  std::vector<RoutineParam> params;         ///< IN / INOUT / VARIADIC
  std::vector<ColumnDesc> return_columns;   ///< OUT / INOUT / TABLE columns
  std::optional<TypeRef> return_type;       ///< set when return_columns is empty
  bool return_set = false;
  bool is_procedure = false;
  std::string language;
  gsl::span<Stmt *> body_stmts;  ///< parsed `LANGUAGE sql` body

  RoutineObject(Identifier id, SourceRange r, const Stmt * decl)
  : SchemaObjectBase(std::move(id), r, decl)
  {
  }

  [[nodiscard]] bool returns_columns() const noexcept { return !return_columns.empty(); }
};

}  // namespace pg_sema
