// pg_sema/linker/linker.hpp - Dependency graph construction
#pragma once

#include <vector>

#include "pg_sema/basic/diagnostic.hpp"
#include "pg_sema/catalog/catalog.hpp"
#include "pg_sema/catalog/schema_object.hpp"

namespace pg_sema
{

struct LinkResult
{
  /// Every non-cyclic object, dependencies first.
  std::vector<SchemaObject *> order;

  /// Each detected cycle, members in dependency order.
  std::vector<std::vector<SchemaObject *>> cycles;

  [[nodiscard]] bool in_cycle(const SchemaObject * obj) const;
};

/**
 * Links every object of a Catalog to the catalog objects it references and
 * computes the execution order.
 *
 * References to objects outside the catalog (built-in types, functions of
 * other schemas) are left unlinked. Each cycle is reported once as E0102;
 * a type with a column of its own type is a cycle of one.
 */
class Linker
{
public:
  Linker(Catalog & catalog, DiagnosticBag & diags) : catalog_(catalog), diags_(diags) {}

  LinkResult link();

  /// Catalog objects sorted by (schema, name), routines after relations on ties.
  [[nodiscard]] std::vector<SchemaObject *> sorted_objects() const;

private:
  void link_object(SchemaObject * obj);
  /// Link `obj` to the catalog type `id` names; returns it, or nullptr if none.
  SchemaObject * link_type(SchemaObject * obj, const Identifier & id);
  void report_cycle(const std::vector<SchemaObject *> & cycle);

  Catalog & catalog_;
  DiagnosticBag & diags_;
  /// Objects with a column of their own row type, in link order
  std::vector<SchemaObject *> self_cycles_;
};

}  // namespace pg_sema
